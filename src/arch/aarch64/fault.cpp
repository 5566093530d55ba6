//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/arch/aarch64/fault.cpp
// Purpose: Rendering of exception register frames.
// Key invariants: Output never depends on anything but the frame and the
//                 instruction word at ELR.
// Ownership/Lifetime: Holds the registered fault sink pointer (not owned).
// Links: include/elfboot/arch.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/arch.hpp"

namespace elfboot::arch
{

namespace
{

constexpr const char *kRegNames[REG_COUNT] = {
    "x0 ", "x1 ", "x2 ", "x3 ", "x4 ", "x5 ", "x6 ", "x7 ", "x8 ", "x9 ", "x10", "x11",
    "x12", "x13", "x14", "x15", "x16", "x17", "x18", "x19", "x20", "x21", "x22", "x23",
    "x24", "x25", "x26", "x27", "x28", "x29", "x30", "esr", "elr", "spsr", "xzr",
};

serial::Sink *g_fault_sink = nullptr;

} // namespace

const char *reg_name(u32 index)
{
    return index < REG_COUNT ? kRegNames[index] : "???";
}

u64 reg_value(const Regs &regs, u32 index)
{
    if (index < 31)
        return regs.x[index];
    switch (index)
    {
        case 31:
            return regs.esr;
        case 32:
            return regs.elr;
        case 33:
            return regs.spsr;
        case 34:
            return regs.zr;
        default:
            return 0;
    }
}

void print_faulting_instr(u64 elr, serial::Sink &out)
{
    u32 opcode = *reinterpret_cast<volatile const u32 *>(static_cast<uptr>(elr & ~3ull));

    out.puts("Faulting instruction at ");
    out.put_hex(elr);
    out.puts(": ");
    for (u32 i = 0; i < 4; i++)
    {
        u8 byte = static_cast<u8>(opcode >> (i * 8));
        if (i == 0)
        {
            out.putc('[');
            out.put_hex_byte(byte);
            out.putc(']');
        }
        else
        {
            out.put_hex_byte(byte);
        }

        if (i < 3)
            out.putc(' ');
    }
    out.putc('\n');
}

void print_regs(const Regs &regs, serial::Sink &out)
{
    out.puts("\nRegisters:\n");
    for (u32 i = 0; i < REG_COUNT; i++)
    {
        out.puts(reg_name(i));
        out.puts(": 0x");
        out.put_hex_fixed(reg_value(regs, i), 16);
        out.putc('\n');
    }
}

void report_fault(const char *title, const Regs &regs, serial::Sink &out)
{
    out.puts(title);
    out.putc('\n');
    print_faulting_instr(regs.elr, out);
    print_regs(regs, out);
}

void set_fault_sink(serial::Sink *sink)
{
    g_fault_sink = sink;
}

serial::Sink *fault_sink()
{
    return g_fault_sink;
}

} // namespace elfboot::arch
