// File: tests/unit/test_fault_report.cpp
// Purpose: Verify the exception report: title, faulting instruction bytes and
//          the register dump in frame order.
// Key invariants: One line per register slot; values are 16 hex digits.
// Ownership/Lifetime: Standalone unit test executable.
// Links: include/elfboot/arch.hpp

#include <gtest/gtest.h>

#include "RecordingSink.hpp"
#include "elfboot/arch.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace elfboot;
using elfboot::tests::RecordingSink;

namespace
{

std::vector<std::string> lines_of(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

std::string hex(std::uint64_t v)
{
    std::ostringstream os;
    os << "0x" << std::hex << v;
    return os.str();
}

} // namespace

TEST(FaultReport, RegisterNamesFollowFrameLayout)
{
    EXPECT_STREQ(arch::reg_name(0), "x0 ");
    EXPECT_STREQ(arch::reg_name(30), "x30");
    EXPECT_STREQ(arch::reg_name(31), "esr");
    EXPECT_STREQ(arch::reg_name(32), "elr");
    EXPECT_STREQ(arch::reg_name(33), "spsr");
    EXPECT_STREQ(arch::reg_name(34), "xzr");
    EXPECT_STREQ(arch::reg_name(arch::REG_COUNT), "???");
}

TEST(FaultReport, RegisterValuesFollowFrameLayout)
{
    arch::Regs regs{};
    for (u32 i = 0; i < 31; ++i)
        regs.x[i] = 0x100 + i;
    regs.esr = 0x96000045;
    regs.elr = 0x40080010;
    regs.spsr = 0x3c5;

    EXPECT_EQ(arch::reg_value(regs, 7), 0x107u);
    EXPECT_EQ(arch::reg_value(regs, 31), 0x96000045u);
    EXPECT_EQ(arch::reg_value(regs, 32), 0x40080010u);
    EXPECT_EQ(arch::reg_value(regs, 33), 0x3c5u);
    EXPECT_EQ(arch::reg_value(regs, 34), 0u);
}

TEST(FaultReport, FaultingInstructionBytes)
{
    alignas(4) const std::uint32_t code[2] = {0xd503201f, 0xd4200000}; // nop; brk #0
    const std::uint64_t elr = reinterpret_cast<std::uintptr_t>(&code[1]);
    RecordingSink out;

    arch::print_faulting_instr(elr, out);

    EXPECT_EQ(out.text(), "Faulting instruction at " + hex(elr) + ": [00] 00 20 d4\n");
}

TEST(FaultReport, MisalignedLinkRegisterReadsContainingWord)
{
    alignas(4) const std::uint32_t code[1] = {0xd4200000};
    const std::uint64_t elr = reinterpret_cast<std::uintptr_t>(&code[0]) + 2;
    RecordingSink out;

    arch::print_faulting_instr(elr, out);

    EXPECT_EQ(out.text(), "Faulting instruction at " + hex(elr) + ": [00] 00 20 d4\n");
}

TEST(FaultReport, FullReport)
{
    alignas(4) const std::uint32_t code[1] = {0x00000000}; // udf #0
    arch::Regs regs{};
    regs.x[0] = 1;
    regs.x[30] = 0xffff000040001234ull;
    regs.esr = 0x02000000;
    regs.elr = reinterpret_cast<std::uintptr_t>(&code[0]);
    regs.spsr = 0x3c5;
    RecordingSink out;

    arch::report_fault("Synchronous Abort", regs, out);

    auto lines = lines_of(out.text());
    ASSERT_EQ(lines.size(), 4u + arch::REG_COUNT);
    EXPECT_EQ(lines[0], "Synchronous Abort");
    EXPECT_EQ(lines[1].rfind("Faulting instruction at ", 0), 0u);
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "Registers:");
    EXPECT_EQ(lines[4], "x0 : 0x0000000000000001");
    EXPECT_EQ(lines[4 + 30], "x30: 0xffff000040001234");
    EXPECT_EQ(lines[4 + 31], "esr: 0x0000000002000000");
    EXPECT_EQ(lines[4 + 33], "spsr: 0x00000000000003c5");
    EXPECT_EQ(lines[4 + 34], "xzr: 0x0000000000000000");
}

TEST(FaultReport, FaultSinkIsInstalledExplicitly)
{
    RecordingSink out;
    serial::Sink *previous = arch::fault_sink();

    arch::set_fault_sink(&out);
    EXPECT_EQ(arch::fault_sink(), &out);

    arch::set_fault_sink(previous);
    EXPECT_EQ(arch::fault_sink(), previous);
}
