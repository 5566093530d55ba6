//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/arch.hpp
// Purpose: AArch64 CPU helpers and exception reporting.
// Key invariants: Regs matches the frame layout built by vectors.S.
// Ownership/Lifetime: The registered fault sink must outlive the boot stage.
// Links: src/arch/aarch64/fault.cpp, src/arch/aarch64/traps.cpp,
//        src/arch/aarch64/vectors.S
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file arch.hpp
 * @brief CPU-level services for the boot stage.
 *
 * @details
 * Exceptions are not expected while the loader runs. If one is taken anyway
 * (a bad segment address faulting, an undefined instruction in the loader
 * itself), the vector stubs save the register frame and call one of the
 * `do_*` handlers, which report the state through the fault sink and halt.
 */

#include "asm/boot.h"
#include "serial.hpp"
#include "types.hpp"

namespace elfboot::arch
{

/**
 * @brief CPU register state at the time of an exception.
 *
 * @details
 * General-purpose registers x0-x30 followed by the exception syndrome, link
 * and saved program status registers, then a zero-register placeholder that
 * keeps the frame a multiple of 16 bytes. The order matches the stores in
 * `vectors.S`.
 */
struct Regs
{
    u64 x[31];
    u64 esr;
    u64 elr;
    u64 spsr;
    u64 zr;
};

static_assert(sizeof(Regs) == ELFBOOT_FRAME_SIZE, "Regs must match the vector frame");

/// Number of printable slots in a Regs frame.
constexpr u32 REG_COUNT = 35;

/// Name of slot `index` ("x0 ", ..., "esr", "elr", "spsr", "xzr").
const char *reg_name(u32 index);

/// Value of slot `index`, in the same order as @ref reg_name.
u64 reg_value(const Regs &regs, u32 index);

/**
 * @brief Print the 32-bit instruction word at `elr`.
 *
 * @details
 * Output: `Faulting instruction at 0x<elr>: [b0] b1 b2 b3` where the bytes are
 * in memory order and the first one is bracketed. The word is read from
 * `elr & ~3`, which the caller guarantees is readable.
 */
void print_faulting_instr(u64 elr, serial::Sink &out);

/// Print `Registers:` followed by one `name: 0x<16 digits>` line per slot.
void print_regs(const Regs &regs, serial::Sink &out);

/**
 * @brief Full fault report: title line, faulting instruction, register dump.
 */
void report_fault(const char *title, const Regs &regs, serial::Sink &out);

/**
 * @brief Register the sink used by the exception handlers.
 *
 * @details
 * Vector entries cannot take arguments, so the boot entry registers its
 * console here once, right after configuring it. Passing `nullptr`
 * unregisters it; handlers then halt silently.
 */
void set_fault_sink(serial::Sink *sink);

/// Currently registered fault sink, or `nullptr`.
serial::Sink *fault_sink();

/**
 * @brief Make freshly written instructions visible to instruction fetch.
 *
 * @details
 * Cleans the data cache to the point of unification and invalidates the
 * instruction cache over `[addr, addr + len)`. A no-op when not built for
 * AArch64.
 */
void sync_icache(uptr addr, usize len);

/// Stop this core forever.
[[noreturn]] void halt();

} // namespace elfboot::arch
