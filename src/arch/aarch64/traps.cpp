//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/arch/aarch64/traps.cpp
// Purpose: C++ targets of the exception vector table.
// Key invariants: No handler returns; each reports (if a sink is registered)
//                 and halts.
// Ownership/Lifetime: Frames live on the boot stack until the halt.
// Links: src/arch/aarch64/vectors.S, src/arch/aarch64/fault.cpp
//
//===----------------------------------------------------------------------===//

/**
 * @file traps.cpp
 * @brief Exception handlers for the boot stage.
 *
 * @details
 * The "bad" variants are reached through the vector slots for exceptions
 * taken while running on SP_EL0 or from a lower exception level, neither of
 * which the loader ever does. The plain variants cover the current EL with
 * SP_ELx, which is where the loader runs. Interrupts are never enabled, so
 * IRQ/FIQ arriving at all is a fault in itself.
 */

#include "elfboot/arch.hpp"

using elfboot::arch::Regs;

namespace
{

[[noreturn]] void fatal(const char *title, const Regs *regs)
{
    elfboot::serial::Sink *out = elfboot::arch::fault_sink();
    if (out && regs)
        elfboot::arch::report_fault(title, *regs, *out);
    elfboot::arch::halt();
}

} // namespace

extern "C"
{
    [[noreturn]] void do_bad_sync(const Regs *regs)
    {
        fatal("Bad mode in Synchronous Exception handler", regs);
    }

    [[noreturn]] void do_bad_irq(const Regs *regs)
    {
        fatal("Bad mode in IRQ handler", regs);
    }

    [[noreturn]] void do_bad_fiq(const Regs *regs)
    {
        fatal("Bad mode in FIQ handler", regs);
    }

    [[noreturn]] void do_bad_serror(const Regs *regs)
    {
        fatal("Bad mode in SError handler", regs);
    }

    [[noreturn]] void do_sync(const Regs *regs)
    {
        fatal("Synchronous Exception handler", regs);
    }

    [[noreturn]] void do_irq(const Regs *regs)
    {
        fatal("IRQ handler", regs);
    }

    [[noreturn]] void do_fiq(const Regs *regs)
    {
        fatal("FIQ handler", regs);
    }

    [[noreturn]] void do_serror(const Regs *regs)
    {
        fatal("SError handler", regs);
    }
}
