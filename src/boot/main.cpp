//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/boot/main.cpp
// Purpose: Firmware entry: bring up the console and load the payload.
// Key invariants: Called once from boot.S; returns only with a valid entry.
// Ownership/Lifetime: Owns the boot console for the whole boot stage.
// Links: src/arch/aarch64/boot.S, include/elfboot/loader.hpp
//
//===----------------------------------------------------------------------===//

/**
 * @file main.cpp
 * @brief elfboot entry point.
 *
 * @details
 * `boot.S` sets up a stack, clears `.bss`, installs the vector table and
 * calls @ref elfboot_main with the address of the embedded payload. On
 * success the returned entry address goes back to `boot.S`, which drops to
 * EL1 and jumps there. Any load failure halts here, after the loader has
 * reported the reason on the console.
 */

#include "elfboot/arch.hpp"
#include "elfboot/constants.hpp"
#include "elfboot/loader.hpp"
#include "elfboot/pl011.hpp"

namespace ec = elfboot::constants;

using elfboot::u64;
using elfboot::uptr;

namespace
{

// Console for the whole boot stage; the fault handlers report through it.
// Constant-initialized: nothing runs global constructors this early.
elfboot::drivers::Pl011 g_console =
    elfboot::drivers::Pl011::init(static_cast<uptr>(ec::hw::UART_BASE), ec::hw::UART_CLOCK_HZ,
                                  ec::hw::UART_BAUD);

void print_boot_banner(elfboot::serial::Sink &out, u64 payload_base)
{
    out.puts("\n");
    out.puts("=========================================\n");
    out.puts("  elfboot - AArch64 stage 2 loader\n");
    out.puts("  payload at ");
    out.put_hex(payload_base);
    out.puts("\n");
    out.puts("=========================================\n");
    out.puts("\n");
}

} // namespace

extern "C" u64 elfboot_main(u64 payload_base)
{
    // Nothing can be reported if the UART cannot be configured
    if (g_console.configure().is_err())
        elfboot::arch::halt();

    elfboot::arch::set_fault_sink(&g_console);
    print_boot_banner(g_console, payload_base);

    elfboot::Result<u64, elfboot::LoadError> entry = elfboot::loader::load_kernel(payload_base, g_console);
    if (entry.is_err())
        elfboot::arch::halt();

    g_console.puts("[boot] Jumping to ");
    g_console.put_hex(entry.unwrap());
    g_console.puts("\n");
    return entry.unwrap();
}
