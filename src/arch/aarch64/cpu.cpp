//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/arch/aarch64/cpu.cpp
// Purpose: Terminal halt for fatal boot errors.
// Key invariants: halt() never returns.
// Ownership/Lifetime: Stateless.
// Links: include/elfboot/arch.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/arch.hpp"

namespace elfboot::arch
{

void halt()
{
    asm volatile("msr daifset, #0xf" ::: "memory");
    for (;;)
        asm volatile("wfi");
}

} // namespace elfboot::arch
