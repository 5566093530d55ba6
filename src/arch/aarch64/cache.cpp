//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/arch/aarch64/cache.cpp
// Purpose: Instruction cache maintenance after writing code segments.
// Key invariants: Whole cache lines covering the range are maintained.
// Ownership/Lifetime: Stateless.
// Links: include/elfboot/arch.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/arch.hpp"

namespace elfboot::arch
{

#if defined(__aarch64__)
namespace
{
// Smallest line size on the cores we boot; maintaining at this stride covers
// every line in the range even if the real line is larger.
constexpr uptr kCacheLine = 64;
} // namespace
#endif

void sync_icache(uptr addr, usize len)
{
#if defined(__aarch64__)
    if (len == 0)
        return;
    uptr start = addr & ~(kCacheLine - 1);
    uptr end = addr + len;

    for (uptr a = start; a < end; a += kCacheLine)
    {
        asm volatile("dc cvau, %0" ::"r"(a) : "memory");
    }
    asm volatile("dsb ish" ::: "memory");
    for (uptr a = start; a < end; a += kCacheLine)
    {
        asm volatile("ic ivau, %0" ::"r"(a) : "memory");
    }
    asm volatile("dsb ish" ::: "memory");
    asm volatile("isb" ::: "memory");
#else
    (void)addr;
    (void)len;
#endif
}

} // namespace elfboot::arch
