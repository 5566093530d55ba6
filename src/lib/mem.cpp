//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lib/mem.cpp
// Purpose: Byte copy and fill used for segment placement.
// Key invariants: Byte-wise; no alignment requirements on either pointer.
// Ownership/Lifetime: Stateless.
// Links: include/elfboot/mem.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/mem.hpp"

namespace elfboot::mem
{

void copy(u8 *dest, const u8 *src, usize n)
{
    while (n--)
    {
        *dest++ = *src++;
    }
}

void fill(u8 *dest, u8 value, usize n)
{
    while (n--)
    {
        *dest++ = value;
    }
}

} // namespace elfboot::mem
