//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lib/crt.cpp
// Purpose: C runtime memory routines for the freestanding firmware image.
// Key invariants: Same contracts as the standard C functions.
// Ownership/Lifetime: Stateless.
// Links: src/lib/mem.cpp
//
//===----------------------------------------------------------------------===//

/**
 * @file crt.cpp
 * @brief Minimal C runtime routines for the firmware build.
 *
 * @details
 * There is no libc in the boot image, but the compiler still emits calls to
 * `memcpy`/`memset`/`memmove` for aggregate copies and initialization. They
 * forward to the loader's own byte routines. The firmware is compiled with
 * `-fno-tree-loop-distribute-patterns` so those loops are not turned back
 * into calls to the functions defined here.
 *
 * Only linked into the firmware image; hosted builds use the platform libc.
 */

#include "elfboot/mem.hpp"

using elfboot::u8;
using elfboot::usize;

extern "C"
{
    void *memcpy(void *dest, const void *src, usize n)
    {
        elfboot::mem::copy(static_cast<u8 *>(dest), static_cast<const u8 *>(src), n);
        return dest;
    }

    void *memset(void *dest, int c, usize n)
    {
        elfboot::mem::fill(static_cast<u8 *>(dest), static_cast<u8>(c), n);
        return dest;
    }

    /// Overlap-safe copy: forward when `dest` is below `src`, backward otherwise.
    void *memmove(void *dest, const void *src, usize n)
    {
        u8 *d = static_cast<u8 *>(dest);
        const u8 *s = static_cast<const u8 *>(src);
        if (d < s)
        {
            elfboot::mem::copy(d, s, n);
            return dest;
        }

        d += n;
        s += n;
        while (n--)
        {
            *--d = *--s;
        }
        return dest;
    }

} // extern "C"
