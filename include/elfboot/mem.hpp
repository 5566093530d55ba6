//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/mem.hpp
// Purpose: Byte copy and fill used for segment placement.
// Key invariants: Exactly `n` bytes are touched; nothing outside the range.
// Ownership/Lifetime: Stateless.
// Links: src/lib/mem.cpp, src/lib/crt.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "types.hpp"

namespace elfboot::mem
{

/**
 * @brief Copy `n` bytes from `src` to `dest`.
 *
 * @details
 * The regions must not overlap. Segment data is copied with this rather than
 * `memcpy` so the loader behaves the same in the freestanding image and in
 * the hosted tests.
 */
void copy(u8 *dest, const u8 *src, usize n);

/// Set `n` bytes at `dest` to `value`.
void fill(u8 *dest, u8 value, usize n);

} // namespace elfboot::mem
