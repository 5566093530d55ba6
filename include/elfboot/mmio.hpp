//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/mmio.hpp
// Purpose: Volatile 32-bit register accessors for memory-mapped devices.
// Key invariants: Every access is a single aligned volatile load or store.
// Ownership/Lifetime: Header-only; stateless.
// Links: src/drivers/pl011.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "types.hpp"

namespace elfboot::mmio
{

/**
 * @brief Read a 32-bit device register at `base + offset`.
 *
 * @details
 * The caller guarantees that `base + offset` is a valid, 4-byte aligned
 * register address.
 */
inline u32 read32(uptr base, usize offset)
{
    return *reinterpret_cast<volatile const u32 *>(base + offset);
}

/// Write a 32-bit device register at `base + offset`.
inline void write32(uptr base, usize offset, u32 value)
{
    *reinterpret_cast<volatile u32 *>(base + offset) = value;
}

/// Read-modify-write: set `bits` in the register.
inline void set_bits(uptr base, usize offset, u32 bits)
{
    write32(base, offset, read32(base, offset) | bits);
}

/// Read-modify-write: clear `bits` in the register.
inline void clear_bits(uptr base, usize offset, u32 bits)
{
    write32(base, offset, read32(base, offset) & ~bits);
}

} // namespace elfboot::mmio
