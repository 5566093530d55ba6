//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/placement.hpp
// Purpose: Translate segment destination addresses to writable memory.
// Key invariants: A windowed placement never resolves a range that is not
//                 entirely inside its window.
// Ownership/Lifetime: Borrows the window buffer; does not own memory.
// Links: src/loader/placement.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file placement.hpp
 * @brief Destination address resolution for segment placement.
 *
 * @details
 * At boot the MMU is off and addresses are physical, so a segment's
 * `p_vaddr` is written directly (identity placement). No check against
 * available RAM is possible there: a descriptor pointing outside RAM is
 * outside the trust boundary.
 *
 * A windowed placement maps a guest address range `[base, base + size)` onto
 * a host buffer. Tests and host tools use it to load images linked at their
 * real boot addresses without touching those addresses.
 */

#include "types.hpp"

namespace elfboot
{

class Placement
{
  public:
    /// Destination addresses are used as-is.
    static Placement identity();

    /// Addresses `[base, base + size)` map onto `host[0, size)`.
    static Placement window(u64 base, u8 *host, usize size);

    bool is_identity() const
    {
        return identity_;
    }

    /**
     * @brief Writable pointer for `[addr, addr + len)`.
     *
     * @return Host pointer, or `nullptr` if a windowed placement does not
     *         cover the whole range.
     */
    u8 *resolve(u64 addr, u64 len) const;

  private:
    Placement(u64 base, u8 *host, usize size, bool identity)
        : base_(base), host_(host), size_(size), identity_(identity)
    {
    }

    u64 base_;
    u8 *host_;
    usize size_;
    bool identity_;
};

} // namespace elfboot
