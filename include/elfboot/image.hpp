//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/image.hpp
// Purpose: Read-only view over an ELF image with optional bounds checking.
// Key invariants: A bounded view never yields a pointer to a byte range that
//                 is not entirely inside [data, data + size).
// Ownership/Lifetime: Borrows the image; the caller keeps it alive and
//                     unmodified for the duration of the load.
// Links: src/loader/image.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file image.hpp
 * @brief Image buffer view.
 *
 * @details
 * Every offset the loader follows (`e_phoff`, `p_offset`) comes from the
 * image itself and must be treated as untrusted. When the image length is
 * known the view is *bounded* and rejects any range that leaves the buffer.
 *
 * Firmware hands the loader nothing but a base address. For that case the
 * view is *unbounded*: ranges are not checked and the caller guarantees, as
 * a precondition, that every offset and size in the image describes readable
 * memory. This is the loader's trust boundary.
 */

#include "types.hpp"

namespace elfboot
{

class ImageView
{
  public:
    /// View over `size` bytes at `data`.
    static ImageView bounded(const void *data, usize size);

    /// View over an image of unknown length starting at address `base`.
    static ImageView unbounded(uptr base);

    bool is_bounded() const
    {
        return bounded_;
    }

    const u8 *data() const
    {
        return data_;
    }

    /// Length in bytes (0 for an unbounded view).
    usize size() const
    {
        return size_;
    }

    /**
     * @brief Whether `[offset, offset + len)` lies inside the image.
     *
     * @details
     * Overflow-safe: a range whose end wraps is never contained. Always true
     * for an unbounded view.
     */
    bool contains(u64 offset, u64 len) const;

    /**
     * @brief Pointer to `len` bytes at `offset`.
     *
     * @return Pointer into the image, or `nullptr` if the range is not
     *         contained.
     */
    const u8 *at(u64 offset, u64 len) const;

    /// Typed access to a structure at `offset` (bounds checked as `at`).
    template <typename T> const T *as(u64 offset) const
    {
        return reinterpret_cast<const T *>(at(offset, sizeof(T)));
    }

  private:
    ImageView(const u8 *data, usize size, bool bounded) : data_(data), size_(size), bounded_(bounded)
    {
    }

    const u8 *data_;
    usize size_;
    bool bounded_;
};

} // namespace elfboot
