//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/loader/image.cpp
// Purpose: Bounds checks for the image view.
// Key invariants: No arithmetic on untrusted values may wrap unchecked.
// Ownership/Lifetime: Stateless beyond the borrowed view.
// Links: include/elfboot/image.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/image.hpp"

namespace elfboot
{

ImageView ImageView::bounded(const void *data, usize size)
{
    return ImageView(static_cast<const u8 *>(data), size, true);
}

ImageView ImageView::unbounded(uptr base)
{
    return ImageView(reinterpret_cast<const u8 *>(base), 0, false);
}

bool ImageView::contains(u64 offset, u64 len) const
{
    if (!bounded_)
        return true;
    if (offset > size_)
        return false;
    return len <= size_ - offset;
}

const u8 *ImageView::at(u64 offset, u64 len) const
{
    if (!contains(offset, len))
        return nullptr;
    return data_ + offset;
}

} // namespace elfboot
