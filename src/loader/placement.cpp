//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/loader/placement.cpp
// Purpose: Destination address resolution.
// Key invariants: Window checks are overflow-safe.
// Ownership/Lifetime: Stateless beyond the borrowed window.
// Links: include/elfboot/placement.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/placement.hpp"

namespace elfboot
{

Placement Placement::identity()
{
    return Placement(0, nullptr, 0, true);
}

Placement Placement::window(u64 base, u8 *host, usize size)
{
    return Placement(base, host, size, false);
}

u8 *Placement::resolve(u64 addr, u64 len) const
{
    if (identity_)
        return reinterpret_cast<u8 *>(static_cast<uptr>(addr));

    if (addr < base_)
        return nullptr;
    u64 offset = addr - base_;
    if (offset > size_ || len > size_ - offset)
        return nullptr;
    return host_ + offset;
}

} // namespace elfboot
