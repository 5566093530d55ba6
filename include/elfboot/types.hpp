//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/types.hpp
// Purpose: Fixed-width integer aliases shared by every elfboot component.
// Key invariants: Only freestanding headers are included.
// Ownership/Lifetime: Header-only.
// Links: include/elfboot/constants.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file types.hpp
 * @brief Fundamental fixed-width type aliases.
 *
 * @details
 * The loader is built both for the freestanding firmware image and for the
 * hosted unit tests. Both environments provide `<stdint.h>` and `<stddef.h>`,
 * so the aliases below are the only integer vocabulary the sources use.
 */

#include <stddef.h>
#include <stdint.h>

namespace elfboot
{

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using usize = size_t;
using uptr = uintptr_t;

} // namespace elfboot
