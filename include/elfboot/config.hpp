//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/config.hpp
// Purpose: Build-time feature toggles for the loader.
// Key invariants: Every toggle is 0 or 1 and may be overridden by the build.
// Ownership/Lifetime: Header-only; preprocessor definitions only.
// Links: CMakeLists.txt
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file config.hpp
 * @brief Build-time feature toggles for elfboot.
 *
 * @details
 * Values are `0` (disabled) or `1` (enabled). They may be overridden via the
 * build system (e.g., `target_compile_definitions`). There is no runtime
 * configuration: the loader runs before anything could supply one.
 */

// -----------------------------------------------------------------------------
// Loader checks
// -----------------------------------------------------------------------------

/// Reject headers whose `e_phentsize` differs from `sizeof(Elf64_Phdr)`.
/// The program header table is always indexed with the native entry size, so
/// a mismatched header would make every descriptor read land off-stride.
#ifndef ELFBOOT_CHECK_PHENTSIZE
#define ELFBOOT_CHECK_PHENTSIZE 1
#endif

// -----------------------------------------------------------------------------
// Debug / tracing toggles
// -----------------------------------------------------------------------------

/// Log every loadable segment (addresses, sizes, permission flags).
#ifndef ELFBOOT_VERBOSE_LOAD
#define ELFBOOT_VERBOSE_LOAD 1
#endif
