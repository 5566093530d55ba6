//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/error.hpp
// Purpose: Error codes reported by the loader and the UART driver.
// Key invariants: Each LoadError names exactly one rejected condition.
// Ownership/Lifetime: Header-only enums; strings are static literals.
// Links: src/lib/error.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "types.hpp"

/**
 * @file error.hpp
 * @brief Classified rejection reasons.
 *
 * @details
 * Every condition the loader detects is fatal to the boot, but the reason is
 * returned to the caller (rather than halting in place) so that tests can
 * assert on it and the boot entry decides how to stop.
 *
 * Header errors are detected for every image. The bounds errors can only be
 * detected when the image length is known; for an image handed off as a bare
 * base address those conditions are outside the trust boundary.
 */
namespace elfboot
{

enum class LoadError : i32
{
    // Header checks, in the order they are evaluated
    BadMagic = 1,          ///< e_ident does not start with 0x7F 'E' 'L' 'F'
    BadClass = 2,          ///< Not ELFCLASS64
    BadEncoding = 3,       ///< Not little-endian
    BadOsAbi = 4,          ///< OS/ABI is not System V
    BadType = 5,           ///< Not ET_EXEC
    BadMachine = 6,        ///< Not EM_AARCH64
    BadPhdrEntrySize = 7,  ///< e_phentsize != sizeof(Elf64_Phdr)

    // Bounded image checks
    TruncatedHeader = 20,      ///< Image smaller than the ELF header
    PhdrTableOutOfBounds = 21, ///< Program header table extends past the image
    SegmentOutOfBounds = 22,   ///< Segment file bytes extend past the image

    // Segment descriptor checks
    SegmentSizeMismatch = 30, ///< p_memsz < p_filesz
    SegmentUnmapped = 31,     ///< Destination outside the placement window
};

/**
 * @brief Human-readable description of a load error.
 *
 * @param err Error code.
 * @return Static NUL-terminated string; never null.
 */
const char *to_string(LoadError err);

/// Errors reported while configuring the PL011.
enum class DeviceError : i32
{
    BadBaud = 1,     ///< Baud rate of zero
    BadDataBits = 2, ///< Word length outside 5..8
    BadStopBits = 3, ///< Stop bits other than 1 or 2
};

const char *to_string(DeviceError err);

} // namespace elfboot
