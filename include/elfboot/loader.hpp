//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/loader.hpp
// Purpose: ELF64 image loader: validate, walk program headers, place PT_LOAD
//          segments, resolve the entry point.
// Key invariants: Nothing is written to any destination unless the header and
//                 every loadable descriptor have passed their checks.
// Ownership/Lifetime: Stateless; borrows the image, placement and sink for the
//                     duration of one call.
// Links: src/loader/loader.cpp, include/elfboot/elf.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file loader.hpp
 * @brief Boot-time ELF loader interface.
 *
 * @details
 * The loader places an AArch64 ELF executable at the addresses its program
 * headers demand and returns the entry point. It never jumps there itself:
 * transferring control is the boot entry's job, which keeps the loader
 * testable without running the payload.
 *
 * Loader operations are designed for the boot stage and favor simplicity:
 * - Only ELF64 little-endian ET_EXEC images for AArch64 are accepted.
 * - Only PT_LOAD segments are interpreted; everything else is skipped.
 * - No relocations; segments go to `p_vaddr` exactly.
 * - Segment destinations are not checked for overlap with each other or with
 *   the loader; the image is trusted to be linked for this machine.
 *
 * Errors are returned, not acted upon. Every detected problem is reported on
 * one diagnostic line through the sink.
 */

#include "elf.hpp"
#include "error.hpp"
#include "image.hpp"
#include "placement.hpp"
#include "result.hpp"
#include "serial.hpp"
#include "types.hpp"

namespace elfboot::loader
{

/**
 * @brief Summary of a successful load.
 */
struct LoadInfo
{
    u64 entry;           /**< Entry point address (`e_entry`, verbatim). */
    u32 segments_loaded; /**< Number of PT_LOAD segments placed. */
    u64 bytes_copied;    /**< Total file bytes copied. */
    u64 bytes_zeroed;    /**< Total zero-fill bytes written. */
};

/// Bytes written for one segment.
struct SegmentStats
{
    u64 copied;
    u64 zeroed;
};

/**
 * @brief Check one PT_LOAD descriptor before anything is written.
 *
 * @details
 * - `p_memsz` must not be smaller than `p_filesz`.
 * - With a bounded image and a non-zero `p_filesz`,
 *   `[p_offset, p_offset + p_filesz)` must lie inside it.
 * - The destination `[p_vaddr, p_vaddr + p_memsz)` must resolve through the
 *   placement (always true for identity placement).
 */
[[nodiscard]] Status<LoadError> check_segment(const elf::Elf64_Phdr &phdr,
                                              const ImageView &image,
                                              const Placement &place);

/**
 * @brief Place one PT_LOAD segment.
 *
 * @details
 * Copies exactly `p_filesz` bytes from `image + p_offset` to the resolved
 * `p_vaddr`, then zeroes `[p_vaddr + p_filesz, p_vaddr + p_memsz)` if that
 * range is not empty. Executable segments get an instruction cache sync.
 *
 * Precondition: @ref check_segment accepted `phdr`. Source and destination
 * must not overlap.
 */
SegmentStats load_segment(const elf::Elf64_Phdr &phdr, const ImageView &image, const Placement &place);

/**
 * @brief Copy entry `index` out of a program header table.
 *
 * @details
 * `e_phoff` comes from the image and need not be 8-byte aligned; with the
 * MMU off an unaligned 64-bit load faults, so descriptors are never read in
 * place.
 */
elf::Elf64_Phdr read_phdr(const u8 *table, u32 index);

/**
 * @brief Walk the program header table and place every PT_LOAD segment.
 *
 * @details
 * The table starts at `image + e_phoff` and holds `e_phnum` entries of
 * `sizeof(Elf64_Phdr)` bytes. Entries are handled in table order. A first pass
 * checks every loadable entry; only if all of them pass is the load announced
 * and does the second pass copy and zero-fill.
 *
 * Precondition: `ehdr` has passed @ref elf::validate_header.
 *
 * @return Load statistics (with `entry` set from the header), or the first
 *         failed check.
 */
Result<LoadInfo, LoadError> walk_segments(const elf::Elf64_Ehdr &ehdr,
                                          const ImageView &image,
                                          const Placement &place,
                                          serial::Sink &out);

/**
 * @brief Validate and load an ELF image.
 *
 * @param image The image (bounded when its length is known).
 * @param place Destination address resolution.
 * @param out Diagnostic sink.
 * @return Load statistics including the entry point, or the rejection reason.
 */
Result<LoadInfo, LoadError> load_image(const ImageView &image, const Placement &place, serial::Sink &out);

/**
 * @brief Load the kernel image handed off at `elf_base`.
 *
 * @details
 * The boot-time entry point. Only the base address is known, so the image is
 * unbounded and placement is identity: the caller guarantees that the
 * address points to a readable, 8-byte aligned image and that every segment
 * destination is RAM not used by the loader's code, stack or the image.
 *
 * @return The entry address to jump to, or the rejection reason. The caller
 *         halts on error.
 */
Result<u64, LoadError> load_kernel(u64 elf_base, serial::Sink &out);

} // namespace elfboot::loader
