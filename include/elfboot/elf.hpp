//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/elf.hpp
// Purpose: ELF64 on-disk layouts, constants and header validation.
// Key invariants: Struct layouts match the System V gABI byte for byte.
// Ownership/Lifetime: Header structs are read in place from the image.
// Links: src/elf/elf.cpp, src/loader/loader.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file elf.hpp
 * @brief Minimal ELF64 definitions used by the loader.
 *
 * @details
 * elfboot only needs a small subset of the System V gABI:
 * - The ELF64 file header (to validate the image and locate program headers).
 * - The ELF64 program header table (to load PT_LOAD segments).
 * - A small set of constants for AArch64 executables.
 *
 * The structures in this header are laid out to match the on-disk ELF
 * structures; the loader reads them in place from the image buffer. The image
 * must therefore be stored at an 8-byte aligned address.
 */

#include "error.hpp"
#include "result.hpp"
#include "serial.hpp"
#include "types.hpp"

namespace elfboot::elf
{

/**
 * @brief ELF64 file header.
 *
 * @details
 * This structure mirrors `Elf64_Ehdr` from the System V gABI. The loader
 * uses it to:
 * - Validate the magic/class/endianness/ABI/type/architecture.
 * - Determine the entry point address.
 * - Locate the program header table (`e_phoff`, `e_phnum`, `e_phentsize`).
 *
 * Section header fields are never interpreted but are part of the layout.
 */
struct Elf64_Ehdr
{
    u8 e_ident[16];  // Magic number and other info
    u16 e_type;      // Object file type
    u16 e_machine;   // Architecture
    u32 e_version;   // Object file version
    u64 e_entry;     // Entry point virtual address
    u64 e_phoff;     // Program header table file offset
    u64 e_shoff;     // Section header table file offset
    u32 e_flags;     // Processor-specific flags
    u16 e_ehsize;    // ELF header size
    u16 e_phentsize; // Program header table entry size
    u16 e_phnum;     // Program header table entry count
    u16 e_shentsize; // Section header table entry size
    u16 e_shnum;     // Section header table entry count
    u16 e_shstrndx;  // Section header string table index
};

/**
 * @brief ELF64 program header.
 *
 * @details
 * This structure mirrors `Elf64_Phdr`. For `p_type == PT_LOAD`:
 * - `p_offset` and `p_filesz` describe the segment bytes in the file.
 * - `p_vaddr` and `p_memsz` describe where and how much memory it occupies.
 * - `p_flags` carries read/write/execute permissions, which are not enforced
 *   (there is no MMU configuration at this stage).
 */
struct Elf64_Phdr
{
    u32 p_type;   // Segment type
    u32 p_flags;  // Segment flags
    u64 p_offset; // Segment file offset
    u64 p_vaddr;  // Segment virtual address
    u64 p_paddr;  // Segment physical address
    u64 p_filesz; // Segment size in file
    u64 p_memsz;  // Segment size in memory
    u64 p_align;  // Segment alignment
};

static_assert(sizeof(Elf64_Ehdr) == 64, "Elf64_Ehdr layout");
static_assert(offsetof(Elf64_Ehdr, e_entry) == 24, "Elf64_Ehdr layout");
static_assert(offsetof(Elf64_Ehdr, e_phoff) == 32, "Elf64_Ehdr layout");
static_assert(offsetof(Elf64_Ehdr, e_phentsize) == 54, "Elf64_Ehdr layout");
static_assert(offsetof(Elf64_Ehdr, e_phnum) == 56, "Elf64_Ehdr layout");
static_assert(sizeof(Elf64_Phdr) == 56, "Elf64_Phdr layout");
static_assert(offsetof(Elf64_Phdr, p_offset) == 8, "Elf64_Phdr layout");
static_assert(offsetof(Elf64_Phdr, p_memsz) == 40, "Elf64_Phdr layout");

/** @name ELF magic number bytes */
///@{
constexpr usize SELFMAG = 4;
constexpr u8 ELFMAG0 = 0x7f;
constexpr u8 ELFMAG1 = 'E';
constexpr u8 ELFMAG2 = 'L';
constexpr u8 ELFMAG3 = 'F';
///@}

/** @name Indices into `e_ident` */
///@{
constexpr int EI_MAG0 = 0;
constexpr int EI_MAG1 = 1;
constexpr int EI_MAG2 = 2;
constexpr int EI_MAG3 = 3;
constexpr int EI_CLASS = 4;
constexpr int EI_DATA = 5;
constexpr int EI_VERSION = 6;
constexpr int EI_OSABI = 7;
///@}

/** @brief `e_ident[EI_CLASS]` value for ELF64. */
constexpr u8 ELFCLASS64 = 2;

/** @brief `e_ident[EI_DATA]` value for little-endian encoding. */
constexpr u8 ELFDATA2LSB = 1; // Little endian

/** @brief `e_ident[EI_OSABI]` value for the System V ABI. */
constexpr u8 ELFOSABI_SYSV = 0;

/** @brief Current ELF version. */
constexpr u8 EV_CURRENT = 1;

/** @name `e_type` values */
///@{
constexpr u16 ET_REL = 1;  // Relocatable file
constexpr u16 ET_EXEC = 2; // Executable file
constexpr u16 ET_DYN = 3;  // Shared object file
///@}

/** @brief `e_machine` value for AArch64. */
constexpr u16 EM_AARCH64 = 183;

/** @name Program header types */
///@{
constexpr u32 PT_NULL = 0;
constexpr u32 PT_LOAD = 1;
constexpr u32 PT_DYNAMIC = 2;
constexpr u32 PT_INTERP = 3;
constexpr u32 PT_NOTE = 4;
constexpr u32 PT_PHDR = 6;
constexpr u32 PT_TLS = 7;
///@}

/** @name Program header permission flags (`p_flags`) */
///@{
constexpr u32 PF_X = 1; // Execute
constexpr u32 PF_W = 2; // Write
constexpr u32 PF_R = 4; // Read
///@}

/**
 * @brief Validate that an ELF header describes a loadable AArch64 executable.
 *
 * @details
 * Checks, in order, stopping at the first failure:
 * 1. Magic bytes match `0x7F 'E' 'L' 'F'`
 * 2. Class is ELF64
 * 3. Data encoding is little-endian
 * 4. OS/ABI is System V
 * 5. File type is ET_EXEC
 * 6. Machine is AArch64
 * 7. `e_phentsize == sizeof(Elf64_Phdr)` when there are program headers
 *    (only when `ELFBOOT_CHECK_PHENTSIZE` is enabled)
 *
 * On failure exactly one line naming the failed check is written to `out`.
 * Only the 64 header bytes are read.
 *
 * @param ehdr The ELF header.
 * @param out Diagnostic sink.
 * @return Ok, or the first failed check.
 */
Status<LoadError> validate_header(const Elf64_Ehdr &ehdr, serial::Sink &out);

} // namespace elfboot::elf
