//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/loader/loader.cpp
// Purpose: ELF64 loader implementation.
// Key invariants: Check everything, then write; segments in table order.
// Ownership/Lifetime: Stateless.
// Links: include/elfboot/loader.hpp
//
//===----------------------------------------------------------------------===//

/**
 * @file loader.cpp
 * @brief ELF loader implementation.
 *
 * @details
 * Implements the loading routines declared in `loader.hpp`: a straightforward
 * PT_LOAD copy and zero-fill, followed by returning the header entry point.
 *
 * The code is designed for a freestanding environment: no heap, no libc, no
 * recursion. Diagnostics go through the caller's sink.
 */

#include "elfboot/loader.hpp"
#include "elfboot/arch.hpp"
#include "elfboot/config.hpp"
#include "elfboot/mem.hpp"

namespace elfboot::loader
{

using elf::Elf64_Ehdr;
using elf::Elf64_Phdr;

namespace
{

using LoadResult = Result<LoadInfo, LoadError>;

void report_segment_error(serial::Sink &out, u32 index, LoadError err)
{
    out.puts("[loader] Segment ");
    out.put_dec(index);
    out.puts(": ");
    out.puts(to_string(err));
    out.puts("\n");
}

#if ELFBOOT_VERBOSE_LOAD
void log_segment(serial::Sink &out, u32 index, const Elf64_Phdr &phdr)
{
    out.puts("[loader] Segment ");
    out.put_dec(index);
    out.puts(": vaddr=");
    out.put_hex(phdr.p_vaddr);
    out.puts(", offset=");
    out.put_hex(phdr.p_offset);
    out.puts(", filesz=");
    out.put_dec(phdr.p_filesz);
    out.puts(", memsz=");
    out.put_dec(phdr.p_memsz);
    out.puts(", flags=");
    out.putc((phdr.p_flags & elf::PF_R) ? 'r' : '-');
    out.putc((phdr.p_flags & elf::PF_W) ? 'w' : '-');
    out.putc((phdr.p_flags & elf::PF_X) ? 'x' : '-');
    out.puts("\n");
}
#endif

} // namespace

/** @copydoc elfboot::loader::check_segment */
Status<LoadError> check_segment(const Elf64_Phdr &phdr, const ImageView &image, const Placement &place)
{
    if (phdr.p_memsz < phdr.p_filesz)
        return Status<LoadError>::Err(LoadError::SegmentSizeMismatch);

    // A pure-BSS segment reads no file bytes, so its offset is irrelevant
    if (phdr.p_filesz != 0 && !image.contains(phdr.p_offset, phdr.p_filesz))
        return Status<LoadError>::Err(LoadError::SegmentOutOfBounds);

    if (phdr.p_memsz != 0 && !place.resolve(phdr.p_vaddr, phdr.p_memsz))
        return Status<LoadError>::Err(LoadError::SegmentUnmapped);

    return Status<LoadError>::Ok();
}

/** @copydoc elfboot::loader::load_segment */
SegmentStats load_segment(const Elf64_Phdr &phdr, const ImageView &image, const Placement &place)
{
    SegmentStats stats = {0, 0};
    if (phdr.p_memsz == 0)
        return stats;

    u8 *dst = place.resolve(phdr.p_vaddr, phdr.p_memsz);
    usize size = static_cast<usize>(phdr.p_filesz);

    // Copy segment from the image to its target address
    if (size != 0)
    {
        mem::copy(dst, image.at(phdr.p_offset, phdr.p_filesz), size);
        stats.copied = phdr.p_filesz;
    }

    // Zero the BSS tail if memsz > filesz
    if (phdr.p_memsz > phdr.p_filesz)
    {
        usize bss_size = static_cast<usize>(phdr.p_memsz - phdr.p_filesz);
        mem::fill(dst + size, 0, bss_size);
        stats.zeroed = bss_size;
    }

    if (phdr.p_flags & elf::PF_X)
        arch::sync_icache(reinterpret_cast<uptr>(dst), static_cast<usize>(phdr.p_memsz));

    return stats;
}

/** @copydoc elfboot::loader::read_phdr */
Elf64_Phdr read_phdr(const u8 *table, u32 index)
{
    Elf64_Phdr phdr;
    mem::copy(reinterpret_cast<u8 *>(&phdr), table + static_cast<usize>(index) * sizeof(Elf64_Phdr),
              sizeof(Elf64_Phdr));
    return phdr;
}

/** @copydoc elfboot::loader::walk_segments */
Result<LoadInfo, LoadError> walk_segments(const Elf64_Ehdr &ehdr,
                                          const ImageView &image,
                                          const Placement &place,
                                          serial::Sink &out)
{
    LoadInfo info = {ehdr.e_entry, 0, 0, 0};

    // e_phnum * 56 cannot overflow: e_phnum is 16 bits
    const u8 *table = nullptr;
    if (ehdr.e_phnum != 0)
    {
        table = image.at(ehdr.e_phoff, static_cast<u64>(ehdr.e_phnum) * sizeof(Elf64_Phdr));
        if (!table)
        {
            out.puts("[loader] ");
            out.puts(to_string(LoadError::PhdrTableOutOfBounds));
            out.puts("\n");
            return LoadResult::Err(LoadError::PhdrTableOutOfBounds);
        }
    }

    // Pass 1: reject the image before touching any destination
    for (u32 i = 0; i < ehdr.e_phnum; i++)
    {
        Elf64_Phdr phdr = read_phdr(table, i);
        if (phdr.p_type != elf::PT_LOAD)
            continue;

        Status<LoadError> status = check_segment(phdr, image, place);
        if (status.is_err())
        {
            report_segment_error(out, i, status.error());
            return LoadResult::Err(status.error());
        }
    }

    out.puts("[loader] Loading ELF: entry=");
    out.put_hex(ehdr.e_entry);
    out.puts(", phnum=");
    out.put_dec(ehdr.e_phnum);
    out.puts("\n");

    // Pass 2: place every PT_LOAD segment in table order
    for (u32 i = 0; i < ehdr.e_phnum; i++)
    {
        Elf64_Phdr phdr = read_phdr(table, i);
        if (phdr.p_type != elf::PT_LOAD)
            continue;

#if ELFBOOT_VERBOSE_LOAD
        log_segment(out, i, phdr);
#endif

        SegmentStats stats = load_segment(phdr, image, place);
        info.segments_loaded++;
        info.bytes_copied += stats.copied;
        info.bytes_zeroed += stats.zeroed;
    }

    return LoadResult::Ok(info);
}

/** @copydoc elfboot::loader::load_image */
Result<LoadInfo, LoadError> load_image(const ImageView &image, const Placement &place, serial::Sink &out)
{
    const Elf64_Ehdr *ehdr = image.as<Elf64_Ehdr>(0);
    if (!ehdr)
    {
        out.puts("[loader] ");
        out.puts(to_string(LoadError::TruncatedHeader));
        out.puts("\n");
        return LoadResult::Err(LoadError::TruncatedHeader);
    }

    // Validate ELF
    Status<LoadError> header = elf::validate_header(*ehdr, out);
    if (header.is_err())
        return LoadResult::Err(header.error());

    LoadResult result = walk_segments(*ehdr, image, place, out);
    if (result.is_err())
        return result;

    LoadInfo info = result.unwrap();
    out.puts("[loader] ELF loaded: entry=");
    out.put_hex(info.entry);
    out.puts(", segments=");
    out.put_dec(info.segments_loaded);
    out.puts(", copied=");
    out.put_dec(info.bytes_copied);
    out.puts(", zeroed=");
    out.put_dec(info.bytes_zeroed);
    out.puts("\n");

    return result;
}

/** @copydoc elfboot::loader::load_kernel */
Result<u64, LoadError> load_kernel(u64 elf_base, serial::Sink &out)
{
    LoadResult result =
        load_image(ImageView::unbounded(static_cast<uptr>(elf_base)), Placement::identity(), out);
    if (result.is_err())
        return Result<u64, LoadError>::Err(result.error());
    return Result<u64, LoadError>::Ok(result.unwrap().entry);
}

} // namespace elfboot::loader
