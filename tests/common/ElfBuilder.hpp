// File: tests/common/ElfBuilder.hpp
// Purpose: Build synthetic ELF64 AArch64 images for loader tests.
// Key invariants: build() produces a header accepted by validate_header
//                 unless a test corrupts it; segment data lands at the
//                 requested file offsets.
// Ownership/Lifetime: The builder owns the byte vector it returns by value.
// Links: include/elfboot/elf.hpp

#pragma once

#include "elfboot/elf.hpp"

#include <cstdint>
#include <vector>

namespace elfboot::tests
{

/// One program header plus the file bytes it refers to.
struct SegmentSpec
{
    std::uint32_t type = elf::PT_LOAD;
    std::uint32_t flags = elf::PF_R;
    std::uint64_t offset = 0;
    std::uint64_t vaddr = 0;
    std::uint64_t filesz = 0;
    std::uint64_t memsz = 0;
    std::uint64_t align = 0x1000;
    /// Seed for the deterministic fill pattern of the file bytes.
    std::uint8_t pattern = 1;
};

class ElfBuilder
{
  public:
    ElfBuilder &entry(std::uint64_t addr);
    ElfBuilder &phoff(std::uint64_t off);
    ElfBuilder &segment(const SegmentSpec &seg);

    /// Fixed image size; 0 sizes the image to fit its contents.
    ElfBuilder &size(std::size_t bytes);

    /// Serialize the header, program headers and segment data.
    std::vector<std::uint8_t> build() const;

    /// Byte `i` of the fill pattern used for a segment with seed `seed`.
    static std::uint8_t pattern_byte(std::uint8_t seed, std::size_t i);

  private:
    std::uint64_t entry_ = 0;
    std::uint64_t phoff_ = sizeof(elf::Elf64_Ehdr);
    std::size_t size_ = 0;
    std::vector<SegmentSpec> segments_;
};

/// Mutable view of the header of a built image.
elf::Elf64_Ehdr &header_of(std::vector<std::uint8_t> &image);

/// Mutable view of program header `index` of a built image.
elf::Elf64_Phdr &phdr_of(std::vector<std::uint8_t> &image, std::size_t index);

} // namespace elfboot::tests
