// File: tests/unit/test_elf_header.cpp
// Purpose: Verify ELF64 header validation order, classification and the
//          single-line diagnostic emitted on rejection.
// Key invariants: The first failing check is the one reported; fields other
//                 than the checked ones never cause a rejection.
// Ownership/Lifetime: Standalone unit test executable.
// Links: include/elfboot/elf.hpp

#include <gtest/gtest.h>

#include "ElfBuilder.hpp"
#include "RecordingSink.hpp"
#include "elfboot/elf.hpp"
#include "elfboot/error.hpp"

#include <set>
#include <string>
#include <vector>

using namespace elfboot;
using elfboot::tests::ElfBuilder;
using elfboot::tests::RecordingSink;
using elfboot::tests::SegmentSpec;
using elfboot::tests::header_of;

namespace
{
std::vector<std::uint8_t> valid_image()
{
    SegmentSpec seg;
    seg.offset = 0x100;
    seg.vaddr = 0x40080000;
    seg.filesz = 0x10;
    seg.memsz = 0x10;
    return ElfBuilder().entry(0x40080000).segment(seg).build();
}
} // namespace

TEST(ElfHeader, AcceptsValidExecutableSilently)
{
    auto image = valid_image();
    RecordingSink out;

    auto status = elf::validate_header(header_of(image), out);

    EXPECT_TRUE(status.is_ok());
    EXPECT_TRUE(out.text().empty());
}

TEST(ElfHeader, EachCheckedFieldIsReportedDistinctly)
{
    struct Case
    {
        const char *name;
        void (*corrupt)(elf::Elf64_Ehdr &);
        LoadError expected;
    };

    const Case cases[] = {
        {"magic", [](elf::Elf64_Ehdr &h) { h.e_ident[elf::EI_MAG1] = 'X'; }, LoadError::BadMagic},
        {"class", [](elf::Elf64_Ehdr &h) { h.e_ident[elf::EI_CLASS] = 1; }, LoadError::BadClass},
        {"encoding", [](elf::Elf64_Ehdr &h) { h.e_ident[elf::EI_DATA] = 2; }, LoadError::BadEncoding},
        {"osabi", [](elf::Elf64_Ehdr &h) { h.e_ident[elf::EI_OSABI] = 3; }, LoadError::BadOsAbi},
        {"type", [](elf::Elf64_Ehdr &h) { h.e_type = elf::ET_DYN; }, LoadError::BadType},
        {"machine", [](elf::Elf64_Ehdr &h) { h.e_machine = 62; }, LoadError::BadMachine},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.name);
        auto image = valid_image();
        c.corrupt(header_of(image));
        RecordingSink out;

        auto status = elf::validate_header(header_of(image), out);

        ASSERT_TRUE(status.is_err());
        EXPECT_EQ(status.error(), c.expected);
        EXPECT_EQ(out.line_count(), 1u);
        EXPECT_TRUE(out.contains(to_string(c.expected)));
        EXPECT_EQ(out.text().rfind("[elf] invalid header: ", 0), 0u);
    }
}

TEST(ElfHeader, FirstFailingCheckWins)
{
    auto image = valid_image();
    auto &h = header_of(image);
    h.e_ident[elf::EI_MAG0] = 0;
    h.e_ident[elf::EI_CLASS] = 1;
    h.e_machine = 0;
    RecordingSink out;

    auto status = elf::validate_header(h, out);

    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error(), LoadError::BadMagic);
    EXPECT_EQ(out.line_count(), 1u);

    h.e_ident[elf::EI_MAG0] = elf::ELFMAG0;
    out.clear();
    status = elf::validate_header(h, out);
    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error(), LoadError::BadClass);
}

TEST(ElfHeader, RelocatableAndSharedObjectsAreRejected)
{
    for (std::uint16_t type : {elf::ET_REL, elf::ET_DYN})
    {
        auto image = valid_image();
        header_of(image).e_type = type;
        RecordingSink out;
        auto status = elf::validate_header(header_of(image), out);
        ASSERT_TRUE(status.is_err());
        EXPECT_EQ(status.error(), LoadError::BadType);
    }
}

TEST(ElfHeader, UncheckedFieldsAreTrusted)
{
    auto image = valid_image();
    auto &h = header_of(image);
    h.e_ident[elf::EI_VERSION] = 0x7f;
    h.e_version = 0xdeadbeef;
    h.e_shoff = 0xffffffffffffffffull;
    h.e_flags = 0x12345678;
    h.e_ehsize = 3;
    h.e_shentsize = 1;
    h.e_shnum = 999;
    h.e_shstrndx = 998;
    RecordingSink out;

    EXPECT_TRUE(elf::validate_header(h, out).is_ok());
    EXPECT_TRUE(out.text().empty());
}

TEST(ElfHeader, ProgramHeaderEntrySizeMustMatch)
{
    auto image = valid_image();
    header_of(image).e_phentsize = 64;
    RecordingSink out;

    auto status = elf::validate_header(header_of(image), out);

    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error(), LoadError::BadPhdrEntrySize);
    EXPECT_EQ(out.line_count(), 1u);
}

TEST(ElfHeader, EntrySizeIgnoredWithoutProgramHeaders)
{
    auto image = ElfBuilder().entry(0x1000).build();
    header_of(image).e_phentsize = 0;
    RecordingSink out;

    EXPECT_TRUE(elf::validate_header(header_of(image), out).is_ok());
}

TEST(ElfHeader, ErrorStringsAreDistinct)
{
    const LoadError all[] = {
        LoadError::BadMagic,        LoadError::BadClass,           LoadError::BadEncoding,
        LoadError::BadOsAbi,        LoadError::BadType,            LoadError::BadMachine,
        LoadError::BadPhdrEntrySize, LoadError::TruncatedHeader,   LoadError::PhdrTableOutOfBounds,
        LoadError::SegmentOutOfBounds, LoadError::SegmentSizeMismatch, LoadError::SegmentUnmapped,
    };
    std::set<std::string> seen;
    for (LoadError e : all)
        EXPECT_TRUE(seen.insert(to_string(e)).second) << to_string(e);
}
