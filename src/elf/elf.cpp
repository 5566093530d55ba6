//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/elf/elf.cpp
// Purpose: ELF64 header validation.
// Key invariants: Checks run in a fixed order; the first failure is the one
//                 reported, on exactly one diagnostic line.
// Ownership/Lifetime: Borrows the header for the duration of the call.
// Links: include/elfboot/elf.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/elf.hpp"
#include "elfboot/config.hpp"

namespace elfboot::elf
{

namespace
{

using HeaderStatus = Status<LoadError>;

HeaderStatus check_fields(const Elf64_Ehdr &ehdr)
{
    // Validate Magic
    if (ehdr.e_ident[EI_MAG0] != ELFMAG0 || ehdr.e_ident[EI_MAG1] != ELFMAG1 ||
        ehdr.e_ident[EI_MAG2] != ELFMAG2 || ehdr.e_ident[EI_MAG3] != ELFMAG3)
        return HeaderStatus::Err(LoadError::BadMagic);

    // Validate Bitness
    if (ehdr.e_ident[EI_CLASS] != ELFCLASS64)
        return HeaderStatus::Err(LoadError::BadClass);

    // Validate Endianness
    if (ehdr.e_ident[EI_DATA] != ELFDATA2LSB)
        return HeaderStatus::Err(LoadError::BadEncoding);

    // Validate OS/ABI
    if (ehdr.e_ident[EI_OSABI] != ELFOSABI_SYSV)
        return HeaderStatus::Err(LoadError::BadOsAbi);

    // Validate Type
    if (ehdr.e_type != ET_EXEC)
        return HeaderStatus::Err(LoadError::BadType);

    // Validate Machine
    if (ehdr.e_machine != EM_AARCH64)
        return HeaderStatus::Err(LoadError::BadMachine);

#if ELFBOOT_CHECK_PHENTSIZE
    // The table is walked with the native stride
    if (ehdr.e_phnum != 0 && ehdr.e_phentsize != sizeof(Elf64_Phdr))
        return HeaderStatus::Err(LoadError::BadPhdrEntrySize);
#endif

    return HeaderStatus::Ok();
}

} // namespace

/** @copydoc elfboot::elf::validate_header */
Status<LoadError> validate_header(const Elf64_Ehdr &ehdr, serial::Sink &out)
{
    Status<LoadError> status = check_fields(ehdr);
    if (status.is_err())
    {
        out.puts("[elf] invalid header: ");
        out.puts(to_string(status.error()));
        out.puts("\n");
    }
    return status;
}

} // namespace elfboot::elf
