//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lib/error.cpp
// Purpose: Diagnostic strings for loader and device errors.
// Key invariants: Every enumerator maps to a distinct message.
// Ownership/Lifetime: Returns static string literals.
// Links: include/elfboot/error.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/error.hpp"

namespace elfboot
{

const char *to_string(LoadError err)
{
    switch (err)
    {
        case LoadError::BadMagic:
            return "bad magic (not an ELF file)";
        case LoadError::BadClass:
            return "not a 64-bit image";
        case LoadError::BadEncoding:
            return "invalid endianness";
        case LoadError::BadOsAbi:
            return "invalid OS/ABI";
        case LoadError::BadType:
            return "invalid type (not an executable)";
        case LoadError::BadMachine:
            return "invalid machine (not AArch64)";
        case LoadError::BadPhdrEntrySize:
            return "invalid program header entry size";
        case LoadError::TruncatedHeader:
            return "image smaller than the ELF header";
        case LoadError::PhdrTableOutOfBounds:
            return "program header table outside image";
        case LoadError::SegmentOutOfBounds:
            return "segment data outside image";
        case LoadError::SegmentSizeMismatch:
            return "segment memory size smaller than file size";
        case LoadError::SegmentUnmapped:
            return "segment destination not mapped";
    }
    return "unknown error";
}

const char *to_string(DeviceError err)
{
    switch (err)
    {
        case DeviceError::BadBaud:
            return "baud rate is zero";
        case DeviceError::BadDataBits:
            return "unsupported word length";
        case DeviceError::BadStopBits:
            return "unsupported stop bits";
    }
    return "unknown error";
}

} // namespace elfboot
