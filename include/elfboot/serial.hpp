//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/serial.hpp
// Purpose: Byte-oriented diagnostic output and integer formatting helpers.
// Key invariants: Output is synchronous; no helper allocates or buffers.
// Ownership/Lifetime: Sinks are owned by the caller and passed by reference.
// Links: src/console/serial.cpp, include/elfboot/pl011.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "types.hpp"

/**
 * @file serial.hpp
 * @brief Diagnostic output interface.
 *
 * @details
 * Every component that reports something takes a `serial::Sink &`. In the
 * firmware the sink is the PL011 device handle; in tests it records bytes.
 * Formatting is limited to strings and integers to keep early-boot and fault
 * paths safe: there is no printf and nothing here touches a heap.
 */
namespace elfboot::serial
{

/**
 * @brief Destination for diagnostic bytes.
 *
 * @details
 * Implementations provide a single blocking `putc`. The formatting helpers
 * are non-virtual and build on it, so every sink renders numbers the same
 * way.
 *
 * Sinks are never destroyed through a `Sink *`; the protected non-virtual
 * destructor keeps implementations trivially destructible so a console can
 * be a constant-initialized global in the freestanding image.
 */
class Sink
{
  public:
    /**
     * @brief Emit one byte, blocking until the device accepts it.
     */
    virtual void putc(char c) = 0;

    /// Emit a NUL-terminated string.
    void puts(const char *s);

    /// Emit `len` raw bytes in order.
    void write(const u8 *data, usize len);

    /**
     * @brief Print an unsigned integer in decimal form.
     */
    void put_dec(u64 value);

    /**
     * @brief Print an unsigned integer in hexadecimal form.
     *
     * @details
     * Intended for addresses and bitmasks. The output is prefixed with `0x`,
     * uses lowercase digits and omits leading zeros (`0` prints as `0x0`).
     */
    void put_hex(u64 value);

    /**
     * @brief Print the low `digits` nibbles of `value`, zero padded.
     *
     * @details
     * No prefix is printed. Used for register dumps, where every value is
     * rendered as 16 digits so columns line up. `digits` is clamped to 1..16.
     */
    void put_hex_fixed(u64 value, u32 digits);

    /// Print one byte as exactly two lowercase hex digits.
    void put_hex_byte(u8 value);

  protected:
    constexpr Sink() = default;
    ~Sink() = default;
};

} // namespace elfboot::serial
