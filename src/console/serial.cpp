//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/console/serial.cpp
// Purpose: Integer and string formatting on top of Sink::putc.
// Key invariants: No heap; scratch buffers are fixed-size stack arrays.
// Ownership/Lifetime: Stateless.
// Links: include/elfboot/serial.hpp
//
//===----------------------------------------------------------------------===//

#include "elfboot/serial.hpp"

namespace elfboot::serial
{

namespace
{
constexpr char kHexDigits[] = "0123456789abcdef";
} // namespace

/** @copydoc elfboot::serial::Sink::puts */
void Sink::puts(const char *s)
{
    if (!s)
        return;
    while (*s)
    {
        putc(*s++);
    }
}

/** @copydoc elfboot::serial::Sink::write */
void Sink::write(const u8 *data, usize len)
{
    for (usize i = 0; i < len; i++)
    {
        putc(static_cast<char>(data[i]));
    }
}

/** @copydoc elfboot::serial::Sink::put_dec */
void Sink::put_dec(u64 value)
{
    // 2^64 - 1 has 20 decimal digits
    char buf[20];
    usize n = 0;

    do
    {
        buf[n++] = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value != 0);

    while (n > 0)
    {
        putc(buf[--n]);
    }
}

/** @copydoc elfboot::serial::Sink::put_hex */
void Sink::put_hex(u64 value)
{
    puts("0x");

    u32 digits = 1;
    for (u64 v = value >> 4; v != 0; v >>= 4)
    {
        digits++;
    }
    put_hex_fixed(value, digits);
}

/** @copydoc elfboot::serial::Sink::put_hex_fixed */
void Sink::put_hex_fixed(u64 value, u32 digits)
{
    if (digits == 0)
        digits = 1;
    if (digits > 16)
        digits = 16;

    for (u32 i = digits; i > 0; i--)
    {
        putc(kHexDigits[(value >> ((i - 1) * 4)) & 0xf]);
    }
}

/** @copydoc elfboot::serial::Sink::put_hex_byte */
void Sink::put_hex_byte(u8 value)
{
    put_hex_fixed(value, 2);
}

} // namespace elfboot::serial
