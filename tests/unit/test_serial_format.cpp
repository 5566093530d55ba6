// File: tests/unit/test_serial_format.cpp
// Purpose: Verify the number and string formatting shared by every sink.
// Key invariants: Hex output is lowercase; put_hex never pads.
// Ownership/Lifetime: Standalone unit test executable.
// Links: include/elfboot/serial.hpp

#include <gtest/gtest.h>

#include "RecordingSink.hpp"

#include <cstdint>
#include <limits>

using elfboot::tests::RecordingSink;

TEST(SerialFormat, Decimal)
{
    RecordingSink out;
    out.put_dec(0);
    out.putc(' ');
    out.put_dec(42);
    out.putc(' ');
    out.put_dec(std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(out.text(), "0 42 18446744073709551615");
}

TEST(SerialFormat, HexIsMinimalAndPrefixed)
{
    RecordingSink out;
    out.put_hex(0);
    out.putc(' ');
    out.put_hex(0x40080000);
    out.putc(' ');
    out.put_hex(0xABCDEFull);
    out.putc(' ');
    out.put_hex(std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(out.text(), "0x0 0x40080000 0xabcdef 0xffffffffffffffff");
}

TEST(SerialFormat, FixedWidthHex)
{
    RecordingSink out;
    out.put_hex_fixed(0xab, 4);
    EXPECT_EQ(out.text(), "00ab");

    out.clear();
    out.put_hex_fixed(0x1234, 2);
    EXPECT_EQ(out.text(), "34");

    out.clear();
    out.put_hex_fixed(0x7, 0);
    EXPECT_EQ(out.text(), "7");

    out.clear();
    out.put_hex_fixed(0x1, 40);
    EXPECT_EQ(out.text(), "0000000000000001");

    out.clear();
    out.put_hex_byte(0x5);
    out.put_hex_byte(0xd4);
    EXPECT_EQ(out.text(), "05d4");
}

TEST(SerialFormat, StringsAndBytes)
{
    RecordingSink out;
    out.puts(nullptr);
    out.puts("");
    EXPECT_TRUE(out.text().empty());

    out.puts("[boot] ");
    const std::uint8_t raw[] = {'o', 'k', '\n'};
    out.write(raw, sizeof(raw));
    EXPECT_EQ(out.text(), "[boot] ok\n");
    EXPECT_EQ(out.line_count(), 1u);
}
