// File: tests/unit/test_pl011.cpp
// Purpose: Verify the PL011 divisor math and the register values left behind
//          by configure(), using an in-memory register block.
// Key invariants: A rejected configuration writes no register.
// Ownership/Lifetime: Each test owns its fake register block.
// Links: include/elfboot/pl011.hpp

#include <gtest/gtest.h>

#include "elfboot/pl011.hpp"

#include <array>
#include <cstdint>

using namespace elfboot;
using namespace elfboot::drivers;

namespace
{

/// Plain memory laid out like the PL011 register file up to DMACR.
struct FakeRegs
{
    alignas(4) std::array<std::uint32_t, 0x50 / 4> words{};

    uptr base()
    {
        return reinterpret_cast<uptr>(words.data());
    }

    std::uint32_t at(usize offset) const
    {
        return words[offset / 4];
    }

    void set(usize offset, std::uint32_t value)
    {
        words[offset / 4] = value;
    }
};

} // namespace

TEST(Pl011, DivisorForQemuVirtConsole)
{
    BaudDivisor div = pl011_divisor(24000000, 115200);
    EXPECT_EQ(div.ibrd, 13u);
    EXPECT_EQ(div.fbrd, 1u);
}

TEST(Pl011, DivisorKeepsSixBitFraction)
{
    // 48 MHz / (16 * 9600) = 312.5
    BaudDivisor div = pl011_divisor(48000000, 9600);
    EXPECT_EQ(div.ibrd, 312u);
    EXPECT_EQ(div.fbrd, 32u);
}

TEST(Pl011, ConfigureProgramsLine)
{
    FakeRegs regs;
    regs.set(PL011_LCR_H, LCR_H_FEN | 0x2);
    regs.set(PL011_CR, CR_UARTEN | 0x300);
    Pl011 uart = Pl011::init(regs.base(), 24000000, 115200);

    auto status = uart.configure();

    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(regs.at(PL011_IBRD), 13u);
    EXPECT_EQ(regs.at(PL011_FBRD), 1u);
    EXPECT_EQ(regs.at(PL011_LCR_H), 0x60u);
    EXPECT_EQ(regs.at(PL011_IMSC), 0x7ffu);
    EXPECT_EQ(regs.at(PL011_DMACR), 0u);
    EXPECT_EQ(regs.at(PL011_CR), CR_TXE | CR_UARTEN);
}

TEST(Pl011, ConfigureHonorsFrameFormat)
{
    FakeRegs regs;
    Pl011 uart = Pl011::init(regs.base(), 24000000, 115200);
    uart.set_format(7, 2);

    ASSERT_TRUE(uart.configure().is_ok());
    EXPECT_EQ(regs.at(PL011_LCR_H), (2u << LCR_H_WLEN_SHIFT) | LCR_H_STP2);
}

TEST(Pl011, RejectedSettingsTouchNothing)
{
    struct Case
    {
        u32 baud;
        u8 data_bits;
        u8 stop_bits;
        DeviceError expected;
    };
    const Case cases[] = {
        {0, 8, 1, DeviceError::BadBaud},
        {115200, 4, 1, DeviceError::BadDataBits},
        {115200, 9, 1, DeviceError::BadDataBits},
        {115200, 8, 0, DeviceError::BadStopBits},
        {115200, 8, 3, DeviceError::BadStopBits},
    };

    for (const Case &c : cases)
    {
        FakeRegs regs;
        regs.words.fill(0x5a5a5a5a);
        Pl011 uart = Pl011::init(regs.base(), 24000000, c.baud);
        uart.set_format(c.data_bits, c.stop_bits);

        auto status = uart.configure();

        ASSERT_TRUE(status.is_err());
        EXPECT_EQ(status.error(), c.expected);
        for (std::uint32_t w : regs.words)
            EXPECT_EQ(w, 0x5a5a5a5au);
    }
}

TEST(Pl011, TransmitsThroughDataRegister)
{
    FakeRegs regs;
    Pl011 uart = Pl011::init(regs.base(), 24000000, 115200);
    ASSERT_TRUE(uart.configure().is_ok());

    uart.putc('A');
    EXPECT_EQ(regs.at(PL011_DR), static_cast<std::uint32_t>('A'));

    serial::Sink &sink = uart;
    sink.puts("ok\n");
    EXPECT_EQ(regs.at(PL011_DR), static_cast<std::uint32_t>('\n'));

    uart.putc(static_cast<char>(0xff));
    EXPECT_EQ(regs.at(PL011_DR), 0xffu);
}

TEST(Pl011, ReadyFollowsBusyFlag)
{
    FakeRegs regs;
    Pl011 uart = Pl011::init(regs.base(), 24000000, 115200);

    EXPECT_TRUE(uart.ready());
    regs.set(PL011_FR, FR_BUSY);
    EXPECT_FALSE(uart.ready());
    regs.set(PL011_FR, ~FR_BUSY);
    EXPECT_TRUE(uart.ready());
}

TEST(Pl011, HandleKeepsSettings)
{
    Pl011 uart = Pl011::init(0x09000000, 24000000, 115200);
    EXPECT_EQ(uart.base(), 0x09000000u);
    EXPECT_EQ(uart.baudrate(), 115200u);
}
