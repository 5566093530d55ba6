//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/pl011.hpp
// Purpose: Polling transmit-only driver for the ARM PL011 UART.
// Key invariants: A handle never touches registers before configure().
// Ownership/Lifetime: Value type owned by the boot entry; one per device.
// Links: src/drivers/pl011.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file pl011.hpp
 * @brief Minimal ARM PL011 UART driver.
 *
 * @details
 * The PL011 is the console on the QEMU `virt` machine and on most Arm
 * development boards. The loader only ever transmits, so the driver
 * implements line configuration and a busy-waiting transmit path.
 *
 * The device state is an explicit handle returned by @ref Pl011::init; code
 * that needs to report something receives it as a `serial::Sink &`.
 */

#include "error.hpp"
#include "result.hpp"
#include "serial.hpp"
#include "types.hpp"

namespace elfboot::drivers
{

// PL011 Register Offsets
constexpr usize PL011_DR = 0x00;    ///< Data register
constexpr usize PL011_FR = 0x18;    ///< Flag register
constexpr usize PL011_IBRD = 0x24;  ///< Integer baud rate divisor
constexpr usize PL011_FBRD = 0x28;  ///< Fractional baud rate divisor
constexpr usize PL011_LCR_H = 0x2c; ///< Line control
constexpr usize PL011_CR = 0x30;    ///< Control
constexpr usize PL011_IMSC = 0x38;  ///< Interrupt mask set/clear
constexpr usize PL011_DMACR = 0x48; ///< DMA control

// Register bits
constexpr u32 FR_BUSY = 1u << 3;
constexpr u32 LCR_H_STP2 = 1u << 3;
constexpr u32 LCR_H_FEN = 1u << 4;
constexpr u32 LCR_H_WLEN_SHIFT = 5;
constexpr u32 CR_UARTEN = 1u << 0;
constexpr u32 CR_TXE = 1u << 8;
constexpr u32 IMSC_ALL = 0x7ff;

/**
 * @brief Baud rate divisor split into the PL011 IBRD/FBRD fields.
 *
 * @details
 * The PL011 divides UARTCLK by 16 * baud with a 6-bit fraction, so
 * `4 * clock / baud` is the divisor scaled by 64: the top bits are the
 * integer part and the low six bits the fraction.
 */
struct BaudDivisor
{
    u32 ibrd; ///< Integer part (16 bits)
    u32 fbrd; ///< Fractional part (6 bits)
};

/**
 * @brief Compute the divisor for `baud` given a UART reference clock.
 *
 * @param clock_hz UARTCLK frequency in Hz.
 * @param baud Target baud rate; must be non-zero.
 */
BaudDivisor pl011_divisor(u32 clock_hz, u32 baud);

/**
 * @brief PL011 device handle.
 */
class Pl011 final : public serial::Sink
{
  public:
    /**
     * @brief Create a handle for the device at `base`.
     *
     * @details
     * Uses 8 data bits and 1 stop bit. No register is accessed until
     * @ref configure is called.
     */
    static constexpr Pl011 init(uptr base, u32 base_clock, u32 baudrate)
    {
        return Pl011(base, base_clock, baudrate);
    }

    /**
     * @brief Program the line settings and enable transmission.
     *
     * @details
     * Follows the PL011 TRM programming sequence: disable the UART, wait for
     * the end of the current transmission, flush the FIFO, program the
     * divisors and frame format, mask interrupts, disable DMA, then enable TX
     * and the UART.
     *
     * @return Error if the baud rate or frame format cannot be programmed; in
     *         that case no register has been written.
     */
    [[nodiscard]] Status<DeviceError> configure();

    /// Set the frame format used by the next @ref configure call.
    void set_format(u8 data_bits, u8 stop_bits)
    {
        data_bits_ = data_bits;
        stop_bits_ = stop_bits;
    }

    /// Whether the transmitter is idle.
    bool ready() const;

    /// Busy-wait for the transmitter, then send one byte.
    void putc(char c) override;

    uptr base() const
    {
        return base_;
    }

    u32 baudrate() const
    {
        return baudrate_;
    }

  private:
    constexpr Pl011(uptr base, u32 base_clock, u32 baudrate)
        : base_(base), base_clock_(base_clock), baudrate_(baudrate)
    {
    }

    uptr base_;
    u32 base_clock_;
    u32 baudrate_;
    u8 data_bits_ = 8;
    u8 stop_bits_ = 1;
};

} // namespace elfboot::drivers
