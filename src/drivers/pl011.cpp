//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/drivers/pl011.cpp
// Purpose: PL011 line configuration and polling transmit.
// Key invariants: Registers are only written after the parameters validate.
// Ownership/Lifetime: Operates on the caller-owned Pl011 handle.
// Links: include/elfboot/pl011.hpp
//
//===----------------------------------------------------------------------===//

/**
 * @file pl011.cpp
 * @brief PL011 UART driver implementation.
 *
 * @details
 * The driver never reads the receive side and never enables interrupts; it
 * exists so the loader can report what it is doing before the payload takes
 * over the device.
 */

#include "elfboot/pl011.hpp"
#include "elfboot/mmio.hpp"

namespace elfboot::drivers
{

/** @copydoc elfboot::drivers::pl011_divisor */
BaudDivisor pl011_divisor(u32 clock_hz, u32 baud)
{
    u64 div = (4ull * clock_hz) / baud;
    return {static_cast<u32>((div >> 6) & 0xffff), static_cast<u32>(div & 0x3f)};
}

/** @copydoc elfboot::drivers::Pl011::configure */
Status<DeviceError> Pl011::configure()
{
    if (baudrate_ == 0)
        return Status<DeviceError>::Err(DeviceError::BadBaud);
    if (data_bits_ < 5 || data_bits_ > 8)
        return Status<DeviceError>::Err(DeviceError::BadDataBits);
    if (stop_bits_ != 1 && stop_bits_ != 2)
        return Status<DeviceError>::Err(DeviceError::BadStopBits);

    // 1. Disable the UART
    mmio::clear_bits(base_, PL011_CR, CR_UARTEN);

    // 2. Wait for the end of TX
    while (!ready())
    {
    }

    // 3. Flush TX FIFO
    mmio::clear_bits(base_, PL011_LCR_H, LCR_H_FEN);

    // 4. Set speed
    BaudDivisor div = pl011_divisor(base_clock_, baudrate_);
    mmio::write32(base_, PL011_IBRD, div.ibrd);
    mmio::write32(base_, PL011_FBRD, div.fbrd);

    // 5. Frame format: word length in bits 5-6, optional second stop bit
    u32 lcr = (static_cast<u32>(data_bits_ - 5) & 0x3) << LCR_H_WLEN_SHIFT;
    if (stop_bits_ == 2)
        lcr |= LCR_H_STP2;
    mmio::write32(base_, PL011_LCR_H, lcr);

    // 6. Mask all interrupts
    mmio::write32(base_, PL011_IMSC, IMSC_ALL);

    // 7. Disable DMA
    mmio::write32(base_, PL011_DMACR, 0);

    // 8. Enable TX, then the UART
    mmio::write32(base_, PL011_CR, CR_TXE);
    mmio::set_bits(base_, PL011_CR, CR_UARTEN);

    return Status<DeviceError>::Ok();
}

/** @copydoc elfboot::drivers::Pl011::ready */
bool Pl011::ready() const
{
    return (mmio::read32(base_, PL011_FR) & FR_BUSY) == 0;
}

/** @copydoc elfboot::drivers::Pl011::putc */
void Pl011::putc(char c)
{
    while (!ready())
    {
    }
    mmio::write32(base_, PL011_DR, static_cast<u8>(c));
}

} // namespace elfboot::drivers
