//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/constants.hpp
// Purpose: Centralized platform constants (device addresses and clocks).
// Key invariants: Constants grouped by namespace; values immutable at runtime.
// Ownership/Lifetime: Header-only; constexpr definitions only.
// Links: include/elfboot/asm/boot.h
//
//===----------------------------------------------------------------------===//

#pragma once

/**
 * @file constants.hpp
 * @brief Centralized platform constants for elfboot.
 *
 * @details
 * Usage:
 * @code
 *   namespace ec = elfboot::constants;
 *   u64 base = ec::hw::UART_BASE;
 * @endcode
 *
 * Values only the assembler or linker script need, such as the load address,
 * live in `asm/boot.h` and `asm/system.h`.
 */

#include "types.hpp"

namespace elfboot::constants
{

// =============================================================================
// SECTION 1: HARDWARE DEVICE ADDRESSES (QEMU virt machine)
// =============================================================================
namespace hw
{

// UART (PL011)
constexpr u64 UART_BASE = 0x09000000;
constexpr u32 UART_CLOCK_HZ = 24000000; // QEMU fixed UARTCLK
constexpr u32 UART_BAUD = 115200;

} // namespace hw

} // namespace elfboot::constants
