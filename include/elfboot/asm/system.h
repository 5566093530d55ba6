//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/asm/system.h
// Purpose: AArch64 system register bit definitions used during hand-off.
// Key invariants: Plain #defines only; must stay consumable by the assembler.
// Ownership/Lifetime: Header-only.
// Links: src/arch/aarch64/boot.S
//
//===----------------------------------------------------------------------===//

#ifndef ELFBOOT_ASM_SYSTEM_H
#define ELFBOOT_ASM_SYSTEM_H

/* SCTLR_EL1 reserved-one bits (ARMv8.0); MMU and caches off */
#define SCTLR_EL1_RES1 ((3 << 28) | (3 << 22) | (1 << 20) | (1 << 11))

/* CNTHCTL_EL2: EL1 access to the physical counter and timer */
#define CNTHCTL_EL2_EL1PCTEN (1 << 0)
#define CNTHCTL_EL2_EL1PCEN (1 << 1)

/* HCR_EL2 bits */
#define HCR_EL2_RW (1 << 31)

/* SPSR_ELx bits */
#define SPSR_EL_M_AARCH64 (0 << 4)
#define SPSR_EL_FIQ_MASK (1 << 6)
#define SPSR_EL_IRQ_MASK (1 << 7)
#define SPSR_EL_SERR_MASK (1 << 8)
#define SPSR_EL_DEBUG_MASK (1 << 9)
#define SPSR_EL_M_EL1 (5) /* EL1h */

#endif // ELFBOOT_ASM_SYSTEM_H
