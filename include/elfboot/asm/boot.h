//===----------------------------------------------------------------------===//
//
// Part of the elfboot project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/elfboot/asm/boot.h
// Purpose: Boot-stage layout constants shared by C++, assembly and the linker
//          script.
// Key invariants: Plain #defines only; must stay consumable by the assembler.
// Ownership/Lifetime: Header-only.
// Links: src/arch/aarch64/boot.S, src/arch/aarch64/linker.ld
//
//===----------------------------------------------------------------------===//

#ifndef ELFBOOT_ASM_BOOT_H
#define ELFBOOT_ASM_BOOT_H

/*
 * The loader links itself into the top 16MB of the default 128MB QEMU virt
 * RAM (0x40000000-0x48000000) so payloads linked at the usual 0x40080000
 * cannot overlap its code, stack or the embedded image.
 */
#define ELFBOOT_LOAD_BASE 0x47000000
#define BOOT_STACK_SIZE 0x4000
#define KERNEL_ALIGN 0x1000 /* 4KB - payload alignment */

/* Size of one saved exception frame (struct arch::Regs). */
#define ELFBOOT_FRAME_SIZE (35 * 8)
/* Stack space reserved for a frame, keeping SP 16-byte aligned. */
#define ELFBOOT_FRAME_STACK ((ELFBOOT_FRAME_SIZE + 15) & ~15)

#endif // ELFBOOT_ASM_BOOT_H
