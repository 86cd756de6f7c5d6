#pragma once

#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include "cpu/addressing.hpp"
#include "cpu/cpu_config.hpp"
#include "cpu/instruction.hpp"
#include "cpu/registers.hpp"

namespace famicore {

/**
 * Apply one decoded instruction.
 * The operand must already be resolved, with registers.pc pointing past the
 * instruction. Control-flow instructions overwrite the program counter.
 * @return Cycles used: base cost plus branch penalties. The indexed read
 *         penalty comes from ResolvedOperand::extra_cycles and is added by the caller.
 */
[[nodiscard]] int execute(const Instruction &instruction, const EffectiveOperand &operand, CpuRegisters &registers,
						  MemoryInterface &memory, CpuVariant variant = CpuVariant::RICOH_2A03);

// Stack operations (page $01, stack pointer wraps)
void push_byte(CpuRegisters &registers, MemoryInterface &memory, Byte value);
[[nodiscard]] Byte pull_byte(CpuRegisters &registers, MemoryInterface &memory);
void push_word(CpuRegisters &registers, MemoryInterface &memory, Word value);
[[nodiscard]] Word pull_word(CpuRegisters &registers, MemoryInterface &memory);

/// Push PC and P, set I and jump through a vector (BRK, IRQ, NMI)
void enter_interrupt(CpuRegisters &registers, MemoryInterface &memory, Address vector, bool break_flag);

// Arithmetic helpers, exposed for reference checks
void add_with_carry(CpuRegisters &registers, Byte value, CpuVariant variant);
void subtract_with_carry(CpuRegisters &registers, Byte value, CpuVariant variant);
void compare(CpuRegisters &registers, Byte register_value, Byte memory_value) noexcept;

} // namespace famicore
