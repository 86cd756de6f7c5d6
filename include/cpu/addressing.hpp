#pragma once

#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include "cpu/instruction.hpp"
#include "cpu/registers.hpp"

namespace famicore {

/// Where an instruction's operand lives once its addressing mode is resolved
enum class OperandKind : std::uint8_t {
	NONE,		 // Implied: no operand
	ACCUMULATOR, // The A register itself
	IMMEDIATE,	 // Literal byte from the instruction stream
	MEMORY		 // Effective address (also jump and branch targets)
};

struct EffectiveOperand {
	OperandKind kind = OperandKind::NONE;
	Address address = 0;
	Byte value = 0;			   // Immediate literal
	bool page_crossed = false; // Indexing or branch target left the base page
};

struct ResolvedOperand {
	EffectiveOperand operand;
	Byte bytes_consumed = 0; // Operand bytes read from the instruction stream
	// One when an indexed mode crossed a page. Only read instructions are
	// charged for it (has_page_cross_penalty); stores and RMW include it in their base cost.
	Byte extra_cycles = 0;
};

/**
 * Resolve the operand for an addressing mode.
 * Reads operand bytes at registers.pc and advances the program counter past
 * them. Indirect modes read their pointers from memory here.
 */
[[nodiscard]] ResolvedOperand resolve(AddressingMode mode, CpuRegisters &registers, MemoryInterface &memory);

/// Fetch the operand value (accumulator, immediate literal or memory byte)
[[nodiscard]] Byte read_operand(const EffectiveOperand &operand, const CpuRegisters &registers,
								MemoryInterface &memory);

/// Store a value through the operand. Immediate and implied operands cannot be
/// written; doing so is a programming error (asserts in debug builds).
void write_operand(const EffectiveOperand &operand, CpuRegisters &registers, MemoryInterface &memory, Byte value);

} // namespace famicore
