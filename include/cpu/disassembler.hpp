#pragma once

#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include "cpu/instruction.hpp"
#include <span>
#include <string>
#include <vector>

namespace famicore {

/**
 * One decoded instruction at a fixed address, with its raw operand bytes
 */
struct DisassembledInstruction {
	Address address = 0;
	Byte opcode = 0;
	Mnemonic mnemonic = Mnemonic::UNKNOWN;
	AddressingMode mode = AddressingMode::UNKNOWN;
	Byte length = 1;
	Byte cycles = 0;
	std::vector<Byte> operands;

	/// Little-endian operand value (zero when there are no operand bytes)
	[[nodiscard]] Word operand_value() const noexcept;

	/// Absolute destination of a relative branch
	[[nodiscard]] Address branch_target() const noexcept;
};

/// Decode the instruction at address using side-effect free reads
[[nodiscard]] DisassembledInstruction disassemble_at(const MemoryInterface &memory, Address address);

/**
 * Linear sweep over a program image
 * @param program Raw bytes (e.g. PRG ROM)
 * @param origin CPU address of program[0]
 * An instruction truncated by the end of the image is emitted as an unknown byte.
 */
[[nodiscard]] std::vector<DisassembledInstruction> disassemble(std::span<const Byte> program, Address origin);

/// Operand in assembler syntax, e.g. "#$05", "$0200,X", "($40),Y"
[[nodiscard]] std::string format_operand(const DisassembledInstruction &instruction);

/// Full listing line: "$8000  A9 05     LDA #$05"
[[nodiscard]] std::string format_disassembly(const DisassembledInstruction &instruction);

} // namespace famicore
