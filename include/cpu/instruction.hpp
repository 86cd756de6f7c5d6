#pragma once

#include "core/types.hpp"
#include <cstdint>

namespace famicore {

/// The 56 documented 6502 operations, plus a catch-all for undefined opcodes
enum class Mnemonic : std::uint8_t {
	// Load/store and transfers
	LDA, LDX, LDY, STA, STX, STY, TAX, TAY, TSX, TXA, TXS, TYA,
	// Arithmetic, increment/decrement
	ADC, SBC, INC, INX, INY, DEC, DEX, DEY,
	// Bitwise, shifts and rotates
	AND, ORA, EOR, BIT, ASL, LSR, ROL, ROR,
	// Branches
	BCC, BCS, BEQ, BMI, BNE, BPL, BVC, BVS,
	// Jumps, calls, returns
	JMP, JSR, RTS, RTI, BRK,
	// Compares
	CMP, CPX, CPY,
	// Flag set/clear
	CLC, CLD, CLI, CLV, SEC, SED, SEI,
	// Stack
	PHA, PHP, PLA, PLP,
	NOP,
	UNKNOWN
};

/// How an instruction locates its operand
enum class AddressingMode : std::uint8_t {
	IMPLIED,		  // TAX
	ACCUMULATOR,	  // ASL A
	IMMEDIATE,		  // LDA #$07
	ZERO_PAGE,		  // LDA $EE
	ZERO_PAGE_X,	  // STA $00,X
	ZERO_PAGE_Y,	  // LDX $00,Y
	ABSOLUTE,		  // LDA $16A0
	ABSOLUTE_X,		  // STA $1000,X
	ABSOLUTE_Y,		  // STA $1000,Y
	INDIRECT,		  // JMP ($0020)
	INDEXED_INDIRECT, // LDA ($40,X)
	INDIRECT_INDEXED, // LDA ($46),Y
	RELATIVE,		  // BEQ label
	UNKNOWN
};

/// Number of operand bytes following the opcode for a mode
[[nodiscard]] constexpr Byte operand_byte_count(AddressingMode mode) noexcept {
	switch (mode) {
	case AddressingMode::IMMEDIATE:
	case AddressingMode::ZERO_PAGE:
	case AddressingMode::ZERO_PAGE_X:
	case AddressingMode::ZERO_PAGE_Y:
	case AddressingMode::INDEXED_INDIRECT:
	case AddressingMode::INDIRECT_INDEXED:
	case AddressingMode::RELATIVE:
		return 1;
	case AddressingMode::ABSOLUTE:
	case AddressingMode::ABSOLUTE_X:
	case AddressingMode::ABSOLUTE_Y:
	case AddressingMode::INDIRECT:
		return 2;
	case AddressingMode::IMPLIED:
	case AddressingMode::ACCUMULATOR:
	case AddressingMode::UNKNOWN:
		return 0;
	}
	return 0;
}

/// Read instructions pay one extra cycle when indexing crosses a page.
/// Stores and read-modify-write instructions already include it in their base cost.
[[nodiscard]] constexpr bool has_page_cross_penalty(Mnemonic mnemonic) noexcept {
	switch (mnemonic) {
	case Mnemonic::ADC:
	case Mnemonic::AND:
	case Mnemonic::CMP:
	case Mnemonic::EOR:
	case Mnemonic::LDA:
	case Mnemonic::LDX:
	case Mnemonic::LDY:
	case Mnemonic::ORA:
	case Mnemonic::SBC:
		return true;
	default:
		return false;
	}
}

[[nodiscard]] constexpr bool is_branch(Mnemonic mnemonic) noexcept {
	switch (mnemonic) {
	case Mnemonic::BCC:
	case Mnemonic::BCS:
	case Mnemonic::BEQ:
	case Mnemonic::BMI:
	case Mnemonic::BNE:
	case Mnemonic::BPL:
	case Mnemonic::BVC:
	case Mnemonic::BVS:
		return true;
	default:
		return false;
	}
}

/// Decoded opcode: immutable description of one instruction
struct Instruction {
	Byte opcode = 0x00;
	Mnemonic mnemonic = Mnemonic::UNKNOWN;
	AddressingMode mode = AddressingMode::UNKNOWN;
	Byte length = 1; // Opcode plus operand bytes
	Byte cycles = 2; // Base cycle count before penalties

	[[nodiscard]] constexpr bool is_legal() const noexcept {
		return mnemonic != Mnemonic::UNKNOWN;
	}

	friend constexpr bool operator==(const Instruction &, const Instruction &) = default;
};

[[nodiscard]] const char *to_string(Mnemonic mnemonic) noexcept;
[[nodiscard]] const char *to_string(AddressingMode mode) noexcept;

} // namespace famicore
