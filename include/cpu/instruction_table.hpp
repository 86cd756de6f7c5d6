#pragma once

#include "core/types.hpp"
#include "cpu/instruction.hpp"
#include <array>
#include <vector>

namespace famicore {

/// Cycle cost charged for an undefined opcode (it behaves as a 1-byte NOP)
constexpr Byte UNKNOWN_OPCODE_CYCLES = 2;

namespace detail {

struct OpcodeEntry {
	Byte opcode;
	Mnemonic mnemonic;
	AddressingMode mode;
	Byte length;
	Byte cycles;
};

constexpr AddressingMode IMP = AddressingMode::IMPLIED;
constexpr AddressingMode ACC = AddressingMode::ACCUMULATOR;
constexpr AddressingMode IMM = AddressingMode::IMMEDIATE;
constexpr AddressingMode ZP0 = AddressingMode::ZERO_PAGE;
constexpr AddressingMode ZPX = AddressingMode::ZERO_PAGE_X;
constexpr AddressingMode ZPY = AddressingMode::ZERO_PAGE_Y;
constexpr AddressingMode ABS = AddressingMode::ABSOLUTE;
constexpr AddressingMode ABX = AddressingMode::ABSOLUTE_X;
constexpr AddressingMode ABY = AddressingMode::ABSOLUTE_Y;
constexpr AddressingMode IND = AddressingMode::INDIRECT;
constexpr AddressingMode IZX = AddressingMode::INDEXED_INDIRECT;
constexpr AddressingMode IZY = AddressingMode::INDIRECT_INDEXED;
constexpr AddressingMode REL = AddressingMode::RELATIVE;

// Documented NMOS 6502 opcodes: opcode, mnemonic, mode, bytes, base cycles
constexpr std::array<OpcodeEntry, 151> LEGAL_OPCODES = {{
	// ADC - Add with Carry
	{0x69, Mnemonic::ADC, IMM, 2, 2},
	{0x65, Mnemonic::ADC, ZP0, 2, 3},
	{0x75, Mnemonic::ADC, ZPX, 2, 4},
	{0x6D, Mnemonic::ADC, ABS, 3, 4},
	{0x7D, Mnemonic::ADC, ABX, 3, 4},
	{0x79, Mnemonic::ADC, ABY, 3, 4},
	{0x61, Mnemonic::ADC, IZX, 2, 6},
	{0x71, Mnemonic::ADC, IZY, 2, 5},
	// AND - Bitwise AND with Accumulator
	{0x29, Mnemonic::AND, IMM, 2, 2},
	{0x25, Mnemonic::AND, ZP0, 2, 3},
	{0x35, Mnemonic::AND, ZPX, 2, 4},
	{0x2D, Mnemonic::AND, ABS, 3, 4},
	{0x3D, Mnemonic::AND, ABX, 3, 4},
	{0x39, Mnemonic::AND, ABY, 3, 4},
	{0x21, Mnemonic::AND, IZX, 2, 6},
	{0x31, Mnemonic::AND, IZY, 2, 5},
	// ASL - Arithmetic Shift Left
	{0x0A, Mnemonic::ASL, ACC, 1, 2},
	{0x06, Mnemonic::ASL, ZP0, 2, 5},
	{0x16, Mnemonic::ASL, ZPX, 2, 6},
	{0x0E, Mnemonic::ASL, ABS, 3, 6},
	{0x1E, Mnemonic::ASL, ABX, 3, 7},
	// Branches
	{0x90, Mnemonic::BCC, REL, 2, 2},
	{0xB0, Mnemonic::BCS, REL, 2, 2},
	{0xF0, Mnemonic::BEQ, REL, 2, 2},
	{0x30, Mnemonic::BMI, REL, 2, 2},
	{0xD0, Mnemonic::BNE, REL, 2, 2},
	{0x10, Mnemonic::BPL, REL, 2, 2},
	{0x50, Mnemonic::BVC, REL, 2, 2},
	{0x70, Mnemonic::BVS, REL, 2, 2},
	// BIT - Bit Test
	{0x24, Mnemonic::BIT, ZP0, 2, 3},
	{0x2C, Mnemonic::BIT, ABS, 3, 4},
	// BRK - Force Interrupt
	{0x00, Mnemonic::BRK, IMP, 1, 7},
	// Flag clear
	{0x18, Mnemonic::CLC, IMP, 1, 2},
	{0xD8, Mnemonic::CLD, IMP, 1, 2},
	{0x58, Mnemonic::CLI, IMP, 1, 2},
	{0xB8, Mnemonic::CLV, IMP, 1, 2},
	// CMP - Compare Accumulator
	{0xC9, Mnemonic::CMP, IMM, 2, 2},
	{0xC5, Mnemonic::CMP, ZP0, 2, 3},
	{0xD5, Mnemonic::CMP, ZPX, 2, 4},
	{0xCD, Mnemonic::CMP, ABS, 3, 4},
	{0xDD, Mnemonic::CMP, ABX, 3, 4},
	{0xD9, Mnemonic::CMP, ABY, 3, 4},
	{0xC1, Mnemonic::CMP, IZX, 2, 6},
	{0xD1, Mnemonic::CMP, IZY, 2, 5},
	// CPX / CPY - Compare Index Registers
	{0xE0, Mnemonic::CPX, IMM, 2, 2},
	{0xE4, Mnemonic::CPX, ZP0, 2, 3},
	{0xEC, Mnemonic::CPX, ABS, 3, 4},
	{0xC0, Mnemonic::CPY, IMM, 2, 2},
	{0xC4, Mnemonic::CPY, ZP0, 2, 3},
	{0xCC, Mnemonic::CPY, ABS, 3, 4},
	// DEC - Decrement Memory
	{0xC6, Mnemonic::DEC, ZP0, 2, 5},
	{0xD6, Mnemonic::DEC, ZPX, 2, 6},
	{0xCE, Mnemonic::DEC, ABS, 3, 6},
	{0xDE, Mnemonic::DEC, ABX, 3, 7},
	{0xCA, Mnemonic::DEX, IMP, 1, 2},
	{0x88, Mnemonic::DEY, IMP, 1, 2},
	// EOR - Exclusive OR with Accumulator
	{0x49, Mnemonic::EOR, IMM, 2, 2},
	{0x45, Mnemonic::EOR, ZP0, 2, 3},
	{0x55, Mnemonic::EOR, ZPX, 2, 4},
	{0x4D, Mnemonic::EOR, ABS, 3, 4},
	{0x5D, Mnemonic::EOR, ABX, 3, 4},
	{0x59, Mnemonic::EOR, ABY, 3, 4},
	{0x41, Mnemonic::EOR, IZX, 2, 6},
	{0x51, Mnemonic::EOR, IZY, 2, 5},
	// INC - Increment Memory
	{0xE6, Mnemonic::INC, ZP0, 2, 5},
	{0xF6, Mnemonic::INC, ZPX, 2, 6},
	{0xEE, Mnemonic::INC, ABS, 3, 6},
	{0xFE, Mnemonic::INC, ABX, 3, 7},
	{0xE8, Mnemonic::INX, IMP, 1, 2},
	{0xC8, Mnemonic::INY, IMP, 1, 2},
	// Jumps and subroutines
	{0x4C, Mnemonic::JMP, ABS, 3, 3},
	{0x6C, Mnemonic::JMP, IND, 3, 5},
	{0x20, Mnemonic::JSR, ABS, 3, 6},
	// LDA - Load Accumulator
	{0xA9, Mnemonic::LDA, IMM, 2, 2},
	{0xA5, Mnemonic::LDA, ZP0, 2, 3},
	{0xB5, Mnemonic::LDA, ZPX, 2, 4},
	{0xAD, Mnemonic::LDA, ABS, 3, 4},
	{0xBD, Mnemonic::LDA, ABX, 3, 4},
	{0xB9, Mnemonic::LDA, ABY, 3, 4},
	{0xA1, Mnemonic::LDA, IZX, 2, 6},
	{0xB1, Mnemonic::LDA, IZY, 2, 5},
	// LDX - Load X Register
	{0xA2, Mnemonic::LDX, IMM, 2, 2},
	{0xA6, Mnemonic::LDX, ZP0, 2, 3},
	{0xB6, Mnemonic::LDX, ZPY, 2, 4},
	{0xAE, Mnemonic::LDX, ABS, 3, 4},
	{0xBE, Mnemonic::LDX, ABY, 3, 4},
	// LDY - Load Y Register
	{0xA0, Mnemonic::LDY, IMM, 2, 2},
	{0xA4, Mnemonic::LDY, ZP0, 2, 3},
	{0xB4, Mnemonic::LDY, ZPX, 2, 4},
	{0xAC, Mnemonic::LDY, ABS, 3, 4},
	{0xBC, Mnemonic::LDY, ABX, 3, 4},
	// LSR - Logical Shift Right
	{0x4A, Mnemonic::LSR, ACC, 1, 2},
	{0x46, Mnemonic::LSR, ZP0, 2, 5},
	{0x56, Mnemonic::LSR, ZPX, 2, 6},
	{0x4E, Mnemonic::LSR, ABS, 3, 6},
	{0x5E, Mnemonic::LSR, ABX, 3, 7},
	{0xEA, Mnemonic::NOP, IMP, 1, 2},
	// ORA - Bitwise OR with Accumulator
	{0x09, Mnemonic::ORA, IMM, 2, 2},
	{0x05, Mnemonic::ORA, ZP0, 2, 3},
	{0x15, Mnemonic::ORA, ZPX, 2, 4},
	{0x0D, Mnemonic::ORA, ABS, 3, 4},
	{0x1D, Mnemonic::ORA, ABX, 3, 4},
	{0x19, Mnemonic::ORA, ABY, 3, 4},
	{0x01, Mnemonic::ORA, IZX, 2, 6},
	{0x11, Mnemonic::ORA, IZY, 2, 5},
	// Stack
	{0x48, Mnemonic::PHA, IMP, 1, 3},
	{0x08, Mnemonic::PHP, IMP, 1, 3},
	{0x68, Mnemonic::PLA, IMP, 1, 4},
	{0x28, Mnemonic::PLP, IMP, 1, 4},
	// ROL - Rotate Left
	{0x2A, Mnemonic::ROL, ACC, 1, 2},
	{0x26, Mnemonic::ROL, ZP0, 2, 5},
	{0x36, Mnemonic::ROL, ZPX, 2, 6},
	{0x2E, Mnemonic::ROL, ABS, 3, 6},
	{0x3E, Mnemonic::ROL, ABX, 3, 7},
	// ROR - Rotate Right
	{0x6A, Mnemonic::ROR, ACC, 1, 2},
	{0x66, Mnemonic::ROR, ZP0, 2, 5},
	{0x76, Mnemonic::ROR, ZPX, 2, 6},
	{0x6E, Mnemonic::ROR, ABS, 3, 6},
	{0x7E, Mnemonic::ROR, ABX, 3, 7},
	// Returns
	{0x40, Mnemonic::RTI, IMP, 1, 6},
	{0x60, Mnemonic::RTS, IMP, 1, 6},
	// SBC - Subtract with Carry
	{0xE9, Mnemonic::SBC, IMM, 2, 2},
	{0xE5, Mnemonic::SBC, ZP0, 2, 3},
	{0xF5, Mnemonic::SBC, ZPX, 2, 4},
	{0xED, Mnemonic::SBC, ABS, 3, 4},
	{0xFD, Mnemonic::SBC, ABX, 3, 4},
	{0xF9, Mnemonic::SBC, ABY, 3, 4},
	{0xE1, Mnemonic::SBC, IZX, 2, 6},
	{0xF1, Mnemonic::SBC, IZY, 2, 5},
	// Flag set
	{0x38, Mnemonic::SEC, IMP, 1, 2},
	{0xF8, Mnemonic::SED, IMP, 1, 2},
	{0x78, Mnemonic::SEI, IMP, 1, 2},
	// STA - Store Accumulator
	{0x85, Mnemonic::STA, ZP0, 2, 3},
	{0x95, Mnemonic::STA, ZPX, 2, 4},
	{0x8D, Mnemonic::STA, ABS, 3, 4},
	{0x9D, Mnemonic::STA, ABX, 3, 5},
	{0x99, Mnemonic::STA, ABY, 3, 5},
	{0x81, Mnemonic::STA, IZX, 2, 6},
	{0x91, Mnemonic::STA, IZY, 2, 6},
	// STX / STY - Store Index Registers
	{0x86, Mnemonic::STX, ZP0, 2, 3},
	{0x96, Mnemonic::STX, ZPY, 2, 4},
	{0x8E, Mnemonic::STX, ABS, 3, 4},
	{0x84, Mnemonic::STY, ZP0, 2, 3},
	{0x94, Mnemonic::STY, ZPX, 2, 4},
	{0x8C, Mnemonic::STY, ABS, 3, 4},
	// Register transfers
	{0xAA, Mnemonic::TAX, IMP, 1, 2},
	{0xA8, Mnemonic::TAY, IMP, 1, 2},
	{0xBA, Mnemonic::TSX, IMP, 1, 2},
	{0x8A, Mnemonic::TXA, IMP, 1, 2},
	{0x9A, Mnemonic::TXS, IMP, 1, 2},
	{0x98, Mnemonic::TYA, IMP, 1, 2},
}};

constexpr std::array<Instruction, 256> build_instruction_table() noexcept {
	std::array<Instruction, 256> table{};
	for (std::size_t i = 0; i < table.size(); ++i) {
		table[i] = Instruction{static_cast<Byte>(i), Mnemonic::UNKNOWN, AddressingMode::UNKNOWN, 1,
							   UNKNOWN_OPCODE_CYCLES};
	}
	for (const auto &entry : LEGAL_OPCODES) {
		table[entry.opcode] = Instruction{entry.opcode, entry.mnemonic, entry.mode, entry.length, entry.cycles};
	}
	return table;
}

constexpr bool lengths_match_modes(const std::array<Instruction, 256> &table) noexcept {
	for (const auto &instruction : table) {
		if (instruction.length != 1 + operand_byte_count(instruction.mode)) {
			return false;
		}
	}
	return true;
}

constexpr bool opcodes_are_unique() noexcept {
	for (std::size_t i = 0; i < LEGAL_OPCODES.size(); ++i) {
		for (std::size_t j = i + 1; j < LEGAL_OPCODES.size(); ++j) {
			if (LEGAL_OPCODES[i].opcode == LEGAL_OPCODES[j].opcode) {
				return false;
			}
		}
	}
	return true;
}

} // namespace detail

/// Opcode byte -> instruction, all 256 entries
inline constexpr std::array<Instruction, 256> INSTRUCTION_TABLE = detail::build_instruction_table();

static_assert(detail::opcodes_are_unique(), "duplicate opcode in the 6502 instruction table");
static_assert(detail::lengths_match_modes(INSTRUCTION_TABLE),
			  "instruction length disagrees with its addressing mode");

/// Decode an opcode byte. Total: undefined opcodes come back as UNKNOWN.
[[nodiscard]] constexpr Instruction decode(Byte opcode) noexcept {
	return INSTRUCTION_TABLE[opcode];
}

[[nodiscard]] constexpr bool is_legal_opcode(Byte opcode) noexcept {
	return INSTRUCTION_TABLE[opcode].is_legal();
}

/// Opcodes whose table entry is internally inconsistent (empty for a correct table)
[[nodiscard]] std::vector<Byte> validate_instruction_table();

} // namespace famicore
