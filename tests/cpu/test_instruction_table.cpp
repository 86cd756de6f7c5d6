// Famicore - NES CPU Core
// Instruction Table Tests
// Decode coverage, documented opcode metadata and table consistency

#include "../../include/cpu/instruction.hpp"
#include "../../include/cpu/instruction_table.hpp"
#include <catch2/catch_all.hpp>
#include <iterator>
#include <set>
#include <string>

using namespace famicore;

namespace {

struct GoldenEntry {
	Byte opcode;
	const char *mnemonic;
	AddressingMode mode;
	int length;
	int cycles;
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

// Published NMOS 6502 reference values, in opcode order
const GoldenEntry GOLDEN_OPCODES[] = {
	{0x00, "BRK", IMP, 1, 7},
	{0x01, "ORA", IZX, 2, 6},
	{0x05, "ORA", ZP0, 2, 3},
	{0x06, "ASL", ZP0, 2, 5},
	{0x08, "PHP", IMP, 1, 3},
	{0x09, "ORA", IMM, 2, 2},
	{0x0A, "ASL", ACC, 1, 2},
	{0x0D, "ORA", ABS, 3, 4},
	{0x0E, "ASL", ABS, 3, 6},
	{0x10, "BPL", REL, 2, 2},
	{0x11, "ORA", IZY, 2, 5},
	{0x15, "ORA", ZPX, 2, 4},
	{0x16, "ASL", ZPX, 2, 6},
	{0x18, "CLC", IMP, 1, 2},
	{0x19, "ORA", ABY, 3, 4},
	{0x1D, "ORA", ABX, 3, 4},
	{0x1E, "ASL", ABX, 3, 7},
	{0x20, "JSR", ABS, 3, 6},
	{0x21, "AND", IZX, 2, 6},
	{0x24, "BIT", ZP0, 2, 3},
	{0x25, "AND", ZP0, 2, 3},
	{0x26, "ROL", ZP0, 2, 5},
	{0x28, "PLP", IMP, 1, 4},
	{0x29, "AND", IMM, 2, 2},
	{0x2A, "ROL", ACC, 1, 2},
	{0x2C, "BIT", ABS, 3, 4},
	{0x2D, "AND", ABS, 3, 4},
	{0x2E, "ROL", ABS, 3, 6},
	{0x30, "BMI", REL, 2, 2},
	{0x31, "AND", IZY, 2, 5},
	{0x35, "AND", ZPX, 2, 4},
	{0x36, "ROL", ZPX, 2, 6},
	{0x38, "SEC", IMP, 1, 2},
	{0x39, "AND", ABY, 3, 4},
	{0x3D, "AND", ABX, 3, 4},
	{0x3E, "ROL", ABX, 3, 7},
	{0x40, "RTI", IMP, 1, 6},
	{0x41, "EOR", IZX, 2, 6},
	{0x45, "EOR", ZP0, 2, 3},
	{0x46, "LSR", ZP0, 2, 5},
	{0x48, "PHA", IMP, 1, 3},
	{0x49, "EOR", IMM, 2, 2},
	{0x4A, "LSR", ACC, 1, 2},
	{0x4C, "JMP", ABS, 3, 3},
	{0x4D, "EOR", ABS, 3, 4},
	{0x4E, "LSR", ABS, 3, 6},
	{0x50, "BVC", REL, 2, 2},
	{0x51, "EOR", IZY, 2, 5},
	{0x55, "EOR", ZPX, 2, 4},
	{0x56, "LSR", ZPX, 2, 6},
	{0x58, "CLI", IMP, 1, 2},
	{0x59, "EOR", ABY, 3, 4},
	{0x5D, "EOR", ABX, 3, 4},
	{0x5E, "LSR", ABX, 3, 7},
	{0x60, "RTS", IMP, 1, 6},
	{0x61, "ADC", IZX, 2, 6},
	{0x65, "ADC", ZP0, 2, 3},
	{0x66, "ROR", ZP0, 2, 5},
	{0x68, "PLA", IMP, 1, 4},
	{0x69, "ADC", IMM, 2, 2},
	{0x6A, "ROR", ACC, 1, 2},
	{0x6C, "JMP", IND, 3, 5},
	{0x6D, "ADC", ABS, 3, 4},
	{0x6E, "ROR", ABS, 3, 6},
	{0x70, "BVS", REL, 2, 2},
	{0x71, "ADC", IZY, 2, 5},
	{0x75, "ADC", ZPX, 2, 4},
	{0x76, "ROR", ZPX, 2, 6},
	{0x78, "SEI", IMP, 1, 2},
	{0x79, "ADC", ABY, 3, 4},
	{0x7D, "ADC", ABX, 3, 4},
	{0x7E, "ROR", ABX, 3, 7},
	{0x81, "STA", IZX, 2, 6},
	{0x84, "STY", ZP0, 2, 3},
	{0x85, "STA", ZP0, 2, 3},
	{0x86, "STX", ZP0, 2, 3},
	{0x88, "DEY", IMP, 1, 2},
	{0x8A, "TXA", IMP, 1, 2},
	{0x8C, "STY", ABS, 3, 4},
	{0x8D, "STA", ABS, 3, 4},
	{0x8E, "STX", ABS, 3, 4},
	{0x90, "BCC", REL, 2, 2},
	{0x91, "STA", IZY, 2, 6},
	{0x94, "STY", ZPX, 2, 4},
	{0x95, "STA", ZPX, 2, 4},
	{0x96, "STX", ZPY, 2, 4},
	{0x98, "TYA", IMP, 1, 2},
	{0x99, "STA", ABY, 3, 5},
	{0x9A, "TXS", IMP, 1, 2},
	{0x9D, "STA", ABX, 3, 5},
	{0xA0, "LDY", IMM, 2, 2},
	{0xA1, "LDA", IZX, 2, 6},
	{0xA2, "LDX", IMM, 2, 2},
	{0xA4, "LDY", ZP0, 2, 3},
	{0xA5, "LDA", ZP0, 2, 3},
	{0xA6, "LDX", ZP0, 2, 3},
	{0xA8, "TAY", IMP, 1, 2},
	{0xA9, "LDA", IMM, 2, 2},
	{0xAA, "TAX", IMP, 1, 2},
	{0xAC, "LDY", ABS, 3, 4},
	{0xAD, "LDA", ABS, 3, 4},
	{0xAE, "LDX", ABS, 3, 4},
	{0xB0, "BCS", REL, 2, 2},
	{0xB1, "LDA", IZY, 2, 5},
	{0xB4, "LDY", ZPX, 2, 4},
	{0xB5, "LDA", ZPX, 2, 4},
	{0xB6, "LDX", ZPY, 2, 4},
	{0xB8, "CLV", IMP, 1, 2},
	{0xB9, "LDA", ABY, 3, 4},
	{0xBA, "TSX", IMP, 1, 2},
	{0xBC, "LDY", ABX, 3, 4},
	{0xBD, "LDA", ABX, 3, 4},
	{0xBE, "LDX", ABY, 3, 4},
	{0xC0, "CPY", IMM, 2, 2},
	{0xC1, "CMP", IZX, 2, 6},
	{0xC4, "CPY", ZP0, 2, 3},
	{0xC5, "CMP", ZP0, 2, 3},
	{0xC6, "DEC", ZP0, 2, 5},
	{0xC8, "INY", IMP, 1, 2},
	{0xC9, "CMP", IMM, 2, 2},
	{0xCA, "DEX", IMP, 1, 2},
	{0xCC, "CPY", ABS, 3, 4},
	{0xCD, "CMP", ABS, 3, 4},
	{0xCE, "DEC", ABS, 3, 6},
	{0xD0, "BNE", REL, 2, 2},
	{0xD1, "CMP", IZY, 2, 5},
	{0xD5, "CMP", ZPX, 2, 4},
	{0xD6, "DEC", ZPX, 2, 6},
	{0xD8, "CLD", IMP, 1, 2},
	{0xD9, "CMP", ABY, 3, 4},
	{0xDD, "CMP", ABX, 3, 4},
	{0xDE, "DEC", ABX, 3, 7},
	{0xE0, "CPX", IMM, 2, 2},
	{0xE1, "SBC", IZX, 2, 6},
	{0xE4, "CPX", ZP0, 2, 3},
	{0xE5, "SBC", ZP0, 2, 3},
	{0xE6, "INC", ZP0, 2, 5},
	{0xE8, "INX", IMP, 1, 2},
	{0xE9, "SBC", IMM, 2, 2},
	{0xEA, "NOP", IMP, 1, 2},
	{0xEC, "CPX", ABS, 3, 4},
	{0xED, "SBC", ABS, 3, 4},
	{0xEE, "INC", ABS, 3, 6},
	{0xF0, "BEQ", REL, 2, 2},
	{0xF1, "SBC", IZY, 2, 5},
	{0xF5, "SBC", ZPX, 2, 4},
	{0xF6, "INC", ZPX, 2, 6},
	{0xF8, "SED", IMP, 1, 2},
	{0xF9, "SBC", ABY, 3, 4},
	{0xFD, "SBC", ABX, 3, 4},
	{0xFE, "INC", ABX, 3, 7},
};

} // anonymous namespace

TEST_CASE("Decode Is Total", "[cpu][decode]") {
	for (int opcode = 0; opcode < 256; ++opcode) {
		Instruction instruction = decode(static_cast<Byte>(opcode));
		INFO("opcode " << opcode);
		REQUIRE(instruction.opcode == opcode);
		REQUIRE(instruction.length >= 1);
		REQUIRE(instruction.length <= 3);
		REQUIRE(instruction.cycles >= 2);
		REQUIRE(instruction.cycles <= 7);
	}
}

TEST_CASE("Documented Opcodes Match Reference", "[cpu][decode][golden]") {
	REQUIRE(std::size(GOLDEN_OPCODES) == 151);

	for (const auto &expected : GOLDEN_OPCODES) {
		Instruction instruction = decode(expected.opcode);
		INFO("opcode " << static_cast<int>(expected.opcode));
		REQUIRE(instruction.is_legal());
		REQUIRE(std::string(to_string(instruction.mnemonic)) == expected.mnemonic);
		REQUIRE(instruction.mode == expected.mode);
		REQUIRE(instruction.length == expected.length);
		REQUIRE(instruction.cycles == expected.cycles);
	}
}

TEST_CASE("Undocumented Opcodes Decode As Unknown", "[cpu][decode]") {
	std::set<Byte> documented;
	for (const auto &entry : GOLDEN_OPCODES) {
		documented.insert(entry.opcode);
	}

	int unknown_count = 0;
	for (int opcode = 0; opcode < 256; ++opcode) {
		auto byte = static_cast<Byte>(opcode);
		if (documented.contains(byte)) {
			continue;
		}
		Instruction instruction = decode(byte);
		INFO("opcode " << opcode);
		REQUIRE_FALSE(instruction.is_legal());
		REQUIRE_FALSE(is_legal_opcode(byte));
		REQUIRE(instruction.mode == AddressingMode::UNKNOWN);
		REQUIRE(instruction.length == 1);
		REQUIRE(instruction.cycles == UNKNOWN_OPCODE_CYCLES);
		unknown_count++;
	}
	REQUIRE(unknown_count == 105);

	SECTION("Common undocumented opcodes") {
		REQUIRE(decode(0x02).mnemonic == Mnemonic::UNKNOWN);
		REQUIRE(decode(0xFF).mnemonic == Mnemonic::UNKNOWN);
		REQUIRE(decode(0x1A).mnemonic == Mnemonic::UNKNOWN);
	}
}

TEST_CASE("Instruction Table Consistency", "[cpu][decode]") {
	SECTION("Runtime validation finds nothing") {
		REQUIRE(validate_instruction_table().empty());
	}

	SECTION("All 56 mnemonics are reachable") {
		std::set<Mnemonic> mnemonics;
		for (const auto &instruction : INSTRUCTION_TABLE) {
			if (instruction.is_legal()) {
				mnemonics.insert(instruction.mnemonic);
			}
		}
		REQUIRE(mnemonics.size() == 56);
	}

	SECTION("Length follows the addressing mode") {
		for (const auto &instruction : INSTRUCTION_TABLE) {
			REQUIRE(instruction.length == 1 + operand_byte_count(instruction.mode));
		}
	}

	SECTION("Decode is usable at compile time") {
		STATIC_REQUIRE(decode(0xA9).mnemonic == Mnemonic::LDA);
		STATIC_REQUIRE(decode(0xA9).mode == AddressingMode::IMMEDIATE);
		STATIC_REQUIRE(!is_legal_opcode(0x02));
	}
}

TEST_CASE("Mnemonic And Mode Names", "[cpu][decode]") {
	REQUIRE(std::string(to_string(Mnemonic::LDA)) == "LDA");
	REQUIRE(std::string(to_string(Mnemonic::UNKNOWN)) == "???");
	REQUIRE(std::string(to_string(AddressingMode::ZERO_PAGE_X)) == "Zero Page,X");
	REQUIRE(std::string(to_string(AddressingMode::INDEXED_INDIRECT)) == "(Indirect,X)");
	REQUIRE(std::string(to_string(AddressingMode::INDIRECT_INDEXED)) == "(Indirect),Y");
}

TEST_CASE("Page Cross Penalty Classification", "[cpu][decode]") {
	for (Mnemonic mnemonic : {Mnemonic::ADC, Mnemonic::AND, Mnemonic::CMP, Mnemonic::EOR, Mnemonic::LDA,
							  Mnemonic::LDX, Mnemonic::LDY, Mnemonic::ORA, Mnemonic::SBC}) {
		REQUIRE(has_page_cross_penalty(mnemonic));
	}
	for (Mnemonic mnemonic : {Mnemonic::STA, Mnemonic::INC, Mnemonic::ASL, Mnemonic::BIT, Mnemonic::JMP}) {
		REQUIRE_FALSE(has_page_cross_penalty(mnemonic));
	}
	REQUIRE(is_branch(Mnemonic::BNE));
	REQUIRE_FALSE(is_branch(Mnemonic::JMP));
}
