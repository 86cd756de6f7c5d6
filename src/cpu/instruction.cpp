#include "cpu/instruction.hpp"
#include "cpu/instruction_table.hpp"

namespace famicore {

const char *to_string(Mnemonic mnemonic) noexcept {
	switch (mnemonic) {
	case Mnemonic::LDA: return "LDA";
	case Mnemonic::LDX: return "LDX";
	case Mnemonic::LDY: return "LDY";
	case Mnemonic::STA: return "STA";
	case Mnemonic::STX: return "STX";
	case Mnemonic::STY: return "STY";
	case Mnemonic::TAX: return "TAX";
	case Mnemonic::TAY: return "TAY";
	case Mnemonic::TSX: return "TSX";
	case Mnemonic::TXA: return "TXA";
	case Mnemonic::TXS: return "TXS";
	case Mnemonic::TYA: return "TYA";
	case Mnemonic::ADC: return "ADC";
	case Mnemonic::SBC: return "SBC";
	case Mnemonic::INC: return "INC";
	case Mnemonic::INX: return "INX";
	case Mnemonic::INY: return "INY";
	case Mnemonic::DEC: return "DEC";
	case Mnemonic::DEX: return "DEX";
	case Mnemonic::DEY: return "DEY";
	case Mnemonic::AND: return "AND";
	case Mnemonic::ORA: return "ORA";
	case Mnemonic::EOR: return "EOR";
	case Mnemonic::BIT: return "BIT";
	case Mnemonic::ASL: return "ASL";
	case Mnemonic::LSR: return "LSR";
	case Mnemonic::ROL: return "ROL";
	case Mnemonic::ROR: return "ROR";
	case Mnemonic::BCC: return "BCC";
	case Mnemonic::BCS: return "BCS";
	case Mnemonic::BEQ: return "BEQ";
	case Mnemonic::BMI: return "BMI";
	case Mnemonic::BNE: return "BNE";
	case Mnemonic::BPL: return "BPL";
	case Mnemonic::BVC: return "BVC";
	case Mnemonic::BVS: return "BVS";
	case Mnemonic::JMP: return "JMP";
	case Mnemonic::JSR: return "JSR";
	case Mnemonic::RTS: return "RTS";
	case Mnemonic::RTI: return "RTI";
	case Mnemonic::BRK: return "BRK";
	case Mnemonic::CMP: return "CMP";
	case Mnemonic::CPX: return "CPX";
	case Mnemonic::CPY: return "CPY";
	case Mnemonic::CLC: return "CLC";
	case Mnemonic::CLD: return "CLD";
	case Mnemonic::CLI: return "CLI";
	case Mnemonic::CLV: return "CLV";
	case Mnemonic::SEC: return "SEC";
	case Mnemonic::SED: return "SED";
	case Mnemonic::SEI: return "SEI";
	case Mnemonic::PHA: return "PHA";
	case Mnemonic::PHP: return "PHP";
	case Mnemonic::PLA: return "PLA";
	case Mnemonic::PLP: return "PLP";
	case Mnemonic::NOP: return "NOP";
	case Mnemonic::UNKNOWN: return "???";
	}
	return "???";
}

const char *to_string(AddressingMode mode) noexcept {
	switch (mode) {
	case AddressingMode::IMPLIED: return "Implied";
	case AddressingMode::ACCUMULATOR: return "Accumulator";
	case AddressingMode::IMMEDIATE: return "Immediate";
	case AddressingMode::ZERO_PAGE: return "Zero Page";
	case AddressingMode::ZERO_PAGE_X: return "Zero Page,X";
	case AddressingMode::ZERO_PAGE_Y: return "Zero Page,Y";
	case AddressingMode::ABSOLUTE: return "Absolute";
	case AddressingMode::ABSOLUTE_X: return "Absolute,X";
	case AddressingMode::ABSOLUTE_Y: return "Absolute,Y";
	case AddressingMode::INDIRECT: return "Indirect";
	case AddressingMode::INDEXED_INDIRECT: return "(Indirect,X)";
	case AddressingMode::INDIRECT_INDEXED: return "(Indirect),Y";
	case AddressingMode::RELATIVE: return "Relative";
	case AddressingMode::UNKNOWN: return "Unknown";
	}
	return "Unknown";
}

std::vector<Byte> validate_instruction_table() {
	std::vector<Byte> bad_opcodes;

	for (std::size_t i = 0; i < INSTRUCTION_TABLE.size(); ++i) {
		const Instruction &instruction = INSTRUCTION_TABLE[i];
		bool consistent = instruction.opcode == i &&
						  instruction.length == 1 + operand_byte_count(instruction.mode) &&
						  instruction.cycles >= 2 && instruction.cycles <= 7;

		// Mnemonic and mode are either both defined or both UNKNOWN
		consistent = consistent &&
					 (instruction.mnemonic == Mnemonic::UNKNOWN) == (instruction.mode == AddressingMode::UNKNOWN);

		if (!consistent) {
			bad_opcodes.push_back(static_cast<Byte>(i));
		}
	}

	return bad_opcodes;
}

} // namespace famicore
