#include "cpu/disassembler.hpp"
#include "cpu/instruction_table.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace famicore {

namespace {

DisassembledInstruction make_entry(Address address, const Instruction &instruction) {
	DisassembledInstruction entry;
	entry.address = address;
	entry.opcode = instruction.opcode;
	entry.mnemonic = instruction.mnemonic;
	entry.mode = instruction.mode;
	entry.length = instruction.length;
	entry.cycles = instruction.cycles;
	return entry;
}

std::string hex(unsigned value, int width) {
	std::ostringstream out;
	out << '$' << std::hex << std::uppercase << std::setfill('0') << std::setw(width) << value;
	return out.str();
}

} // anonymous namespace

Word DisassembledInstruction::operand_value() const noexcept {
	if (operands.empty()) {
		return 0;
	}
	if (operands.size() == 1) {
		return operands[0];
	}
	return make_word(operands[0], operands[1]);
}

Address DisassembledInstruction::branch_target() const noexcept {
	auto offset = static_cast<SignedByte>(operands.empty() ? 0 : operands[0]);
	return static_cast<Address>(address + length + offset);
}

DisassembledInstruction disassemble_at(const MemoryInterface &memory, Address address) {
	DisassembledInstruction entry = make_entry(address, decode(memory.peek(address)));
	for (Byte i = 1; i < entry.length; ++i) {
		entry.operands.push_back(memory.peek(static_cast<Address>(address + i)));
	}
	return entry;
}

std::vector<DisassembledInstruction> disassemble(std::span<const Byte> program, Address origin) {
	std::vector<DisassembledInstruction> listing;
	std::size_t offset = 0;

	while (offset < program.size()) {
		Instruction instruction = decode(program[offset]);
		if (offset + instruction.length > program.size()) {
			// Not enough bytes left for the operands
			instruction = Instruction{program[offset], Mnemonic::UNKNOWN, AddressingMode::UNKNOWN, 1,
									  UNKNOWN_OPCODE_CYCLES};
		}

		DisassembledInstruction entry = make_entry(static_cast<Address>(origin + offset), instruction);
		entry.operands.assign(program.begin() + static_cast<std::ptrdiff_t>(offset + 1),
							  program.begin() + static_cast<std::ptrdiff_t>(offset + instruction.length));
		listing.push_back(std::move(entry));

		offset += instruction.length;
	}

	return listing;
}

std::string format_operand(const DisassembledInstruction &instruction) {
	const Word value = instruction.operand_value();

	switch (instruction.mode) {
	case AddressingMode::IMPLIED:
		return "";
	case AddressingMode::ACCUMULATOR:
		return "A";
	case AddressingMode::IMMEDIATE:
		return "#" + hex(value, 2);
	case AddressingMode::ZERO_PAGE:
		return hex(value, 2);
	case AddressingMode::ZERO_PAGE_X:
		return hex(value, 2) + ",X";
	case AddressingMode::ZERO_PAGE_Y:
		return hex(value, 2) + ",Y";
	case AddressingMode::ABSOLUTE:
		return hex(value, 4);
	case AddressingMode::ABSOLUTE_X:
		return hex(value, 4) + ",X";
	case AddressingMode::ABSOLUTE_Y:
		return hex(value, 4) + ",Y";
	case AddressingMode::INDIRECT:
		return "(" + hex(value, 4) + ")";
	case AddressingMode::INDEXED_INDIRECT:
		return "(" + hex(value, 2) + ",X)";
	case AddressingMode::INDIRECT_INDEXED:
		return "(" + hex(value, 2) + "),Y";
	case AddressingMode::RELATIVE:
		return hex(instruction.branch_target(), 4);
	case AddressingMode::UNKNOWN:
		return hex(instruction.opcode, 2);
	}
	return "";
}

std::string format_disassembly(const DisassembledInstruction &instruction) {
	std::ostringstream out;
	out << hex(instruction.address, 4) << "  ";

	// Raw bytes, padded to three columns
	std::ostringstream bytes;
	bytes << std::hex << std::uppercase << std::setfill('0') << std::setw(2) << static_cast<int>(instruction.opcode);
	for (Byte operand : instruction.operands) {
		bytes << ' ' << std::setw(2) << static_cast<int>(operand);
	}
	out << std::left << std::setfill(' ') << std::setw(10) << bytes.str();

	if (instruction.mnemonic == Mnemonic::UNKNOWN) {
		out << ".byte " << format_operand(instruction);
		return out.str();
	}

	out << to_string(instruction.mnemonic);
	std::string operand = format_operand(instruction);
	if (!operand.empty()) {
		out << ' ' << operand;
	}
	return out.str();
}

} // namespace famicore
