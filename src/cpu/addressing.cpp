#include "cpu/addressing.hpp"
#include <cassert>

namespace famicore {

namespace {

Byte fetch_byte(CpuRegisters &registers, MemoryInterface &memory) {
	Byte value = memory.read(registers.pc);
	registers.pc++;
	return value;
}

Address fetch_word(CpuRegisters &registers, MemoryInterface &memory) {
	Byte low = fetch_byte(registers, memory);
	Byte high = fetch_byte(registers, memory);
	return make_word(low, high);
}

/// 16-bit pointer stored in zero page; the high byte wraps to $00 rather than $0100
Address read_zero_page_pointer(Byte zp_address, MemoryInterface &memory) {
	Byte low = memory.read(zp_address);
	Byte high = memory.read(static_cast<Byte>(zp_address + 1));
	return make_word(low, high);
}

EffectiveOperand memory_operand(Address address, bool page_crossed = false) {
	return EffectiveOperand{.kind = OperandKind::MEMORY, .address = address, .value = 0, .page_crossed = page_crossed};
}

ResolvedOperand indexed_absolute(CpuRegisters &registers, MemoryInterface &memory, Byte index) {
	Address base = fetch_word(registers, memory);
	auto effective = static_cast<Address>(base + index);
	bool crossed = crosses_page(base, effective);
	return {memory_operand(effective, crossed), 2, static_cast<Byte>(crossed ? 1 : 0)};
}

} // anonymous namespace

ResolvedOperand resolve(AddressingMode mode, CpuRegisters &registers, MemoryInterface &memory) {
	switch (mode) {
	case AddressingMode::IMPLIED:
	case AddressingMode::UNKNOWN:
		return {EffectiveOperand{}, 0, 0};

	case AddressingMode::ACCUMULATOR:
		return {EffectiveOperand{.kind = OperandKind::ACCUMULATOR}, 0, 0};

	case AddressingMode::IMMEDIATE: {
		Address literal_address = registers.pc;
		Byte literal = fetch_byte(registers, memory);
		return {EffectiveOperand{.kind = OperandKind::IMMEDIATE, .address = literal_address, .value = literal}, 1, 0};
	}

	case AddressingMode::ZERO_PAGE:
		return {memory_operand(fetch_byte(registers, memory)), 1, 0};

	case AddressingMode::ZERO_PAGE_X: {
		// Index wraps within page zero
		Byte base = fetch_byte(registers, memory);
		return {memory_operand(static_cast<Byte>(base + registers.x)), 1, 0};
	}

	case AddressingMode::ZERO_PAGE_Y: {
		Byte base = fetch_byte(registers, memory);
		return {memory_operand(static_cast<Byte>(base + registers.y)), 1, 0};
	}

	case AddressingMode::ABSOLUTE:
		return {memory_operand(fetch_word(registers, memory)), 2, 0};

	case AddressingMode::ABSOLUTE_X:
		return indexed_absolute(registers, memory, registers.x);

	case AddressingMode::ABSOLUTE_Y:
		return indexed_absolute(registers, memory, registers.y);

	case AddressingMode::INDIRECT: {
		// JMP ($xxFF) fetches the high byte from $xx00, not the next page
		Address pointer = fetch_word(registers, memory);
		Address high_address = static_cast<Address>((pointer & 0xFF00) | static_cast<Byte>(pointer + 1));
		Byte low = memory.read(pointer);
		Byte high = memory.read(high_address);
		return {memory_operand(make_word(low, high)), 2, 0};
	}

	case AddressingMode::INDEXED_INDIRECT: {
		Byte zp = fetch_byte(registers, memory);
		Address target = read_zero_page_pointer(static_cast<Byte>(zp + registers.x), memory);
		return {memory_operand(target), 1, 0};
	}

	case AddressingMode::INDIRECT_INDEXED: {
		Byte zp = fetch_byte(registers, memory);
		Address base = read_zero_page_pointer(zp, memory);
		auto effective = static_cast<Address>(base + registers.y);
		bool crossed = crosses_page(base, effective);
		return {memory_operand(effective, crossed), 1, static_cast<Byte>(crossed ? 1 : 0)};
	}

	case AddressingMode::RELATIVE: {
		// Offset is relative to the address after the branch instruction
		auto offset = static_cast<SignedByte>(fetch_byte(registers, memory));
		auto target = static_cast<Address>(registers.pc + offset);
		// Taken/crossed penalties depend on the branch outcome, charged by the executor
		return {memory_operand(target, crosses_page(registers.pc, target)), 1, 0};
	}
	}

	return {EffectiveOperand{}, 0, 0};
}

Byte read_operand(const EffectiveOperand &operand, const CpuRegisters &registers, MemoryInterface &memory) {
	switch (operand.kind) {
	case OperandKind::ACCUMULATOR:
		return registers.a;
	case OperandKind::IMMEDIATE:
		return operand.value;
	case OperandKind::MEMORY:
		return memory.read(operand.address);
	case OperandKind::NONE:
		break;
	}
	assert(false && "read through an implied operand");
	return 0;
}

void write_operand(const EffectiveOperand &operand, CpuRegisters &registers, MemoryInterface &memory, Byte value) {
	switch (operand.kind) {
	case OperandKind::ACCUMULATOR:
		registers.a = value;
		return;
	case OperandKind::MEMORY:
		memory.write(operand.address, value);
		return;
	case OperandKind::IMMEDIATE:
		assert(false && "write through an immediate operand");
		return;
	case OperandKind::NONE:
		assert(false && "write through an implied operand");
		return;
	}
}

} // namespace famicore
