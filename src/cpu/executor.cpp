#include "cpu/executor.hpp"
#include "cpu/interrupts.hpp"

namespace famicore {

namespace {

// Read-modify-write helpers: return the new value and update C/Z/N
Byte shift_left(StatusRegister &p, Byte value, bool carry_in) noexcept {
	p.set_carry((value & 0x80) != 0);
	auto result = static_cast<Byte>((value << 1) | (carry_in ? 0x01 : 0x00));
	p.update_zero_negative(result);
	return result;
}

Byte shift_right(StatusRegister &p, Byte value, bool carry_in) noexcept {
	p.set_carry((value & 0x01) != 0);
	auto result = static_cast<Byte>((value >> 1) | (carry_in ? 0x80 : 0x00));
	p.update_zero_negative(result);
	return result;
}

bool branch_condition(Mnemonic mnemonic, const StatusRegister &p) noexcept {
	switch (mnemonic) {
	case Mnemonic::BCC:
		return !p.carry();
	case Mnemonic::BCS:
		return p.carry();
	case Mnemonic::BEQ:
		return p.zero();
	case Mnemonic::BMI:
		return p.negative();
	case Mnemonic::BNE:
		return !p.zero();
	case Mnemonic::BPL:
		return !p.negative();
	case Mnemonic::BVC:
		return !p.overflow();
	case Mnemonic::BVS:
		return p.overflow();
	default:
		return false;
	}
}

bool decimal_arithmetic(const CpuRegisters &registers, CpuVariant variant) noexcept {
	// The 2A03 keeps the D flag but its ALU has the BCD adjust disconnected
	return variant == CpuVariant::NMOS_6502 && registers.p.decimal();
}

} // anonymous namespace

// Stack operations
void push_byte(CpuRegisters &registers, MemoryInterface &memory, Byte value) {
	memory.write(registers.stack_address(), value);
	registers.sp--;
}

Byte pull_byte(CpuRegisters &registers, MemoryInterface &memory) {
	registers.sp++;
	return memory.read(registers.stack_address());
}

void push_word(CpuRegisters &registers, MemoryInterface &memory, Word value) {
	// High byte first so the word reads little-endian in memory
	push_byte(registers, memory, high_byte(value));
	push_byte(registers, memory, low_byte(value));
}

Word pull_word(CpuRegisters &registers, MemoryInterface &memory) {
	Byte low = pull_byte(registers, memory);
	Byte high = pull_byte(registers, memory);
	return make_word(low, high);
}

void enter_interrupt(CpuRegisters &registers, MemoryInterface &memory, Address vector, bool break_flag) {
	push_word(registers, memory, registers.pc);
	push_byte(registers, memory, registers.p.to_stack_byte(break_flag));
	registers.p.set_interrupt_disable(true);
	Byte low = memory.read(vector);
	Byte high = memory.read(static_cast<Address>(vector + 1));
	registers.pc = make_word(low, high);
}

void add_with_carry(CpuRegisters &registers, Byte value, CpuVariant variant) {
	const Byte a = registers.a;
	const unsigned carry_in = registers.p.carry() ? 1u : 0u;
	const unsigned binary = a + value + carry_in;

	// Z always reflects the binary sum, even in decimal mode
	registers.p.set_zero(static_cast<Byte>(binary) == 0);

	if (!decimal_arithmetic(registers, variant)) {
		registers.p.set_carry(binary > 0xFF);
		registers.p.set_overflow(((~(a ^ value)) & (a ^ binary) & 0x80) != 0);
		registers.p.set_negative((binary & 0x80) != 0);
		registers.a = static_cast<Byte>(binary);
		return;
	}

	// NMOS decimal mode: N and V come from the intermediate after the low nibble fix-up
	unsigned low = (a & 0x0F) + (value & 0x0F) + carry_in;
	if (low >= 0x0A) {
		low = ((low + 0x06) & 0x0F) + 0x10;
	}
	unsigned sum = (a & 0xF0) + (value & 0xF0) + low;
	registers.p.set_negative((sum & 0x80) != 0);
	registers.p.set_overflow(((~(a ^ value)) & (a ^ sum) & 0x80) != 0);
	if (sum >= 0xA0) {
		sum += 0x60;
	}
	registers.p.set_carry(sum >= 0x100);
	registers.a = static_cast<Byte>(sum);
}

void subtract_with_carry(CpuRegisters &registers, Byte value, CpuVariant variant) {
	if (!decimal_arithmetic(registers, variant)) {
		// A - M - (1 - C) == A + ~M + C
		add_with_carry(registers, static_cast<Byte>(~value), variant);
		return;
	}

	// NMOS decimal mode: flags are the binary ones, only the result is adjusted
	const Byte a = registers.a;
	const int borrow = registers.p.carry() ? 0 : 1;
	const int binary = a - value - borrow;

	int low = (a & 0x0F) - (value & 0x0F) - borrow;
	if (low < 0) {
		low = ((low - 0x06) & 0x0F) - 0x10;
	}
	int result = (a & 0xF0) - (value & 0xF0) + low;
	if (result < 0) {
		result -= 0x60;
	}

	registers.p.set_carry(binary >= 0);
	registers.p.set_zero(static_cast<Byte>(binary) == 0);
	registers.p.set_negative((binary & 0x80) != 0);
	registers.p.set_overflow(((a ^ value) & (a ^ binary) & 0x80) != 0);
	registers.a = static_cast<Byte>(result);
}

void compare(CpuRegisters &registers, Byte register_value, Byte memory_value) noexcept {
	// Flags as if register - memory; overflow is untouched
	auto difference = static_cast<Byte>(register_value - memory_value);
	registers.p.set_carry(register_value >= memory_value);
	registers.p.update_zero_negative(difference);
}

int execute(const Instruction &instruction, const EffectiveOperand &operand, CpuRegisters &registers,
			MemoryInterface &memory, CpuVariant variant) {
	int cycles = instruction.cycles;
	StatusRegister &p = registers.p;

	if (is_branch(instruction.mnemonic)) {
		if (branch_condition(instruction.mnemonic, p)) {
			cycles += operand.page_crossed ? 2 : 1;
			registers.pc = operand.address;
		}
		return cycles;
	}

	switch (instruction.mnemonic) {
	// ===== Load/Store =====
	case Mnemonic::LDA:
		registers.a = read_operand(operand, registers, memory);
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::LDX:
		registers.x = read_operand(operand, registers, memory);
		p.update_zero_negative(registers.x);
		break;
	case Mnemonic::LDY:
		registers.y = read_operand(operand, registers, memory);
		p.update_zero_negative(registers.y);
		break;
	case Mnemonic::STA:
		write_operand(operand, registers, memory, registers.a);
		break;
	case Mnemonic::STX:
		write_operand(operand, registers, memory, registers.x);
		break;
	case Mnemonic::STY:
		write_operand(operand, registers, memory, registers.y);
		break;

	// ===== Transfers =====
	case Mnemonic::TAX:
		registers.x = registers.a;
		p.update_zero_negative(registers.x);
		break;
	case Mnemonic::TAY:
		registers.y = registers.a;
		p.update_zero_negative(registers.y);
		break;
	case Mnemonic::TSX:
		registers.x = registers.sp;
		p.update_zero_negative(registers.x);
		break;
	case Mnemonic::TXA:
		registers.a = registers.x;
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::TXS:
		registers.sp = registers.x; // No flags affected
		break;
	case Mnemonic::TYA:
		registers.a = registers.y;
		p.update_zero_negative(registers.a);
		break;

	// ===== Arithmetic =====
	case Mnemonic::ADC:
		add_with_carry(registers, read_operand(operand, registers, memory), variant);
		break;
	case Mnemonic::SBC:
		subtract_with_carry(registers, read_operand(operand, registers, memory), variant);
		break;

	// ===== Increment/Decrement =====
	case Mnemonic::INC: {
		auto value = static_cast<Byte>(read_operand(operand, registers, memory) + 1);
		write_operand(operand, registers, memory, value);
		p.update_zero_negative(value);
		break;
	}
	case Mnemonic::DEC: {
		auto value = static_cast<Byte>(read_operand(operand, registers, memory) - 1);
		write_operand(operand, registers, memory, value);
		p.update_zero_negative(value);
		break;
	}
	case Mnemonic::INX:
		registers.x++;
		p.update_zero_negative(registers.x);
		break;
	case Mnemonic::INY:
		registers.y++;
		p.update_zero_negative(registers.y);
		break;
	case Mnemonic::DEX:
		registers.x--;
		p.update_zero_negative(registers.x);
		break;
	case Mnemonic::DEY:
		registers.y--;
		p.update_zero_negative(registers.y);
		break;

	// ===== Shifts/Rotates (accumulator or memory) =====
	case Mnemonic::ASL:
		write_operand(operand, registers, memory,
					  shift_left(p, read_operand(operand, registers, memory), false));
		break;
	case Mnemonic::LSR:
		write_operand(operand, registers, memory,
					  shift_right(p, read_operand(operand, registers, memory), false));
		break;
	case Mnemonic::ROL: {
		bool carry_in = p.carry();
		write_operand(operand, registers, memory,
					  shift_left(p, read_operand(operand, registers, memory), carry_in));
		break;
	}
	case Mnemonic::ROR: {
		bool carry_in = p.carry();
		write_operand(operand, registers, memory,
					  shift_right(p, read_operand(operand, registers, memory), carry_in));
		break;
	}

	// ===== Bitwise =====
	case Mnemonic::AND:
		registers.a &= read_operand(operand, registers, memory);
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::ORA:
		registers.a |= read_operand(operand, registers, memory);
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::EOR:
		registers.a ^= read_operand(operand, registers, memory);
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::BIT: {
		// N and V come from the operand itself, not from A & M
		Byte value = read_operand(operand, registers, memory);
		p.set_zero((registers.a & value) == 0);
		p.set_negative((value & 0x80) != 0);
		p.set_overflow((value & 0x40) != 0);
		break;
	}

	// ===== Compare =====
	case Mnemonic::CMP:
		compare(registers, registers.a, read_operand(operand, registers, memory));
		break;
	case Mnemonic::CPX:
		compare(registers, registers.x, read_operand(operand, registers, memory));
		break;
	case Mnemonic::CPY:
		compare(registers, registers.y, read_operand(operand, registers, memory));
		break;

	// ===== Jump/Call/Return =====
	case Mnemonic::JMP:
		registers.pc = operand.address;
		break;
	case Mnemonic::JSR:
		// Return address is pushed minus one (points at the last byte of the JSR)
		push_word(registers, memory, static_cast<Word>(registers.pc - 1));
		registers.pc = operand.address;
		break;
	case Mnemonic::RTS:
		registers.pc = static_cast<Address>(pull_word(registers, memory) + 1);
		break;
	case Mnemonic::RTI:
		p.load_from_stack_byte(pull_byte(registers, memory));
		registers.pc = pull_word(registers, memory);
		break;
	case Mnemonic::BRK:
		// BRK is followed by a padding byte that the return address skips
		registers.pc++;
		enter_interrupt(registers, memory, IRQ_VECTOR, true);
		break;

	// ===== Stack =====
	case Mnemonic::PHA:
		push_byte(registers, memory, registers.a);
		break;
	case Mnemonic::PHP:
		push_byte(registers, memory, p.to_stack_byte(true));
		break;
	case Mnemonic::PLA:
		registers.a = pull_byte(registers, memory);
		p.update_zero_negative(registers.a);
		break;
	case Mnemonic::PLP:
		p.load_from_stack_byte(pull_byte(registers, memory));
		break;

	// ===== Flags =====
	case Mnemonic::CLC:
		p.set_carry(false);
		break;
	case Mnemonic::CLD:
		p.set_decimal(false);
		break;
	case Mnemonic::CLI:
		p.set_interrupt_disable(false);
		break;
	case Mnemonic::CLV:
		p.set_overflow(false);
		break;
	case Mnemonic::SEC:
		p.set_carry(true);
		break;
	case Mnemonic::SED:
		p.set_decimal(true);
		break;
	case Mnemonic::SEI:
		p.set_interrupt_disable(true);
		break;

	case Mnemonic::NOP:
	case Mnemonic::UNKNOWN:
		break;

	default:
		// Branches are handled above
		break;
	}

	return cycles;
}

} // namespace famicore
