#include "cpu/cpu_6502.hpp"
#include "cpu/addressing.hpp"
#include "cpu/executor.hpp"
#include "cpu/instruction_table.hpp"
#include <iomanip>
#include <iostream>

namespace famicore {

CPU6502::CPU6502(MemoryInterface *memory, CpuConfig config) : memory_(memory), config_(config) {
	power_on();
}

void CPU6502::tick(CpuCycle cycles) {
	cycle_budget_ += cycles.count();

	// Execute instructions while we have cycles; overshoot is paid back next tick
	while (cycle_budget_ > 0) {
		if (halted_) {
			cycle_budget_ = 0;
			break;
		}
		cycle_budget_ -= step();
	}
}

void CPU6502::reset() {
	// A/X/Y survive reset; the reset sequence performs three suppressed pushes
	registers_.sp = static_cast<Byte>(registers_.sp - 3);
	registers_.p.set_interrupt_disable(true);

	Byte low = memory_->read(RESET_VECTOR);
	Byte high = memory_->read(static_cast<Address>(RESET_VECTOR + 1));
	registers_.pc = make_word(low, high);

	interrupt_state_.clear_interrupt(InterruptType::RESET);
	total_cycles_ += INTERRUPT_CYCLES;
}

void CPU6502::power_on() {
	registers_ = CpuRegisters{};
	registers_.p.assign(POWER_ON_STATUS);

	interrupt_state_.clear_all();
	halted_ = false;
	total_cycles_ = 0;
	cycle_budget_ = 0;
}

const char *CPU6502::get_name() const noexcept {
	return "6502 CPU";
}

int CPU6502::step() {
	if (halted_) {
		return 0;
	}

	// Interrupts are sampled between instructions only
	InterruptType pending = get_pending_interrupt();
	if (pending != InterruptType::NONE) {
		return service_interrupt(pending);
	}

	const Address opcode_address = registers_.pc;
	const Instruction instruction = decode(memory_->read(opcode_address));

	if (trace_hook_) {
		emit_trace(instruction);
	}

	if (!instruction.is_legal() && config_.log_unknown_opcodes) {
		log_unknown_opcode(instruction, opcode_address);
	}

	registers_.pc++;
	ResolvedOperand resolved = resolve(instruction.mode, registers_, *memory_);
	int cycles = execute(instruction, resolved.operand, registers_, *memory_, config_.variant);
	if (has_page_cross_penalty(instruction.mnemonic)) {
		cycles += resolved.extra_cycles;
	}

	total_cycles_ += static_cast<std::uint64_t>(cycles);
	return cycles;
}

RunSummary CPU6502::run(std::uint64_t max_steps) {
	RunSummary summary;
	while (summary.steps < max_steps && !halted_) {
		summary.cycles += static_cast<std::uint64_t>(step());
		summary.steps++;
	}
	summary.halted = halted_;
	return summary;
}

RunSummary CPU6502::run_cycles(std::uint64_t budget) {
	RunSummary summary;
	while (summary.cycles < budget && !halted_) {
		summary.cycles += static_cast<std::uint64_t>(step());
		summary.steps++;
	}
	summary.halted = halted_;
	return summary;
}

void CPU6502::trigger_nmi() noexcept {
	interrupt_state_.nmi_pending = true;
}

void CPU6502::trigger_irq() noexcept {
	interrupt_state_.irq_line = true;
}

void CPU6502::clear_irq_line() noexcept {
	interrupt_state_.irq_line = false;
}

void CPU6502::trigger_reset() noexcept {
	interrupt_state_.reset_pending = true;
}

bool CPU6502::has_pending_interrupt() const noexcept {
	return get_pending_interrupt() != InterruptType::NONE;
}

InterruptType CPU6502::get_pending_interrupt() const noexcept {
	InterruptType pending = interrupt_state_.get_pending_interrupt();
	// IRQ is masked by the I flag
	if (pending == InterruptType::IRQ && registers_.p.interrupt_disable()) {
		return InterruptType::NONE;
	}
	return pending;
}

Instruction CPU6502::peek_instruction() const {
	return decode(memory_->peek(registers_.pc));
}

int CPU6502::service_interrupt(InterruptType type) {
	switch (type) {
	case InterruptType::RESET:
		reset();
		return INTERRUPT_CYCLES;
	case InterruptType::NMI:
		interrupt_state_.clear_interrupt(InterruptType::NMI);
		enter_interrupt(registers_, *memory_, NMI_VECTOR, false);
		break;
	case InterruptType::IRQ:
		// Level-triggered: the line stays asserted until the host clears it
		enter_interrupt(registers_, *memory_, IRQ_VECTOR, false);
		break;
	case InterruptType::NONE:
		return 0;
	}

	total_cycles_ += INTERRUPT_CYCLES;
	return INTERRUPT_CYCLES;
}

void CPU6502::emit_trace(const Instruction &instruction) const {
	TraceRecord record;
	record.cycle = total_cycles_;
	record.registers = registers_;
	record.instruction = instruction;
	for (Byte i = 1; i < instruction.length; ++i) {
		record.operands[i - 1] = memory_->peek(static_cast<Address>(registers_.pc + i));
	}
	trace_hook_(record);
}

void CPU6502::log_unknown_opcode(const Instruction &instruction, Address address) const {
	std::cerr << "Unknown opcode: 0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(2)
			  << static_cast<int>(instruction.opcode) << " at PC: 0x" << std::setw(4) << address << std::dec
			  << "\n";
}

} // namespace famicore
