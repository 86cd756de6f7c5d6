// Famicore - NES CPU Core
// Interrupt Tests
// NMI, IRQ and reset servicing at instruction boundaries

#include "../../include/cpu/cpu_6502.hpp"
#include "../../include/cpu/interrupts.hpp"
#include "../../include/memory/flat_memory.hpp"
#include <catch2/catch_all.hpp>

using namespace famicore;

namespace {

constexpr Address NMI_HANDLER = 0x9000;
constexpr Address RESET_HANDLER = 0x8000;
constexpr Address IRQ_HANDLER = 0xA000;

/// Vectors point at distinct handlers; the main program is a run of NOPs
void setup_interrupt_vectors(FlatMemory &memory) {
	memory.write_word(NMI_VECTOR, NMI_HANDLER);
	memory.write_word(RESET_VECTOR, RESET_HANDLER);
	memory.write_word(IRQ_VECTOR, IRQ_HANDLER);

	for (Address address = RESET_HANDLER; address < RESET_HANDLER + 0x10; ++address) {
		memory.write(address, 0xEA); // NOP
	}
	memory.write(NMI_HANDLER, 0x40); // RTI
	memory.write(IRQ_HANDLER, 0x40); // RTI
}

/// Byte most recently pushed on the stack
Byte peek_stack(const FlatMemory &memory, Byte stack_pointer, Byte depth = 1) {
	return memory.peek(static_cast<Address>(STACK_PAGE | static_cast<Byte>(stack_pointer + depth)));
}

} // anonymous namespace

TEST_CASE("InterruptState functionality", "[cpu][interrupts]") {
	InterruptState state;

	SECTION("Initial state") {
		REQUIRE(state.get_pending_interrupt() == InterruptType::NONE);
		REQUIRE_FALSE(state.nmi_pending);
		REQUIRE_FALSE(state.irq_line);
		REQUIRE_FALSE(state.reset_pending);
	}

	SECTION("Priority is reset, then NMI, then IRQ") {
		state.irq_line = true;
		REQUIRE(state.get_pending_interrupt() == InterruptType::IRQ);

		state.nmi_pending = true;
		REQUIRE(state.get_pending_interrupt() == InterruptType::NMI);

		state.reset_pending = true;
		REQUIRE(state.get_pending_interrupt() == InterruptType::RESET);
	}

	SECTION("Clearing interrupts") {
		state.nmi_pending = true;
		state.irq_line = true;
		state.clear_interrupt(InterruptType::NMI);
		REQUIRE(state.get_pending_interrupt() == InterruptType::IRQ);

		state.reset_pending = true;
		state.clear_all();
		REQUIRE(state.get_pending_interrupt() == InterruptType::NONE);
	}
}

TEST_CASE("Interrupt vectors", "[cpu][interrupts]") {
	REQUIRE(NMI_VECTOR == 0xFFFA);
	REQUIRE(RESET_VECTOR == 0xFFFC);
	REQUIRE(IRQ_VECTOR == 0xFFFE);
	REQUIRE(INTERRUPT_CYCLES == 7);
}

TEST_CASE("NMI handling", "[cpu][interrupts][nmi]") {
	FlatMemory memory;
	setup_interrupt_vectors(memory);
	CPU6502 cpu(&memory);
	cpu.reset();
	cpu.set_interrupt_flag(false);
	cpu.set_carry_flag(true);

	cpu.step(); // NOP at $8000
	Byte sp_before = cpu.get_stack_pointer();
	std::uint64_t cycles_before = cpu.get_total_cycles();

	cpu.trigger_nmi();
	REQUIRE(cpu.has_pending_interrupt());
	REQUIRE(cpu.get_pending_interrupt() == InterruptType::NMI);

	SECTION("Entering the handler") {
		REQUIRE(cpu.step() == INTERRUPT_CYCLES);
		REQUIRE(cpu.get_program_counter() == NMI_HANDLER);
		REQUIRE(cpu.get_interrupt_flag());
		REQUIRE(cpu.get_stack_pointer() == static_cast<Byte>(sp_before - 3));
		REQUIRE(cpu.get_total_cycles() == cycles_before + 7);
		REQUIRE_FALSE(cpu.has_pending_interrupt());
	}

	SECTION("Pushed state: return address and P with B clear") {
		cpu.step();
		Byte sp = cpu.get_stack_pointer();
		REQUIRE(peek_stack(memory, sp, 1) == 0x21); // C and bit 5
		REQUIRE(peek_stack(memory, sp, 2) == 0x01); // PCL
		REQUIRE(peek_stack(memory, sp, 3) == 0x80); // PCH
	}

	SECTION("RTI resumes the interrupted program") {
		cpu.step(); // Enter handler
		REQUIRE(cpu.step() == 6);
		REQUIRE(cpu.get_program_counter() == 0x8001);
		REQUIRE(cpu.get_stack_pointer() == sp_before);
		REQUIRE_FALSE(cpu.get_interrupt_flag());
		REQUIRE(cpu.get_carry_flag());
	}

	SECTION("NMI ignores the I flag") {
		cpu.set_interrupt_flag(true);
		REQUIRE(cpu.step() == INTERRUPT_CYCLES);
		REQUIRE(cpu.get_program_counter() == NMI_HANDLER);
	}

	SECTION("NMI is latched once") {
		cpu.step();
		cpu.step(); // RTI
		REQUIRE(cpu.step() == 2);
		REQUIRE(cpu.get_program_counter() == 0x8002);
	}
}

TEST_CASE("IRQ handling", "[cpu][interrupts][irq]") {
	FlatMemory memory;
	setup_interrupt_vectors(memory);
	CPU6502 cpu(&memory);
	cpu.reset();

	SECTION("IRQ is masked while I is set") {
		REQUIRE(cpu.get_interrupt_flag());
		cpu.trigger_irq();
		REQUIRE_FALSE(cpu.has_pending_interrupt());
		REQUIRE(cpu.get_pending_interrupt() == InterruptType::NONE);

		REQUIRE(cpu.step() == 2);
		REQUIRE(cpu.get_program_counter() == 0x8001);
	}

	SECTION("IRQ is taken once I is clear") {
		cpu.set_interrupt_flag(false);
		cpu.trigger_irq();
		REQUIRE(cpu.get_pending_interrupt() == InterruptType::IRQ);

		REQUIRE(cpu.step() == INTERRUPT_CYCLES);
		REQUIRE(cpu.get_program_counter() == IRQ_HANDLER);
		REQUIRE(cpu.get_interrupt_flag());

		// B is clear in the pushed copy
		REQUIRE((peek_stack(memory, cpu.get_stack_pointer()) & StatusRegister::BREAK_BIT) == 0);
	}

	SECTION("IRQ line stays asserted until cleared") {
		cpu.set_interrupt_flag(false);
		cpu.trigger_irq();
		cpu.step(); // Enter handler

		// RTI restores I clear with the line still asserted: handler is re-entered
		REQUIRE(cpu.step() == 6);
		REQUIRE(cpu.get_program_counter() == RESET_HANDLER);
		REQUIRE(cpu.get_pending_interrupt() == InterruptType::IRQ);
		REQUIRE(cpu.step() == INTERRUPT_CYCLES);
		REQUIRE(cpu.get_program_counter() == IRQ_HANDLER);

		cpu.clear_irq_line();
		cpu.step(); // RTI
		REQUIRE_FALSE(cpu.has_pending_interrupt());
		REQUIRE(cpu.step() == 2);
		REQUIRE(cpu.get_program_counter() == RESET_HANDLER + 1);
	}

	SECTION("NMI wins over a simultaneous IRQ") {
		cpu.set_interrupt_flag(false);
		cpu.trigger_irq();
		cpu.trigger_nmi();
		REQUIRE(cpu.get_pending_interrupt() == InterruptType::NMI);
		cpu.step();
		REQUIRE(cpu.get_program_counter() == NMI_HANDLER);
	}
}

TEST_CASE("Reset line", "[cpu][interrupts][reset]") {
	FlatMemory memory;
	setup_interrupt_vectors(memory);
	CPU6502 cpu(&memory);
	cpu.reset();
	cpu.run(3);
	cpu.set_accumulator(0x42);

	Byte sp_before = cpu.get_stack_pointer();
	cpu.trigger_reset();

	SECTION("Reset has the highest priority") {
		cpu.trigger_nmi();
		REQUIRE(cpu.get_pending_interrupt() == InterruptType::RESET);
	}

	SECTION("Serviced at the next step") {
		std::uint64_t cycles_before = cpu.get_total_cycles();
		REQUIRE(cpu.step() == INTERRUPT_CYCLES);
		REQUIRE(cpu.get_program_counter() == RESET_HANDLER);
		REQUIRE(cpu.get_stack_pointer() == static_cast<Byte>(sp_before - 3));
		REQUIRE(cpu.get_interrupt_flag());
		REQUIRE(cpu.get_accumulator() == 0x42);
		REQUIRE(cpu.get_total_cycles() == cycles_before + 7);
		REQUIRE_FALSE(cpu.has_pending_interrupt());
	}
}
