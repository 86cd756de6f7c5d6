#pragma once

#include "core/component.hpp"
#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include "cpu/cpu_config.hpp"
#include "cpu/instruction.hpp"
#include "cpu/interrupts.hpp"
#include "cpu/registers.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <utility>

namespace famicore {

/// Snapshot handed to the trace hook before each instruction executes
struct TraceRecord {
	std::uint64_t cycle = 0;   ///< Total cycles consumed before this instruction
	CpuRegisters registers;	   ///< Registers before execution (pc = opcode address)
	Instruction instruction;   ///< Decoded opcode
	std::array<Byte, 2> operands{}; ///< Operand bytes (only instruction.length - 1 are meaningful)
};

/// Outcome of a multi-step run
struct RunSummary {
	std::uint64_t steps = 0;
	std::uint64_t cycles = 0;
	bool halted = false;
};

/// 6502 CPU Core
/// Fetch/decode/resolve/execute stepper for the MOS 6502 as used in the NES.
/// The CPU does not own its memory; the caller keeps the MemoryInterface alive.
class CPU6502 final : public Component {
  public:
	using TraceHook = std::function<void(const TraceRecord &)>;

	explicit CPU6502(MemoryInterface *memory, CpuConfig config = {});
	~CPU6502() override = default;

	CPU6502(const CPU6502 &) = delete;
	CPU6502 &operator=(const CPU6502 &) = delete;
	CPU6502(CPU6502 &&) = default;
	CPU6502 &operator=(CPU6502 &&) = default;

	// Component interface
	void tick(CpuCycle cycles) override; ///< Run instructions until the cycle budget is spent
	void reset() override;				 ///< Reset line: SP -= 3, I set, PC from $FFFC
	void power_on() override;			 ///< Cold boot register state
	[[nodiscard]] const char *get_name() const noexcept override;

	// CPU execution
	/// Execute one instruction, or enter one pending interrupt handler
	/// @return Cycles consumed (0 while halted)
	int step();

	/// Step until max_steps instructions have run or the CPU is halted
	RunSummary run(std::uint64_t max_steps);

	/// Step until at least budget cycles have been consumed or the CPU is halted
	RunSummary run_cycles(std::uint64_t budget);

	// External stop (the 6502 itself has no halt instruction)
	void halt() noexcept {
		halted_ = true;
	}
	void resume() noexcept {
		halted_ = false;
	}
	[[nodiscard]] bool is_halted() const noexcept {
		return halted_;
	}

	// Interrupt handling
	void trigger_nmi() noexcept;	///< Latch a Non-Maskable Interrupt (PPU VBlank, etc.)
	void trigger_irq() noexcept;	///< Assert the IRQ line (APU, mappers, etc.)
	void clear_irq_line() noexcept; ///< Release the IRQ line once the source is acknowledged
	void trigger_reset() noexcept;	///< Pulse the reset line; handled at the next step

	[[nodiscard]] bool has_pending_interrupt() const noexcept;
	[[nodiscard]] InterruptType get_pending_interrupt() const noexcept;

	/// Decode the instruction at PC without side effects
	[[nodiscard]] Instruction peek_instruction() const;

	void set_trace_hook(TraceHook hook) {
		trace_hook_ = std::move(hook);
	}

	[[nodiscard]] std::uint64_t get_total_cycles() const noexcept {
		return total_cycles_;
	}

	[[nodiscard]] const CpuConfig &get_config() const noexcept {
		return config_;
	}

	// Register access (for debugging and testing)
	[[nodiscard]] const CpuRegisters &get_registers() const noexcept {
		return registers_;
	}
	void set_registers(const CpuRegisters &registers) noexcept {
		registers_ = registers;
	}

	[[nodiscard]] Byte get_accumulator() const noexcept {
		return registers_.a;
	}
	[[nodiscard]] Byte get_x_register() const noexcept {
		return registers_.x;
	}
	[[nodiscard]] Byte get_y_register() const noexcept {
		return registers_.y;
	}
	[[nodiscard]] Byte get_stack_pointer() const noexcept {
		return registers_.sp;
	}
	[[nodiscard]] Address get_program_counter() const noexcept {
		return registers_.pc;
	}
	[[nodiscard]] Byte get_status_register() const noexcept {
		return registers_.p.raw();
	}

	// Individual flag access
	[[nodiscard]] bool get_carry_flag() const noexcept {
		return registers_.p.carry();
	}
	[[nodiscard]] bool get_zero_flag() const noexcept {
		return registers_.p.zero();
	}
	[[nodiscard]] bool get_interrupt_flag() const noexcept {
		return registers_.p.interrupt_disable();
	}
	[[nodiscard]] bool get_decimal_flag() const noexcept {
		return registers_.p.decimal();
	}
	[[nodiscard]] bool get_overflow_flag() const noexcept {
		return registers_.p.overflow();
	}
	[[nodiscard]] bool get_negative_flag() const noexcept {
		return registers_.p.negative();
	}

	// Test interface - allows setting registers for testing
	void set_accumulator(Byte value) noexcept {
		registers_.a = value;
	}
	void set_x_register(Byte value) noexcept {
		registers_.x = value;
	}
	void set_y_register(Byte value) noexcept {
		registers_.y = value;
	}
	void set_program_counter(Address value) noexcept {
		registers_.pc = value;
	}
	void set_stack_pointer(Byte value) noexcept {
		registers_.sp = value;
	}
	void set_status_register(Byte value) noexcept {
		registers_.p.assign(value);
	}
	void set_carry_flag(bool value) noexcept {
		registers_.p.set_carry(value);
	}
	void set_zero_flag(bool value) noexcept {
		registers_.p.set_zero(value);
	}
	void set_interrupt_flag(bool value) noexcept {
		registers_.p.set_interrupt_disable(value);
	}
	void set_decimal_flag(bool value) noexcept {
		registers_.p.set_decimal(value);
	}
	void set_overflow_flag(bool value) noexcept {
		registers_.p.set_overflow(value);
	}
	void set_negative_flag(bool value) noexcept {
		registers_.p.set_negative(value);
	}

	/// Status register value after power-on (I set, bits 4 and 5 set)
	static constexpr Byte POWER_ON_STATUS = 0x34;

  private:
	CpuRegisters registers_;
	MemoryInterface *memory_;
	CpuConfig config_;

	InterruptState interrupt_state_;
	bool halted_ = false;

	std::uint64_t total_cycles_ = 0;
	std::int64_t cycle_budget_ = 0; // Carried between tick() calls
	TraceHook trace_hook_;

	int service_interrupt(InterruptType type);
	void emit_trace(const Instruction &instruction) const;
	void log_unknown_opcode(const Instruction &instruction, Address address) const;
};

} // namespace famicore
