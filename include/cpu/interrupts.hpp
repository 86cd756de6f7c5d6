#pragma once

#include "core/types.hpp"

namespace famicore {

/// 6502 Interrupt Vector Addresses
/// These are the fixed addresses where the CPU looks for interrupt handler addresses
constexpr Address NMI_VECTOR = 0xFFFA;	 ///< Non-Maskable Interrupt vector
constexpr Address RESET_VECTOR = 0xFFFC; ///< Reset vector (power-on, reset button)
constexpr Address IRQ_VECTOR = 0xFFFE;	 ///< IRQ/BRK Interrupt vector

/// Cycles spent entering any interrupt handler
constexpr int INTERRUPT_CYCLES = 7;

/// Interrupt Types
enum class InterruptType {
	NONE,  ///< No interrupt pending
	RESET, ///< Reset interrupt (highest priority)
	NMI,   ///< Non-Maskable Interrupt (second priority)
	IRQ	   ///< Maskable Interrupt (lowest priority)
};

/// Interrupt State
/// Requests latched by the host between steps; consumed at the next step boundary
struct InterruptState {
	bool nmi_pending = false;	///< Edge-triggered: latched until serviced
	bool irq_line = false;		///< Level-triggered: held until the source is acknowledged
	bool reset_pending = false; ///< Reset line pulsed

	/// Get the highest priority pending request (IRQ masking is applied by the CPU)
	[[nodiscard]] InterruptType get_pending_interrupt() const noexcept {
		if (reset_pending)
			return InterruptType::RESET;
		if (nmi_pending)
			return InterruptType::NMI;
		if (irq_line)
			return InterruptType::IRQ;
		return InterruptType::NONE;
	}

	/// Clear the specified interrupt
	void clear_interrupt(InterruptType type) noexcept {
		switch (type) {
		case InterruptType::RESET:
			reset_pending = false;
			break;
		case InterruptType::NMI:
			nmi_pending = false;
			break;
		case InterruptType::IRQ:
			irq_line = false;
			break;
		case InterruptType::NONE:
			break;
		}
	}

	/// Clear all pending interrupts
	void clear_all() noexcept {
		nmi_pending = false;
		irq_line = false;
		reset_pending = false;
	}
};

} // namespace famicore
