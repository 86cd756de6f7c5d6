#pragma once

#include "core/types.hpp"

namespace famicore {

/// Processor status (P register)
///
///   7  bit  0
///   ---- ----
///   NVsb DIZC
///
/// Six bits are real flags and bit 5 always reads as 1. Bit 4 (B) is kept
/// only when written directly (the power-on value $34 carries it); PHP/BRK
/// push it set, IRQ/NMI push it clear, and PLP/RTI drop it when pulling.
class StatusRegister {
  public:
	constexpr StatusRegister() noexcept = default;
	constexpr explicit StatusRegister(Byte value) noexcept : bits_(static_cast<Byte>(value | UNUSED_BIT)) {
	}

	[[nodiscard]] constexpr bool test(StatusFlag flag) const noexcept {
		return (bits_ & static_cast<Byte>(flag)) != 0;
	}

	constexpr void set(StatusFlag flag, bool value) noexcept {
		if (value) {
			bits_ = static_cast<Byte>(bits_ | static_cast<Byte>(flag));
		} else {
			bits_ = static_cast<Byte>(bits_ & ~static_cast<Byte>(flag));
		}
	}

	// Named access for the ALU rules
	[[nodiscard]] constexpr bool carry() const noexcept {
		return test(StatusFlag::CARRY);
	}
	[[nodiscard]] constexpr bool zero() const noexcept {
		return test(StatusFlag::ZERO);
	}
	[[nodiscard]] constexpr bool interrupt_disable() const noexcept {
		return test(StatusFlag::INTERRUPT);
	}
	[[nodiscard]] constexpr bool decimal() const noexcept {
		return test(StatusFlag::DECIMAL);
	}
	[[nodiscard]] constexpr bool overflow() const noexcept {
		return test(StatusFlag::OVERFLOW);
	}
	[[nodiscard]] constexpr bool negative() const noexcept {
		return test(StatusFlag::NEGATIVE);
	}

	constexpr void set_carry(bool value) noexcept {
		set(StatusFlag::CARRY, value);
	}
	constexpr void set_zero(bool value) noexcept {
		set(StatusFlag::ZERO, value);
	}
	constexpr void set_interrupt_disable(bool value) noexcept {
		set(StatusFlag::INTERRUPT, value);
	}
	constexpr void set_decimal(bool value) noexcept {
		set(StatusFlag::DECIMAL, value);
	}
	constexpr void set_overflow(bool value) noexcept {
		set(StatusFlag::OVERFLOW, value);
	}
	constexpr void set_negative(bool value) noexcept {
		set(StatusFlag::NEGATIVE, value);
	}

	/// Z and N from a result byte
	constexpr void update_zero_negative(Byte value) noexcept {
		set_zero(value == 0);
		set_negative((value & 0x80) != 0);
	}

	/// Raw register value as seen by debuggers
	[[nodiscard]] constexpr Byte raw() const noexcept {
		return bits_;
	}

	/// Byte pushed by PHP/BRK (break = true) or IRQ/NMI (break = false)
	[[nodiscard]] constexpr Byte to_stack_byte(bool break_flag) const noexcept {
		Byte value = static_cast<Byte>((bits_ & FLAG_MASK) | UNUSED_BIT);
		return break_flag ? static_cast<Byte>(value | BREAK_BIT) : value;
	}

	/// Restore the six flags from a pulled byte (PLP/RTI)
	constexpr void load_from_stack_byte(Byte value) noexcept {
		bits_ = static_cast<Byte>((value & FLAG_MASK) | UNUSED_BIT);
	}

	constexpr void assign(Byte value) noexcept {
		bits_ = static_cast<Byte>(value | UNUSED_BIT);
	}

	friend constexpr bool operator==(const StatusRegister &, const StatusRegister &) = default;

	static constexpr Byte BREAK_BIT = static_cast<Byte>(StatusFlag::BREAK);
	static constexpr Byte UNUSED_BIT = static_cast<Byte>(StatusFlag::UNUSED);
	/// The six real flags: N V D I Z C
	static constexpr Byte FLAG_MASK = 0xCF;

  private:
	Byte bits_ = UNUSED_BIT;
};

} // namespace famicore
