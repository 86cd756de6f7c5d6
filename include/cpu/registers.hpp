#pragma once

#include "core/types.hpp"
#include "cpu/status_register.hpp"

namespace famicore {

/// Programmer-visible 6502 register file
struct CpuRegisters {
	Byte a = 0;	   // Accumulator
	Byte x = 0;	   // Index register X
	Byte y = 0;	   // Index register Y
	Byte sp = 0;   // Stack pointer (offset into page $01)
	Address pc = 0; // Program counter
	StatusRegister p;

	/// Address the stack pointer currently refers to
	[[nodiscard]] constexpr Address stack_address() const noexcept {
		return static_cast<Address>(STACK_PAGE | sp);
	}

	friend constexpr bool operator==(const CpuRegisters &, const CpuRegisters &) = default;
};

} // namespace famicore
