#pragma once

#include "core/types.hpp"

namespace famicore {

/// Memory capability consumed by the CPU core
/// The CPU only ever talks to memory through this interface, so a bus with
/// memory-mapped registers or bank switching can be swapped in without CPU changes
class MemoryInterface {
  public:
	virtual ~MemoryInterface() = default;

	/// CPU read cycle (may have side effects on memory-mapped devices)
	[[nodiscard]] virtual Byte read(Address address) = 0;

	/// CPU write cycle
	virtual void write(Address address, Byte value) = 0;

	/// Non-intrusive read for debuggers and disassemblers
	[[nodiscard]] virtual Byte peek(Address address) const = 0;
};

} // namespace famicore
