#pragma once

#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include <array>
#include <span>

namespace famicore {

/// Unmapped 64KB address space
/// Every address is plain read/write storage. Used for test fixtures and for
/// running raw 6502 binaries that expect RAM everywhere.
class FlatMemory final : public MemoryInterface {
  public:
	FlatMemory() = default;

	[[nodiscard]] Byte read(Address address) override {
		return memory_[address];
	}

	void write(Address address, Byte value) override {
		memory_[address] = value;
	}

	[[nodiscard]] Byte peek(Address address) const override {
		return memory_[address];
	}

	/// Copy a block of bytes starting at origin, wrapping at the top of the address space
	void load(Address origin, std::span<const Byte> bytes) noexcept {
		Address address = origin;
		for (Byte value : bytes) {
			memory_[address] = value;
			++address;
		}
	}

	/// Store a little-endian word (vector setup etc.)
	void write_word(Address address, Word value) noexcept {
		memory_[address] = low_byte(value);
		memory_[static_cast<Address>(address + 1)] = high_byte(value);
	}

  private:
	std::array<Byte, ADDRESS_SPACE_SIZE> memory_{};
};

static_assert(MemoryMapped<FlatMemory>);

} // namespace famicore
