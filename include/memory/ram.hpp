#pragma once

#include "core/component.hpp"
#include "core/types.hpp"
#include <array>
#include <cstdint>

namespace famicore {

/// 2KB Work RAM with mirroring
/// NES has 2KB of RAM at $0000-$07FF, mirrored up to $2000
class Ram final : public Component {
  public:
	Ram() = default;

	void tick(CpuCycle cycles) override {
		(void)cycles; // RAM has no timing-sensitive behavior
	}

	void reset() override {
		// RAM contents survive the reset line
	}

	void power_on() override {
		// Real NES RAM contains garbage on power-up; use a deterministic
		// pseudo-random fill so runs stay reproducible
		std::uint32_t seed = 0x12345678;

		for (std::size_t i = 0; i < memory_.size(); ++i) {
			seed = seed * 1664525 + 1013904223;
			std::uint32_t noise = seed ^ static_cast<std::uint32_t>(i * 0x9E3779B9);
			noise ^= noise >> 16;
			memory_[i] = static_cast<Byte>(noise & 0xFF);
		}
	}

	[[nodiscard]] const char *get_name() const noexcept override {
		return "Work RAM";
	}

	/// Read a byte from RAM
	/// Handles mirroring automatically
	[[nodiscard]] Byte read(Address address) const noexcept {
		return memory_[mirror_ram_address(address) & (RAM_SIZE - 1)];
	}

	/// Write a byte to RAM
	/// Handles mirroring automatically
	void write(Address address, Byte value) noexcept {
		memory_[mirror_ram_address(address) & (RAM_SIZE - 1)] = value;
	}

	[[nodiscard]] const std::array<Byte, RAM_SIZE> &get_memory() const noexcept {
		return memory_;
	}

  private:
	std::array<Byte, RAM_SIZE> memory_{};
};

} // namespace famicore
