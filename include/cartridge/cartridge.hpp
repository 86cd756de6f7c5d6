#pragma once

#include "cartridge/rom_loader.hpp"
#include "core/component.hpp"
#include <array>
#include <string>

namespace famicore {

/**
 * NES Cartridge - fixed PRG ROM mapping (NROM layout)
 * PRG RAM at $6000-$7FFF, PRG ROM at $8000-$FFFF with 16KB images mirrored
 * into both halves. Bank switching boards are mapped the same way (first
 * 32KB visible), which is enough to run the CPU against any image.
 */
class Cartridge final : public Component {
  public:
	Cartridge() = default;
	~Cartridge() = default;

	// Component interface
	void tick(CpuCycle cycles) override;
	void reset() override;
	void power_on() override;
	[[nodiscard]] const char *get_name() const noexcept override;

	// Cartridge operations
	[[nodiscard]] RomResult<void> load_rom(const std::string &filepath);
	void load_image(RomImage image);
	void unload_rom();
	[[nodiscard]] bool is_loaded() const noexcept {
		return !image_.prg_rom.empty();
	}

	// Memory access (called by SystemBus)
	[[nodiscard]] Byte cpu_read(Address address) const;
	void cpu_write(Address address, Byte value);

	[[nodiscard]] const RomImage &get_image() const noexcept {
		return image_;
	}

	static constexpr Address PRG_RAM_START = 0x6000;
	static constexpr std::size_t PRG_RAM_SIZE = 0x2000;
	static constexpr Address TRAINER_ADDRESS = 0x7000;

  private:
	RomImage image_;
	std::array<Byte, PRG_RAM_SIZE> prg_ram_{};

	void copy_trainer();
	[[nodiscard]] std::size_t map_prg_address(Address address) const noexcept;
};

} // namespace famicore
