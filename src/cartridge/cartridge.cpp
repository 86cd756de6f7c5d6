#include "cartridge/cartridge.hpp"
#include <algorithm>
#include <utility>

namespace famicore {

void Cartridge::tick(CpuCycle cycles) {
	(void)cycles;
}

void Cartridge::reset() {
	// PRG RAM is battery/static RAM and survives reset
}

void Cartridge::power_on() {
	if (!image_.battery_backed_ram) {
		prg_ram_.fill(0x00);
		copy_trainer();
	}
}

const char *Cartridge::get_name() const noexcept {
	return "Cartridge";
}

RomResult<void> Cartridge::load_rom(const std::string &filepath) {
	auto image = RomLoader::load_from_file(filepath);
	if (!image) {
		return std::unexpected(image.error());
	}
	load_image(std::move(*image));
	return {};
}

void Cartridge::load_image(RomImage image) {
	image_ = std::move(image);
	prg_ram_.fill(0x00);
	copy_trainer();
}

void Cartridge::unload_rom() {
	image_ = RomImage{};
	prg_ram_.fill(0x00);
}

Byte Cartridge::cpu_read(Address address) const {
	if (address >= PRG_ROM_START) {
		if (!is_loaded()) {
			return 0xFF;
		}
		return image_.prg_rom[map_prg_address(address)];
	}

	if (address >= PRG_RAM_START) {
		return prg_ram_[address - PRG_RAM_START];
	}

	return 0xFF; // Expansion area, nothing connected
}

void Cartridge::cpu_write(Address address, Byte value) {
	// ROM writes are ignored
	if (address >= PRG_RAM_START && address < PRG_ROM_START) {
		prg_ram_[address - PRG_RAM_START] = value;
	}
}

void Cartridge::copy_trainer() {
	// A trainer is loaded into PRG RAM at $7000
	if (image_.trainer_present && image_.trainer.size() == RomLoader::TRAINER_SIZE) {
		std::copy(image_.trainer.begin(), image_.trainer.end(), prg_ram_.begin() + (TRAINER_ADDRESS - PRG_RAM_START));
	}
}

std::size_t Cartridge::map_prg_address(Address address) const noexcept {
	const std::size_t offset = address - PRG_ROM_START;
	// 16KB images appear at both $8000 and $C000
	return offset % image_.prg_rom.size();
}

} // namespace famicore
