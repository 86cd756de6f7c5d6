#include "core/bus.hpp"
#include "cartridge/cartridge.hpp"
#include "memory/ram.hpp"
#include <iomanip>
#include <iostream>
#include <utility>

namespace famicore {

void SystemBus::tick(CpuCycle cycles) {
	if (ram_) {
		ram_->tick(cycles);
	}
	if (cartridge_) {
		cartridge_->tick(cycles);
	}
}

void SystemBus::reset() {
	if (ram_) {
		ram_->reset();
	}
	if (cartridge_) {
		cartridge_->reset();
	}
}

void SystemBus::power_on() {
	if (ram_) {
		ram_->power_on();
	}
	if (cartridge_) {
		cartridge_->power_on();
	}
	last_bus_value_ = 0xFF;
}

const char *SystemBus::get_name() const noexcept {
	return "System Bus";
}

Byte SystemBus::read(Address address) {
	bool mapped = false;
	Byte value = read_device(address, mapped);
	if (!mapped) {
		return last_bus_value_; // Open bus
	}
	last_bus_value_ = value;
	return value;
}

void SystemBus::write(Address address, Byte value) {
	last_bus_value_ = value;

	// RAM: $0000-$1FFF (includes mirroring)
	if (is_ram_address(address)) {
		if (ram_) {
			ram_->write(address, value);
		}
		return;
	}

	// Cartridge space: PRG RAM and ROM
	if (is_cartridge_address(address) && cartridge_) {
		cartridge_->cpu_write(address, value);
	}
}

Byte SystemBus::peek(Address address) const {
	bool mapped = false;
	Byte value = read_device(address, mapped);
	return mapped ? value : last_bus_value_;
}

void SystemBus::connect_ram(std::shared_ptr<Ram> ram) {
	ram_ = std::move(ram);
}

void SystemBus::connect_cartridge(std::shared_ptr<Cartridge> cartridge) {
	cartridge_ = std::move(cartridge);
}

void SystemBus::debug_print_memory_map(std::ostream &out) const {
	out << "=== CPU Memory Map ===\n";
	out << "$0000-$07FF: Work RAM (2KB)" << (ram_ ? "" : " [not connected]") << "\n";
	out << "$0800-$1FFF: RAM mirrors\n";
	out << "$2000-$5FFF: Unmapped (open bus)\n";
	out << "$6000-$7FFF: Cartridge PRG RAM" << (cartridge_ ? "" : " [not connected]") << "\n";
	out << "$8000-$FFFF: Cartridge PRG ROM";
	if (cartridge_ && cartridge_->is_loaded()) {
		out << " (" << std::dec << cartridge_->get_image().prg_rom.size() / 1024 << "KB)";
	} else {
		out << " [no ROM]";
	}
	out << "\n";
}

bool SystemBus::is_ram_address(Address address) noexcept {
	return address <= RAM_MIRROR_END;
}

bool SystemBus::is_cartridge_address(Address address) noexcept {
	return address >= Cartridge::PRG_RAM_START;
}

Byte SystemBus::read_device(Address address, bool &mapped) const {
	if (is_ram_address(address) && ram_) {
		mapped = true;
		return ram_->read(address);
	}

	if (is_cartridge_address(address) && cartridge_ && (address < PRG_ROM_START || cartridge_->is_loaded())) {
		mapped = true;
		return cartridge_->cpu_read(address);
	}

	mapped = false;
	return 0xFF;
}

} // namespace famicore
