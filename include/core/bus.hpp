#pragma once

#include "core/component.hpp"
#include "core/memory_interface.hpp"
#include "core/types.hpp"
#include <iostream>
#include <memory>

namespace famicore {

// Forward declarations
class Ram;
class Cartridge;

/// System Bus - CPU memory map
/// Routes accesses to work RAM and the cartridge; unmapped reads return the
/// last value driven on the data bus (open bus).
class SystemBus final : public Component, public MemoryInterface {
  public:
	SystemBus() = default;
	~SystemBus() override = default;

	// Component interface
	void tick(CpuCycle cycles) override;
	void reset() override;
	void power_on() override;
	[[nodiscard]] const char *get_name() const noexcept override;

	// Memory interface
	[[nodiscard]] Byte read(Address address) override;
	void write(Address address, Byte value) override;
	[[nodiscard]] Byte peek(Address address) const override;

	// Component management
	void connect_ram(std::shared_ptr<Ram> ram);
	void connect_cartridge(std::shared_ptr<Cartridge> cartridge);

	/// Print the memory map and attached devices
	void debug_print_memory_map(std::ostream &out = std::cout) const;

  private:
	std::shared_ptr<Ram> ram_;
	std::shared_ptr<Cartridge> cartridge_;

	// Open bus simulation
	Byte last_bus_value_ = 0xFF;

	[[nodiscard]] static bool is_ram_address(Address address) noexcept;
	[[nodiscard]] static bool is_cartridge_address(Address address) noexcept;
	[[nodiscard]] Byte read_device(Address address, bool &mapped) const;
};

} // namespace famicore
