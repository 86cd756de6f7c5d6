#pragma once

#include "types.hpp"

namespace famicore {

/// Base interface for clocked emulation components
/// CPU and bus-attached devices implement this so a host run loop can drive them uniformly
class Component {
  public:
	virtual ~Component() = default;

	/// Advance the component by the specified number of CPU cycles
	virtual void tick(CpuCycle cycles) = 0;

	/// Reset the component (reset line asserted)
	virtual void reset() = 0;

	/// Power-on initialization (cold boot)
	/// Different from reset - sets initial power-on state
	virtual void power_on() = 0;

	/// Get a human-readable name for this component (useful for debugging)
	[[nodiscard]] virtual const char *get_name() const noexcept = 0;

  protected:
	Component() = default;

	// Non-copyable by default (components typically manage unique hardware state)
	Component(const Component &) = delete;
	Component &operator=(const Component &) = delete;

	Component(Component &&) = default;
	Component &operator=(Component &&) = default;
};

} // namespace famicore
