#pragma once

#include <cstdint>

namespace famicore {

/// Which 6502 the core behaves as
enum class CpuVariant : std::uint8_t {
	RICOH_2A03, ///< NES/Famicom CPU: D flag is stored but ADC/SBC ignore it
	NMOS_6502	///< Stock MOS 6502 with binary-coded decimal arithmetic
};

/// Construction-time options for CPU6502
struct CpuConfig {
	CpuVariant variant = CpuVariant::RICOH_2A03;

	/// Report undocumented opcodes on std::cerr as they execute
	bool log_unknown_opcodes = false;
};

} // namespace famicore
