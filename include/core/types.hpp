#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>

namespace famicore {

// =============================================================================
// Basic Types
// =============================================================================

/// Strong type for memory addresses (16-bit for 6502)
using Address = std::uint16_t;

/// Strong type for 8-bit data values
using Byte = std::uint8_t;

/// Strong type for 16-bit data values
using Word = std::uint16_t;

/// Strong type for signed 8-bit values (relative addressing)
using SignedByte = std::int8_t;

// =============================================================================
// Timing Types
// =============================================================================

/// NES CPU master clock frequency (NTSC): 21.477272 MHz
/// CPU clock: 21.477272 MHz / 12 = 1.789773 MHz
constexpr std::uint64_t MASTER_CLOCK_NTSC = 21'477'272;
constexpr std::uint64_t CPU_CLOCK_NTSC = MASTER_CLOCK_NTSC / 12;

/// Strong type for CPU cycles using std::chrono for precision
using CpuCycle = std::chrono::duration<std::int64_t, std::ratio<1, CPU_CLOCK_NTSC>>;

constexpr CpuCycle cpu_cycles(std::int64_t count) noexcept {
	return CpuCycle{count};
}

// =============================================================================
// Memory Constants
// =============================================================================

/// NES memory layout constants
constexpr Address RAM_START = 0x0000;
constexpr Address RAM_END = 0x07FF;
constexpr Address RAM_SIZE = 0x0800; // 2KB
constexpr Address RAM_MIRROR_END = 0x1FFF;

constexpr Address PRG_ROM_START = 0x8000;

/// Full 6502 address space
constexpr std::size_t ADDRESS_SPACE_SIZE = 0x10000;

/// Hardware stack lives in page one
constexpr Address STACK_PAGE = 0x0100;

// =============================================================================
// Status Flags
// =============================================================================

/// CPU status flag bits
enum class StatusFlag : std::uint8_t {
	CARRY = 0x01,
	ZERO = 0x02,
	INTERRUPT = 0x04,
	DECIMAL = 0x08,
	BREAK = 0x10,
	UNUSED = 0x20,
	OVERFLOW = 0x40,
	NEGATIVE = 0x80
};

// =============================================================================
// Error Handling
// =============================================================================

/// Reasons an iNES container can be rejected
enum class RomError {
	FILE_NOT_FOUND,
	FILE_READ_FAILED,
	TRUNCATED_HEADER,
	BAD_MAGIC,
	TRUNCATED_TRAINER,
	TRUNCATED_PRG_ROM,
	TRUNCATED_CHR_ROM,
	EMPTY_PRG_ROM
};

/// Result type for operations that can fail
template <typename T> using RomResult = std::expected<T, RomError>;

// =============================================================================
// Concepts
// =============================================================================

/// Concept for memory-readable devices
template <typename T>
concept Readable = requires(T t, Address addr) {
	{ t.read(addr) } -> std::same_as<Byte>;
};

/// Concept for memory-writable devices
template <typename T>
concept Writable = requires(T t, Address addr, Byte value) {
	{ t.write(addr, value) } -> std::same_as<void>;
};

/// Concept for memory-mapped devices (both readable and writable)
template <typename T>
concept MemoryMapped = Readable<T> && Writable<T>;

// =============================================================================
// Utility Functions
// =============================================================================

/// Mirror RAM address (RAM is mirrored every 2KB up to $2000)
constexpr Address mirror_ram_address(Address addr) noexcept {
	if (addr <= RAM_MIRROR_END) {
		return addr & (RAM_SIZE - 1);
	}
	return addr;
}

/// Combine two bytes into a word (little-endian)
constexpr Word make_word(Byte low, Byte high) noexcept {
	return static_cast<Word>(low) | static_cast<Word>(static_cast<Word>(high) << 8);
}

/// Extract low byte from word
constexpr Byte low_byte(Word word) noexcept {
	return static_cast<Byte>(word & 0xFF);
}

/// Extract high byte from word
constexpr Byte high_byte(Word word) noexcept {
	return static_cast<Byte>((word >> 8) & 0xFF);
}

/// True when two addresses live in different 256-byte pages
constexpr bool crosses_page(Address from, Address to) noexcept {
	return (from & 0xFF00) != (to & 0xFF00);
}

} // namespace famicore
