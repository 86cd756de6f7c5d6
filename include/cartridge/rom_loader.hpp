#pragma once

#include "core/types.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace famicore {

/// Nametable arrangement wired on the cartridge
enum class Mirroring { HORIZONTAL, VERTICAL, FOUR_SCREEN };

/// Console the image targets (iNES flags 7)
enum class ConsoleType { NES, VS_UNISYSTEM, PLAYCHOICE_10 };

/// TV system (iNES flags 9)
enum class Region { NTSC, PAL };

/**
 * Decoded iNES image: header metadata plus the program/character ROM bytes
 */
struct RomImage {
	// Header information
	std::uint8_t mapper_id = 0;
	std::uint8_t prg_rom_pages = 0; // 16KB pages
	std::uint8_t chr_rom_pages = 0; // 8KB pages
	Mirroring mirroring = Mirroring::HORIZONTAL;
	ConsoleType console = ConsoleType::NES;
	Region region = Region::NTSC;
	bool battery_backed_ram = false;
	bool trainer_present = false;

	// ROM data
	std::vector<Byte> prg_rom; // Program ROM
	std::vector<Byte> chr_rom; // Character ROM (empty when the board uses CHR RAM)
	std::vector<Byte> trainer; // Optional 512-byte trainer

	std::string filename;
};

/**
 * Loads NES ROM files in iNES 1.0 format
 * A failed load never produces a partially filled image.
 */
class RomLoader {
  public:
	/**
	 * Load a ROM file from disk
	 * @param filepath Path to the .nes file
	 * @return The decoded image or the reason it was rejected
	 */
	[[nodiscard]] static RomResult<RomImage> load_from_file(const std::string &filepath);

	/**
	 * Decode an iNES container already held in memory
	 * @param data Complete file contents
	 */
	[[nodiscard]] static RomResult<RomImage> load_from_memory(std::span<const Byte> data);

	/**
	 * Validate that a file appears to be a valid iNES ROM
	 * @param filepath Path to check
	 * @return true if file has valid iNES header
	 */
	[[nodiscard]] static bool is_valid_nes_file(const std::string &filepath);

	// iNES layout constants
	static constexpr std::size_t INES_HEADER_SIZE = 16;
	static constexpr std::size_t TRAINER_SIZE = 512;
	static constexpr std::size_t PRG_ROM_PAGE_SIZE = 16384; // 16KB
	static constexpr std::size_t CHR_ROM_PAGE_SIZE = 8192;	// 8KB

	// iNES magic number "NES\x1A"
	static constexpr std::array<Byte, 4> INES_MAGIC = {0x4E, 0x45, 0x53, 0x1A};

  private:
	[[nodiscard]] static bool validate_header(std::span<const Byte> header);
	[[nodiscard]] static RomImage parse_header(std::span<const Byte> header);
	[[nodiscard]] static RomResult<std::vector<Byte>> read_file(const std::string &filepath);
};

/// Human readable reason for a load failure
[[nodiscard]] const char *describe(RomError error) noexcept;

[[nodiscard]] const char *to_string(Mirroring mirroring) noexcept;
[[nodiscard]] const char *to_string(ConsoleType console) noexcept;
[[nodiscard]] const char *to_string(Region region) noexcept;

} // namespace famicore
