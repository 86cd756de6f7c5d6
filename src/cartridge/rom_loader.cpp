#include "cartridge/rom_loader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace famicore {

RomResult<RomImage> RomLoader::load_from_file(const std::string &filepath) {
	auto file_data = read_file(filepath);
	if (!file_data) {
		return std::unexpected(file_data.error());
	}

	auto image = load_from_memory(*file_data);
	if (image) {
		image->filename = filepath;
	}
	return image;
}

RomResult<RomImage> RomLoader::load_from_memory(std::span<const Byte> data) {
	if (data.size() < INES_HEADER_SIZE) {
		return std::unexpected(RomError::TRUNCATED_HEADER);
	}

	auto header = data.first(INES_HEADER_SIZE);
	if (!validate_header(header)) {
		return std::unexpected(RomError::BAD_MAGIC);
	}

	RomImage image = parse_header(header);
	if (image.prg_rom_pages == 0) {
		return std::unexpected(RomError::EMPTY_PRG_ROM);
	}

	const std::size_t prg_size = image.prg_rom_pages * PRG_ROM_PAGE_SIZE;
	const std::size_t chr_size = image.chr_rom_pages * CHR_ROM_PAGE_SIZE;
	std::size_t offset = INES_HEADER_SIZE;

	// Trainer (if present) sits between the header and PRG ROM
	if (image.trainer_present) {
		if (data.size() < offset + TRAINER_SIZE) {
			return std::unexpected(RomError::TRUNCATED_TRAINER);
		}
		auto trainer = data.subspan(offset, TRAINER_SIZE);
		image.trainer.assign(trainer.begin(), trainer.end());
		offset += TRAINER_SIZE;
	}

	if (data.size() < offset + prg_size) {
		return std::unexpected(RomError::TRUNCATED_PRG_ROM);
	}
	auto prg = data.subspan(offset, prg_size);
	image.prg_rom.assign(prg.begin(), prg.end());
	offset += prg_size;

	if (data.size() < offset + chr_size) {
		return std::unexpected(RomError::TRUNCATED_CHR_ROM);
	}
	auto chr = data.subspan(offset, chr_size);
	image.chr_rom.assign(chr.begin(), chr.end());

	return image;
}

bool RomLoader::is_valid_nes_file(const std::string &filepath) {
	auto file_data = read_file(filepath);
	if (!file_data || file_data->size() < INES_HEADER_SIZE) {
		return false;
	}
	return validate_header(std::span<const Byte>(*file_data).first(INES_HEADER_SIZE));
}

bool RomLoader::validate_header(std::span<const Byte> header) {
	if (header.size() < INES_HEADER_SIZE) {
		return false;
	}
	return std::equal(INES_MAGIC.begin(), INES_MAGIC.end(), header.begin());
}

RomImage RomLoader::parse_header(std::span<const Byte> header) {
	RomImage image{};

	// Bytes 4-5: ROM sizes
	image.prg_rom_pages = header[4];
	image.chr_rom_pages = header[5];

	// Byte 6: Flags 6
	const Byte flags6 = header[6];
	image.battery_backed_ram = (flags6 & 0x02) != 0;
	image.trainer_present = (flags6 & 0x04) != 0;
	if ((flags6 & 0x08) != 0) {
		image.mirroring = Mirroring::FOUR_SCREEN;
	} else if ((flags6 & 0x01) != 0) {
		image.mirroring = Mirroring::VERTICAL;
	} else {
		image.mirroring = Mirroring::HORIZONTAL;
	}

	// Byte 7: Flags 7
	const Byte flags7 = header[7];
	if ((flags7 & 0x01) != 0) {
		image.console = ConsoleType::VS_UNISYSTEM;
	} else if ((flags7 & 0x02) != 0) {
		image.console = ConsoleType::PLAYCHOICE_10;
	}

	// Mapper ID: lower nibble from flags 6, upper nibble from flags 7
	image.mapper_id = static_cast<std::uint8_t>((flags6 >> 4) | (flags7 & 0xF0));

	// Byte 9: TV system
	image.region = (header[9] & 0x01) != 0 ? Region::PAL : Region::NTSC;

	return image;
}

RomResult<std::vector<Byte>> RomLoader::read_file(const std::string &filepath) {
	std::error_code ec;
	if (!std::filesystem::is_regular_file(filepath, ec)) {
		return std::unexpected(RomError::FILE_NOT_FOUND);
	}

	std::ifstream file(filepath, std::ios::binary);
	if (!file.is_open()) {
		return std::unexpected(RomError::FILE_READ_FAILED);
	}

	file.seekg(0, std::ios::end);
	const auto size = file.tellg();
	if (size < 0) {
		return std::unexpected(RomError::FILE_READ_FAILED);
	}
	file.seekg(0, std::ios::beg);

	std::vector<Byte> data(static_cast<std::size_t>(size));
	file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
	if (!file) {
		return std::unexpected(RomError::FILE_READ_FAILED);
	}

	return data;
}

const char *describe(RomError error) noexcept {
	switch (error) {
	case RomError::FILE_NOT_FOUND:
		return "file not found";
	case RomError::FILE_READ_FAILED:
		return "file could not be read";
	case RomError::TRUNCATED_HEADER:
		return "file too small to hold an iNES header";
	case RomError::BAD_MAGIC:
		return "missing iNES magic bytes (expected \"NES\\x1A\")";
	case RomError::TRUNCATED_TRAINER:
		return "trainer section is truncated";
	case RomError::TRUNCATED_PRG_ROM:
		return "PRG ROM section is shorter than the header declares";
	case RomError::TRUNCATED_CHR_ROM:
		return "CHR ROM section is shorter than the header declares";
	case RomError::EMPTY_PRG_ROM:
		return "header declares zero PRG ROM pages";
	}
	return "unknown ROM error";
}

const char *to_string(Mirroring mirroring) noexcept {
	switch (mirroring) {
	case Mirroring::HORIZONTAL:
		return "Horizontal";
	case Mirroring::VERTICAL:
		return "Vertical";
	case Mirroring::FOUR_SCREEN:
		return "Four-screen";
	}
	return "?";
}

const char *to_string(ConsoleType console) noexcept {
	switch (console) {
	case ConsoleType::NES:
		return "NES/Famicom";
	case ConsoleType::VS_UNISYSTEM:
		return "VS Unisystem";
	case ConsoleType::PLAYCHOICE_10:
		return "PlayChoice-10";
	}
	return "?";
}

const char *to_string(Region region) noexcept {
	return region == Region::PAL ? "PAL" : "NTSC";
}

} // namespace famicore
