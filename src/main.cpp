#include "cartridge/cartridge.hpp"
#include "cartridge/rom_loader.hpp"
#include "core/bus.hpp"
#include "core/types.hpp"
#include "cpu/cpu_6502.hpp"
#include "cpu/disassembler.hpp"
#include "memory/ram.hpp"
#include <charconv>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace famicore;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_ROM_ERROR = 2;
constexpr std::uint64_t DEFAULT_STEP_LIMIT = 10000;

struct RunOptions {
	std::string rom_path;
	std::uint64_t steps = DEFAULT_STEP_LIMIT;
	bool trace = false;
	bool verbose = false;
};

void print_usage(std::ostream &out) {
	out << "Usage:\n"
		<< "  famicore disasm <rom.nes>\n"
		<< "  famicore run <rom.nes> [--steps N] [--trace] [--verbose]\n";
}

void print_rom_summary(const RomImage &image) {
	std::cout << "ROM: " << image.filename << "\n";
	std::cout << "  Mapper:    " << static_cast<int>(image.mapper_id) << "\n";
	std::cout << "  PRG ROM:   " << static_cast<int>(image.prg_rom_pages) << " x 16KB\n";
	std::cout << "  CHR ROM:   " << static_cast<int>(image.chr_rom_pages) << " x 8KB\n";
	std::cout << "  Mirroring: " << to_string(image.mirroring) << "\n";
	std::cout << "  Console:   " << to_string(image.console) << "\n";
	std::cout << "  Region:    " << to_string(image.region) << "\n";
	std::cout << "  Battery:   " << (image.battery_backed_ram ? "yes" : "no") << "\n";
	std::cout << "  Trainer:   " << (image.trainer_present ? "yes" : "no") << "\n";
}

void print_registers(const CpuRegisters &registers) {
	std::cout << std::hex << std::uppercase << std::setfill('0');
	std::cout << "A:" << std::setw(2) << static_cast<int>(registers.a) << " X:" << std::setw(2)
			  << static_cast<int>(registers.x) << " Y:" << std::setw(2) << static_cast<int>(registers.y)
			  << " P:" << std::setw(2) << static_cast<int>(registers.p.raw()) << " SP:" << std::setw(2)
			  << static_cast<int>(registers.sp) << " PC:" << std::setw(4) << registers.pc;
	std::cout << std::dec << std::setfill(' ');
}

int load_or_report(Cartridge &cartridge, const std::string &path) {
	auto result = cartridge.load_rom(path);
	if (!result) {
		std::cerr << "Failed to load " << path << ": " << describe(result.error()) << "\n";
		return EXIT_ROM_ERROR;
	}
	return 0;
}

int run_disassemble(const std::string &path) {
	auto image = RomLoader::load_from_file(path);
	if (!image) {
		std::cerr << "Failed to load " << path << ": " << describe(image.error()) << "\n";
		return EXIT_ROM_ERROR;
	}

	print_rom_summary(*image);
	std::cout << "\n";

	// 16KB images appear at $C000 as well; list from the lowest mapped copy
	for (const auto &entry : disassemble(image->prg_rom, PRG_ROM_START)) {
		std::cout << format_disassembly(entry) << "\n";
	}
	return 0;
}

int run_program(const RunOptions &options) {
	auto ram = std::make_shared<Ram>();
	auto cartridge = std::make_shared<Cartridge>();
	auto bus = std::make_unique<SystemBus>();

	if (int status = load_or_report(*cartridge, options.rom_path); status != 0) {
		return status;
	}

	bus->connect_ram(ram);
	bus->connect_cartridge(cartridge);
	bus->power_on();

	print_rom_summary(cartridge->get_image());
	std::cout << "\n";
	if (options.verbose) {
		bus->debug_print_memory_map();
		std::cout << "\n";
	}

	CpuConfig config;
	config.log_unknown_opcodes = options.verbose;

	CPU6502 cpu(bus.get(), config);
	cpu.reset();

	if (options.trace) {
		const SystemBus &memory = *bus;
		cpu.set_trace_hook([&memory](const TraceRecord &record) {
			std::string line = format_disassembly(disassemble_at(memory, record.registers.pc));
			std::cout << std::left << std::setw(32) << line << std::right;
			print_registers(record.registers);
			std::cout << " CYC:" << record.cycle << "\n";
		});
	}

	RunSummary summary = cpu.run(options.steps);

	std::cout << "\nExecuted " << summary.steps << " steps in " << cpu.get_total_cycles() << " cycles\n";
	print_registers(cpu.get_registers());
	std::cout << "\n";
	return 0;
}

bool parse_count(std::string_view text, std::uint64_t &value) {
	const char *end = text.data() + text.size();
	auto [ptr, ec] = std::from_chars(text.data(), end, value);
	return ec == std::errc{} && ptr == end;
}

bool parse_run_options(const std::vector<std::string_view> &args, RunOptions &options) {
	if (args.empty()) {
		return false;
	}
	options.rom_path = std::string(args[0]);

	for (std::size_t i = 1; i < args.size(); ++i) {
		if (args[i] == "--trace") {
			options.trace = true;
		} else if (args[i] == "--verbose") {
			options.verbose = true;
		} else if (args[i] == "--steps") {
			if (i + 1 >= args.size() || !parse_count(args[i + 1], options.steps)) {
				std::cerr << "--steps expects a non-negative integer\n";
				return false;
			}
			++i;
		} else {
			std::cerr << "Unknown option: " << args[i] << "\n";
			return false;
		}
	}
	return true;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
	std::vector<std::string_view> args(argv + 1, argv + argc);

	if (args.empty()) {
		print_usage(std::cerr);
		return EXIT_USAGE;
	}

	const std::string_view command = args[0];
	args.erase(args.begin());

	if (command == "disasm") {
		if (args.size() != 1) {
			print_usage(std::cerr);
			return EXIT_USAGE;
		}
		return run_disassemble(std::string(args[0]));
	}

	if (command == "run") {
		RunOptions options;
		if (!parse_run_options(args, options)) {
			print_usage(std::cerr);
			return EXIT_USAGE;
		}
		return run_program(options);
	}

	std::cerr << "Unknown command: " << command << "\n";
	print_usage(std::cerr);
	return EXIT_USAGE;
}
