#include "strata/region/chunk_locator.hpp"
#include "strata/nbt/debug_print.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
	using namespace strata;
	using locator_type = region::chunk_locator;

	std::vector<std::string> split_command(const std::string& line) {
		std::vector<std::string> args;
		std::string current;
		bool in_quotes = false;
		bool escaped = false;

		for (char ch : line) {
			if (escaped) {
				current += ch;
				escaped = false;
			}
			else if (ch == '\\') {
				escaped = true;
			}
			else if (ch == '"') {
				in_quotes = !in_quotes;
			}
			else if (std::isspace(static_cast<unsigned char>(ch)) && !in_quotes) {
				if (!current.empty()) {
					args.push_back(current);
					current.clear();
				}
			}
			else {
				current += ch;
			}
		}

		if (!current.empty()) {
			args.push_back(current);
		}

		return args;
	}

	std::optional<std::int32_t> to_i32(const std::string& s) {
		std::int32_t value = 0;
		auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
		if (ec != std::errc{} || ptr != s.data() + s.size()) {
			return std::nullopt;
		}
		return value;
	}

	int cmd_regions(const std::string& world) {
		try {
			locator_type locator(world);
			const auto regions = locator.list_regions();
			std::cout << "Total regions: " << regions.size() << "\n";
			for (const auto& r : regions) {
				std::cout << region::region_file_name(r) << "\n";
			}
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error listing regions: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_ls(const std::string& world, std::int32_t rx, std::int32_t rz) {
		try {
			locator_type locator(world);
			const region::region_pos rpos{ rx, rz };
			if (!region::is_valid_region(rpos)) {
				std::cerr << "Region " << rx << "," << rz << " is outside the chunk coordinate range\n";
				return 1;
			}
			if (!locator.region_exists(rpos)) {
				std::cerr << region::load_error::region_not_found(rpos).describe() << "\n";
				return 1;
			}
			auto file = locator.open_region(rpos);
			if (!file) {
				std::cerr << file.error().describe() << "\n";
				return 1;
			}

			std::cout << "Total chunks: " << file->chunk_count() << "\n";
			file->for_each_chunk([&](region::local_pos l, const region::chunk_metadata& m) {
				const auto c = region::chunk_of(rpos, l);
				std::cout << "chunk " << c.x << "," << c.z
					<< " sector " << m.sector_index
					<< " x" << static_cast<int>(m.sector_count)
					<< " modified " << m.last_modified << "\n";
				});
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error listing region: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_info(const std::string& world, std::int32_t rx, std::int32_t rz) {
		try {
			locator_type locator(world);
			const region::region_pos rpos{ rx, rz };
			if (!locator.region_exists(rpos)) {
				std::cerr << region::load_error::region_not_found(rpos).describe() << "\n";
				return 1;
			}
			auto file = locator.open_region(rpos);
			if (!file) {
				std::cerr << file.error().describe() << "\n";
				return 1;
			}

			const auto sectors = file->sectors_count();
			const auto used = file->used_sectors();
			std::cout << "Path: " << locator.region_path(rpos).string() << "\n";
			std::cout << "File size: " << file->device().get_file_size() << "\n";
			std::cout << "Sectors: " << sectors << " (used " << used << ", free " << (sectors - used) << ")\n";
			std::cout << "Chunks: " << file->chunk_count() << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error reading region info: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_dump(const std::string& world, std::int32_t cx, std::int32_t cz) {
		try {
			locator_type locator(world);
			auto chunk = locator.load_chunk(cx, cz);
			if (!chunk) {
				std::cerr << chunk.error().describe() << "\n";
				return 1;
			}
			nbt::debug_print(std::cout, chunk.value());
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error dumping chunk: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_touch(const std::string& world, std::int32_t cx, std::int32_t cz) {
		try {
			locator_type locator(world);

			nbt::compound_tag level;
			level.insert_i32("xPos", cx);
			level.insert_i32("zPos", cz);
			level.insert_i64("LastUpdate", 0);
			nbt::compound_tag chunk;
			chunk.insert_compound_tag("Level", std::move(level));

			auto res = locator.save_chunk(cx, cz, chunk);
			if (!res) {
				std::cerr << res.error().describe() << "\n";
				return 1;
			}
			std::cout << "Chunk written: " << cx << "," << cz << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error writing chunk: " << e.what() << "\n";
			return 1;
		}
	}

	void cmd_help() {
		std::cout << "\nstratactl Available Commands:\n";
		std::cout << "  regions         - List region files\n";
		std::cout << "  ls <rx> <rz>    - List chunks stored in a region\n";
		std::cout << "  info <rx> <rz>  - Show region file usage\n";
		std::cout << "  dump <cx> <cz>  - Print a chunk's tag tree\n";
		std::cout << "  touch <cx> <cz> - Write a minimal chunk\n";
		std::cout << "  help            - Show this help\n";
		std::cout << "  exit/quit       - Exit shell\n\n";
	}

	// Runs a two-coordinate command from shell arguments.
	template <typename FnT>
	void with_coords(const std::vector<std::string>& args, const char* usage, FnT&& fn) {
		if (args.size() < 3) {
			std::cerr << "Usage: " << usage << "\n";
			return;
		}
		auto a = to_i32(args[1]);
		auto b = to_i32(args[2]);
		if (!a || !b) {
			std::cerr << "Coordinates must be integers\n";
			return;
		}
		fn(*a, *b);
	}
}

void shell_mode(const std::string& world) {
	replxx::Replxx rx;
	rx.set_max_history_size(128);

	std::cout << "stratactl shell - " << world << "\n";
	std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

	while (true) {
		const char* input = rx.input("strata> ");
		if (!input) break;

		std::string line(input);
		if (line.empty()) continue;
		if (line == "exit" || line == "quit") break;

		std::vector<std::string> args = split_command(line);
		if (args.empty()) continue;

		const auto& cmd = args[0];

		if (cmd == "help") {
			cmd_help();
		}
		else if (cmd == "regions") {
			cmd_regions(world);
		}
		else if (cmd == "ls") {
			with_coords(args, "ls <rx> <rz>", [&](auto x, auto z) { cmd_ls(world, x, z); });
		}
		else if (cmd == "info") {
			with_coords(args, "info <rx> <rz>", [&](auto x, auto z) { cmd_info(world, x, z); });
		}
		else if (cmd == "dump") {
			with_coords(args, "dump <cx> <cz>", [&](auto x, auto z) { cmd_dump(world, x, z); });
		}
		else if (cmd == "touch") {
			with_coords(args, "touch <cx> <cz>", [&](auto x, auto z) { cmd_touch(world, x, z); });
		}
		else {
			std::cerr << "Unknown command: " << cmd << " (type 'help' for available commands)\n";
		}

		rx.history_add(line);
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "stratactl - region file inspection tool" };

	std::string world;
	app.add_option("world", world, "Folder holding r.<x>.<z>.mca files")->required();

	app.require_subcommand(1);

	std::int32_t x = 0;
	std::int32_t z = 0;
	int rc = 0;

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		shell_mode(world);
		});

	auto regions_cmd = app.add_subcommand("regions", "List region files");
	regions_cmd->callback([&]() {
		rc = cmd_regions(world);
		});

	auto ls_cmd = app.add_subcommand("ls", "List chunks stored in a region");
	ls_cmd->add_option("rx", x, "Region x")->required();
	ls_cmd->add_option("rz", z, "Region z")->required();
	ls_cmd->callback([&]() {
		rc = cmd_ls(world, x, z);
		});

	auto info_cmd = app.add_subcommand("info", "Show region file usage");
	info_cmd->add_option("rx", x, "Region x")->required();
	info_cmd->add_option("rz", z, "Region z")->required();
	info_cmd->callback([&]() {
		rc = cmd_info(world, x, z);
		});

	auto dump_cmd = app.add_subcommand("dump", "Print a chunk's tag tree");
	dump_cmd->add_option("cx", x, "Chunk x")->required();
	dump_cmd->add_option("cz", z, "Chunk z")->required();
	dump_cmd->callback([&]() {
		rc = cmd_dump(world, x, z);
		});

	auto touch_cmd = app.add_subcommand("touch", "Write a minimal chunk");
	touch_cmd->add_option("cx", x, "Chunk x")->required();
	touch_cmd->add_option("cz", z, "Chunk z")->required();
	touch_cmd->callback([&]() {
		rc = cmd_touch(world, x, z);
		});

	CLI11_PARSE(app, argc, argv);

	return rc;
}
