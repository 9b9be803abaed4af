/*
 * File: region/chunk_locator.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-17
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include "strata/core/result.hpp"
#include "strata/nbt/tag.hpp"
#include "strata/storage/file_device.hpp"
#include "strata/region/clock.hpp"
#include "strata/region/coords.hpp"
#include "strata/region/errors.hpp"
#include "strata/region/region_file.hpp"

namespace strata::region {

	// Maps world chunk coordinates onto region files in one folder. Every call
	// opens its own engine; nothing stays open between calls.
	class chunk_locator {
	public:
		using region_type = region_file<storage::file_device>;
		using load_result = core::result<nbt::compound_tag, load_error>;
		using save_result = core::result<void, save_error>;

		explicit chunk_locator(std::filesystem::path folder, time_source now = system_time_now)
			: folder_(std::move(folder))
			, now_(std::move(now))
		{}

		const std::filesystem::path& folder() const noexcept {
			return folder_;
		}

		std::filesystem::path region_path(region_pos r) const {
			return folder_ / region_file_name(r);
		}

		bool region_exists(region_pos r) const {
			std::error_code ec;
			return std::filesystem::is_regular_file(region_path(r), ec);
		}

		// Never creates a region file.
		load_result load_chunk(std::int32_t chunk_x, std::int32_t chunk_z) const {
			const chunk_pos pos{ chunk_x, chunk_z };
			const auto rpos = region_of(pos);
			if (!region_exists(rpos)) {
				return core::fail(load_error::region_not_found(rpos));
			}
			auto region = open_region(rpos);
			if (!region) {
				return core::fail(std::move(region).error());
			}
			const auto local = local_of(pos);
			return region->read_chunk(local.x, local.z);
		}

		save_result save_chunk(std::int32_t chunk_x, std::int32_t chunk_z, const nbt::compound_tag& chunk) const {
			std::error_code ec;
			std::filesystem::create_directories(folder_, ec);
			if (ec) {
				return core::fail(save_error::write_error(
					std::format("unable to create {}: {}", folder_.string(), ec.message())));
			}
			const chunk_pos pos{ chunk_x, chunk_z };
			auto region = open_region(region_of(pos));
			if (!region) {
				return core::fail(save_error::write_error(region.error().message));
			}
			const auto local = local_of(pos);
			return region->write_chunk(local.x, local.z, chunk);
		}

		// Region files present in the folder, sorted by (x, z). Other files are ignored.
		std::vector<region_pos> list_regions() const {
			std::vector<region_pos> res;
			std::error_code ec;
			for (std::filesystem::directory_iterator it(folder_, ec), end; !ec && it != end; it.increment(ec)) {
				std::error_code entry_ec;
				if (!it->is_regular_file(entry_ec)) {
					continue;
				}
				if (auto r = parse_region_file_name(it->path().filename().string())) {
					res.push_back(*r);
				}
			}
			std::sort(res.begin(), res.end(), [](const region_pos& a, const region_pos& b) {
				return a.x != b.x ? a.x < b.x : a.z < b.z;
			});
			return res;
		}

		// Opens or creates the region file for `r`.
		region_type::open_result open_region(region_pos r) const {
			const auto path = region_path(r);
			storage::file_device dev(path);
			if (!dev.is_open()) {
				return core::fail(load_error::read_error(std::format("unable to open {}", path.string())));
			}
			return region_type::open(std::move(dev), now_);
		}

	private:
		std::filesystem::path folder_;
		time_source now_;
	};

} // namespace strata::region
