/*
 * File: region/region_cache.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-18
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <list>
#include <unordered_map>

#include "strata/core/debug.hpp"
#include "strata/core/result.hpp"
#include "strata/nbt/tag.hpp"
#include "strata/region/chunk_locator.hpp"

namespace strata::region {

	// Keeps up to `capacity` region engines open for one folder. The least
	// recently used engine is closed when a new one is needed. Same results
	// as chunk_locator; callers serialise access.
	class region_cache {
	public:
		using region_type = chunk_locator::region_type;
		using load_result = chunk_locator::load_result;
		using save_result = chunk_locator::save_result;

		region_cache(std::filesystem::path folder, std::size_t capacity, time_source now = system_time_now)
			: locator_(std::move(folder), std::move(now))
			, capacity_(capacity)
		{
			STRATA_ASSERT(capacity_ > 0, "region cache needs room for at least one region");
		}

		load_result load_chunk(std::int32_t chunk_x, std::int32_t chunk_z) {
			const chunk_pos pos{ chunk_x, chunk_z };
			const auto rpos = region_of(pos);
			auto* region = find(rpos);
			if (!region) {
				if (!locator_.region_exists(rpos)) {
					return core::fail(load_error::region_not_found(rpos));
				}
				auto opened = fetch(rpos);
				if (!opened) {
					return core::fail(std::move(opened).error());
				}
				region = opened.value();
			}
			const auto local = local_of(pos);
			return region->read_chunk(local.x, local.z);
		}

		save_result save_chunk(std::int32_t chunk_x, std::int32_t chunk_z, const nbt::compound_tag& chunk) {
			const chunk_pos pos{ chunk_x, chunk_z };
			const auto rpos = region_of(pos);
			auto* region = find(rpos);
			if (!region) {
				std::error_code ec;
				std::filesystem::create_directories(locator_.folder(), ec);
				if (ec) {
					return core::fail(save_error::write_error(
						std::format("unable to create {}: {}", locator_.folder().string(), ec.message())));
				}
				auto opened = fetch(rpos);
				if (!opened) {
					return core::fail(save_error::write_error(opened.error().message));
				}
				region = opened.value();
			}
			const auto local = local_of(pos);
			return region->write_chunk(local.x, local.z, chunk);
		}

		bool contains(region_pos r) const {
			return index_.contains(key_of(r));
		}

		// Closes the engine for `r` if it is open.
		bool evict(region_pos r) {
			auto itr = index_.find(key_of(r));
			if (itr == index_.end()) {
				return false;
			}
			lru_.erase(itr->second);
			index_.erase(itr);
			return true;
		}

		void clear() {
			index_.clear();
			lru_.clear();
		}

		std::size_t size() const noexcept {
			return index_.size();
		}

		std::size_t capacity() const noexcept {
			return capacity_;
		}

		const chunk_locator& locator() const noexcept {
			return locator_;
		}

	private:

		struct entry {
			region_pos pos;
			region_type region;
		};

		using lru_list = std::list<entry>;

		static std::uint64_t key_of(region_pos r) noexcept {
			return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(r.x)) << 32)
				| static_cast<std::uint32_t>(r.z);
		}

		// Cached engine moved to the front, or nullptr.
		region_type* find(region_pos r) {
			auto itr = index_.find(key_of(r));
			if (itr == index_.end()) {
				return nullptr;
			}
			lru_.splice(lru_.begin(), lru_, itr->second);
			return &itr->second->region;
		}

		core::result<region_type*, load_error> fetch(region_pos r) {
			auto opened = locator_.open_region(r);
			if (!opened) {
				return core::fail(std::move(opened).error());
			}
			if (index_.size() >= capacity_) {
				auto& victim = lru_.back();
				index_.erase(key_of(victim.pos));
				lru_.pop_back();
			}
			lru_.push_front(entry{ r, std::move(opened).value() });
			index_[key_of(r)] = lru_.begin();
			return &lru_.front().region;
		}

		chunk_locator locator_;
		std::size_t capacity_;
		lru_list lru_;
		std::unordered_map<std::uint64_t, lru_list::iterator> index_;
	};

} // namespace strata::region
