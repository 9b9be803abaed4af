/*
 * File: region/sector_allocator.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <optional>

#include "strata/core/bit_vector.hpp"
#include "strata/region/constants.hpp"
#include "strata/region/header.hpp"

namespace strata::region {

	// One bit per sector of the backing file, set when the sector is occupied.
	// The bitmap length always matches the file length in sectors.
	class sector_allocator {
	public:
		using bitmap_type = core::bit_vector;

		sector_allocator() = default;

		explicit sector_allocator(std::size_t sectors_count)
			: used_(sectors_count, false)
		{
			mark_reserved();
		}

		// Header sectors plus every occupied slot range.
		static sector_allocator from_header(std::size_t sectors_count, const region_header::entries_type& entries) {
			sector_allocator res(sectors_count);
			for (const auto& meta : entries) {
				if (!meta.is_empty()) {
					res.mark_range(meta.sector_index, meta.sector_count, true);
				}
			}
			return res;
		}

		void mark_reserved() {
			for (std::size_t i = 0; i < header_sectors; ++i) {
				used_.set(i);
			}
		}

		// Sectors beyond the bitmap are ignored.
		void mark_range(std::size_t start, std::size_t count, bool used) {
			const auto end = start + count;
			for (std::size_t i = start; i < end && i < used_.bits_count(); ++i) {
				used_.assign(i, used);
			}
		}

		// Lowest start of `required` consecutive free sectors.
		std::optional<std::size_t> first_fit(std::size_t required) const {
			if (required == 0) {
				return std::nullopt;
			}
			std::size_t run = 0;
			for (std::size_t i = 0; i < used_.bits_count(); ++i) {
				if (used_.test(i)) {
					run = 0;
					continue;
				}
				if (++run == required) {
					return i + 1 - required;
				}
			}
			return std::nullopt;
		}

		// Length of the free run ending at the last sector.
		std::size_t trailing_free() const {
			std::size_t run = 0;
			for (auto i = used_.bits_count(); i > 0; --i) {
				if (used_.test(i - 1)) {
					break;
				}
				++run;
			}
			return run;
		}

		// Appends `additional` occupied sectors.
		void grow(std::size_t additional) {
			used_.resize(used_.bits_count() + additional, true);
		}

		bool is_used(std::size_t sector) const {
			return used_.test(sector);
		}

		std::size_t sectors_count() const noexcept {
			return used_.bits_count();
		}

		std::size_t used_count() const {
			return used_.popcount();
		}

		const bitmap_type& bitmap() const noexcept {
			return used_;
		}

	private:
		bitmap_type used_;
	};

} // namespace strata::region
