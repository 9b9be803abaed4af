/*
 * File: region/coords.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "strata/core/debug.hpp"
#include "strata/region/constants.hpp"

namespace strata::region {

	struct chunk_pos {
		std::int32_t x = 0;
		std::int32_t z = 0;
		friend bool operator == (const chunk_pos&, const chunk_pos&) = default;
	};

	struct region_pos {
		std::int32_t x = 0;
		std::int32_t z = 0;
		friend bool operator == (const region_pos&, const region_pos&) = default;
	};

	// Position inside a region, both components in [0, 31].
	struct local_pos {
		std::uint8_t x = 0;
		std::uint8_t z = 0;
		friend bool operator == (const local_pos&, const local_pos&) = default;
	};

	// Arithmetic shift, so -1 lands in region -1.
	constexpr region_pos region_of(chunk_pos c) noexcept {
		return { c.x >> region_shift, c.z >> region_shift };
	}

	constexpr local_pos local_of(chunk_pos c) noexcept {
		return { static_cast<std::uint8_t>(c.x & local_mask),
			static_cast<std::uint8_t>(c.z & local_mask) };
	}

	// Regions whose chunks all fit in 32-bit chunk coordinates.
	constexpr bool is_valid_region(region_pos r) noexcept {
		constexpr std::int32_t limit = std::int32_t{ 1 } << (31 - region_shift);
		return r.x >= -limit && r.x < limit && r.z >= -limit && r.z < limit;
	}

	// Inverse of region_of and local_of; `r` must satisfy is_valid_region.
	constexpr chunk_pos chunk_of(region_pos r, local_pos l) noexcept {
		return { static_cast<std::int32_t>(std::int64_t{ r.x } * region_width + l.x),
			static_cast<std::int32_t>(std::int64_t{ r.z } * region_width + l.z) };
	}

	constexpr bool is_valid_local(std::int32_t x, std::int32_t z) noexcept {
		return x >= 0 && x < region_width && z >= 0 && z < region_width;
	}

	constexpr std::size_t slot_index(local_pos l) noexcept {
		return static_cast<std::size_t>(l.x) + static_cast<std::size_t>(l.z) * region_width;
	}

	constexpr local_pos local_of_slot(std::size_t slot) noexcept {
		return { static_cast<std::uint8_t>(slot % region_width),
			static_cast<std::uint8_t>(slot / region_width) };
	}

	inline std::string region_file_name(region_pos r) {
		return std::format("r.{}.{}{}", r.x, r.z, region_file_extension);
	}

	namespace detail {
		inline std::optional<std::int32_t> parse_i32(std::string_view s) {
			std::int32_t value = 0;
			const auto* first = s.data();
			const auto* last = s.data() + s.size();
			auto [ptr, ec] = std::from_chars(first, last, value);
			if (s.empty() || ec != std::errc{} || ptr != last) {
				return std::nullopt;
			}
			return value;
		}
	}

	// Inverse of region_file_name; anything else yields nullopt.
	inline std::optional<region_pos> parse_region_file_name(std::string_view name) {
		const std::string_view ext = region_file_extension;
		if (name.size() < 2 + ext.size() || !name.starts_with("r.") || !name.ends_with(ext)) {
			return std::nullopt;
		}
		name.remove_prefix(2);
		name.remove_suffix(ext.size());
		const auto dot = name.find('.');
		if (dot == std::string_view::npos) {
			return std::nullopt;
		}
		auto x = detail::parse_i32(name.substr(0, dot));
		auto z = detail::parse_i32(name.substr(dot + 1));
		if (!x || !z) {
			return std::nullopt;
		}
		return region_pos{ *x, *z };
	}

} // namespace strata::region
