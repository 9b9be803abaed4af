/*
 * File: region/constants.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <cstdint>

namespace strata::region {

	constexpr std::size_t sector_size = 4096;

	// 32 x 32 chunks per region
	constexpr std::int32_t region_shift = 5;
	constexpr std::int32_t region_width = 1 << region_shift;
	constexpr std::int32_t local_mask = region_width - 1;
	constexpr std::size_t chunks_per_region = region_width * region_width;

	// offsets table + timestamps table, one sector each
	constexpr std::size_t header_sectors = 2;
	constexpr std::size_t header_bytes = header_sectors * sector_size;
	constexpr std::size_t timestamps_offset = sector_size;

	// A record (length prefix, scheme byte, payload) may span this many sectors.
	constexpr std::size_t max_chunk_sectors = 256;
	constexpr std::size_t max_chunk_bytes = max_chunk_sectors * sector_size;

	// sector_count lives in the low byte of the offset word.
	constexpr std::size_t max_sector_count = 0xFF;

	// BE u32 length + scheme byte
	constexpr std::size_t record_length_bytes = 4;
	constexpr std::size_t record_header_bytes = record_length_bytes + 1;

	constexpr const char* region_file_extension = ".mca";

} // namespace strata::region
