/*
 * File: region/header.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>

#include "strata/core/bytes.hpp"
#include "strata/core/debug.hpp"
#include "strata/core/types.hpp"
#include "strata/storage/device.hpp"
#include "strata/region/constants.hpp"

namespace strata::region {

	using core::word_be32;

	// Location and age of one chunk record. sector_count == 0 marks an empty slot.
	struct chunk_metadata {
		std::uint32_t sector_index = 0;
		std::uint8_t sector_count = 0;
		std::uint32_t last_modified = 0;   // unix seconds

		bool is_empty() const noexcept {
			return sector_count == 0;
		}

		std::uint32_t offset_word() const noexcept {
			return (sector_index << 8) | sector_count;
		}

		static chunk_metadata from_words(std::uint32_t offset, std::uint32_t timestamp) noexcept {
			return { offset >> 8, static_cast<std::uint8_t>(offset & 0xFF), timestamp };
		}

		friend bool operator == (const chunk_metadata&, const chunk_metadata&) = default;
	};

	// On-disk image of the first two sectors.
	STRATA_PACKED_STRUCT_BEGIN
	struct header_layout {
		word_be32 offsets[chunks_per_region];
		word_be32 timestamps[chunks_per_region];
	} STRATA_PACKED;
	STRATA_PACKED_STRUCT_END

	static_assert(sizeof(header_layout) == header_bytes, "header_layout must span exactly two sectors");

	// In-memory copy of the 1024 slot entries. Loaded once; afterwards every
	// change goes through persist_entry() for exactly one slot.
	class region_header {
	public:
		using entries_type = std::array<chunk_metadata, chunks_per_region>;

		region_header() = default;

		// Zero-extends a short device to the full header size.
		template <storage::RandomAccessDevice DevT>
		static bool open_or_create(DevT& dev) {
			if (!dev.is_open()) {
				return false;
			}
			if (dev.get_file_size() < header_bytes) {
				return dev.grow_to(header_bytes);
			}
			return true;
		}

		template <storage::RandomAccessDevice DevT>
		static std::optional<region_header> parse(DevT& dev) {
			auto layout = std::make_unique<header_layout>();
			if (!dev.read_at_offset(0, reinterpret_cast<core::byte*>(layout.get()), sizeof(header_layout))) {
				return std::nullopt;
			}
			region_header res;
			for (std::size_t i = 0; i < chunks_per_region; ++i) {
				res.entries_[i] = chunk_metadata::from_words(layout->offsets[i].get(), layout->timestamps[i].get());
			}
			return res;
		}

		// Writes the offset word at slot * 4 and the timestamp word one sector later.
		template <storage::RandomAccessDevice DevT>
		static bool persist_entry(DevT& dev, std::size_t slot, const chunk_metadata& meta) {
			STRATA_ASSERT(slot < chunks_per_region, "slot index out of range");
			const word_be32 offset{ meta.offset_word() };
			const word_be32 stamp{ meta.last_modified };
			const auto pos = static_cast<storage::position_type>(slot * sizeof(word_be32));
			return dev.write_at_offset(pos, reinterpret_cast<const core::byte*>(&offset), sizeof(offset))
				&& dev.write_at_offset(pos + timestamps_offset, reinterpret_cast<const core::byte*>(&stamp), sizeof(stamp));
		}

		const chunk_metadata& at(std::size_t slot) const {
			STRATA_ASSERT(slot < chunks_per_region, "slot index out of range");
			return entries_[slot];
		}

		void set(std::size_t slot, const chunk_metadata& meta) {
			STRATA_ASSERT(slot < chunks_per_region, "slot index out of range");
			entries_[slot] = meta;
		}

		const entries_type& entries() const noexcept {
			return entries_;
		}

	private:
		entries_type entries_{};
	};

} // namespace strata::region
