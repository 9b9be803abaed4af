/*
 * File: region/region_file.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-17
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <utility>

#include <zlib.h>

#include "strata/core/bytes.hpp"
#include "strata/core/byteorder.hpp"
#include "strata/core/debug.hpp"
#include "strata/core/result.hpp"
#include "strata/codec/compression.hpp"
#include "strata/nbt/codec.hpp"
#include "strata/nbt/tag.hpp"
#include "strata/storage/device.hpp"
#include "strata/storage/stats.hpp"
#include "strata/region/clock.hpp"
#include "strata/region/constants.hpp"
#include "strata/region/coords.hpp"
#include "strata/region/errors.hpp"
#include "strata/region/header.hpp"
#include "strata/region/sector_allocator.hpp"

namespace strata::region {

	using codec::compression_scheme;

	// Envelope contents as stored: scheme id and the still compressed payload.
	struct chunk_record {
		std::uint8_t scheme = 0;
		core::byte_buffer payload{};
	};

	template <storage::RandomAccessDevice DevT, typename StatsT = storage::null_stats>
	class region_file {
	public:
		using device_type = DevT;
		using stats_type = StatsT;
		using open_result = core::result<region_file, load_error>;
		using record_result = core::result<chunk_record, load_error>;
		using chunk_result = core::result<nbt::compound_tag, load_error>;
		using save_result = core::result<void, save_error>;

		region_file(region_file&&) = default;
		region_file& operator = (region_file&&) = default;
		region_file(const region_file&) = delete;
		region_file& operator = (const region_file&) = delete;

		// Extends a short device to the header size, loads the header and
		// rebuilds the sector bitmap from it.
		static open_result open(device_type dev, time_source now = system_time_now) {
			if (!region_header::open_or_create(dev)) {
				return core::fail(load_error::read_error("unable to create region header"));
			}
			auto hdr = region_header::parse(dev);
			if (!hdr) {
				return core::fail(load_error::read_error("unable to read region header"));
			}
			const auto sectors = static_cast<std::size_t>(dev.get_file_size() / sector_size);
			auto alloc = sector_allocator::from_header(sectors, hdr->entries());
			return region_file(std::move(dev), std::move(*hdr), std::move(alloc), std::move(now));
		}

		const chunk_metadata& metadata(std::uint8_t local_x, std::uint8_t local_z) const {
			return header_.at(checked_slot(local_x, local_z));
		}

		bool has_chunk(std::uint8_t local_x, std::uint8_t local_z) const {
			return !metadata(local_x, local_z).is_empty();
		}

		std::size_t chunk_count() const {
			return static_cast<std::size_t>(std::count_if(header_.entries().begin(), header_.entries().end(),
				[](const chunk_metadata& m) { return !m.is_empty(); }));
		}

		// Calls fn(local_pos, const chunk_metadata&) for each occupied slot, in slot order.
		template <typename FnT>
		void for_each_chunk(FnT&& fn) const {
			const auto& entries = header_.entries();
			for (std::size_t slot = 0; slot < entries.size(); ++slot) {
				if (!entries[slot].is_empty()) {
					fn(local_of_slot(slot), entries[slot]);
				}
			}
		}

		record_result read_record(std::uint8_t local_x, std::uint8_t local_z) {
			const auto meta = metadata(local_x, local_z);
			if (meta.is_empty()) {
				return core::fail(load_error::chunk_not_found({ local_x, local_z }));
			}

			const auto base = static_cast<storage::position_type>(meta.sector_index) * sector_size;
			core::byte len_buf[record_length_bytes];
			if (!device_.read_at_offset(base, len_buf, sizeof(len_buf))) {
				return core::fail(load_error::read_error(
					std::format("unable to read record length at sector {}", meta.sector_index)));
			}
			const auto length = core::byteorder::be_to_native<std::uint32_t>(len_buf);

			// The declared length counts the prefix's own sector space too.
			const auto maximum = static_cast<std::uint32_t>(
				std::min<std::size_t>(std::size_t{ meta.sector_count } * sector_size, max_chunk_bytes));
			if (length > maximum) {
				return core::fail(load_error::length_exceeds_maximum(length, maximum));
			}
			if (length == 0) {
				return core::fail(load_error::invalid_length(length));
			}

			core::byte_buffer body(length);
			if (!device_.read_at_offset(base + record_length_bytes, body.data(), body.size())) {
				return core::fail(load_error::read_error(
					std::format("unable to read {} record bytes at sector {}", length, meta.sector_index)));
			}
			++stats_.reads;

			chunk_record rec;
			rec.scheme = std::to_integer<std::uint8_t>(body[0]);
			rec.payload.assign(body.begin() + 1, body.end());
			return rec;
		}

		chunk_result read_chunk(std::uint8_t local_x, std::uint8_t local_z) {
			auto rec = read_record(local_x, local_z);
			if (!rec) {
				return core::fail(std::move(rec).error());
			}

			const auto scheme = static_cast<compression_scheme>(rec->scheme);
			if (scheme != compression_scheme::gzip && scheme != compression_scheme::zlib) {
				return core::fail(load_error::unsupported_compression_scheme(rec->scheme));
			}
			auto raw = (scheme == compression_scheme::gzip)
				? codec::decompress_gzip(rec->payload)
				: codec::decompress_zlib(rec->payload);
			if (!raw) {
				return core::fail(load_error::tag_decode_error(raw.error().describe()));
			}

			auto decoded = nbt::decode(raw.value());
			if (!decoded) {
				return core::fail(load_error::tag_decode_error(decoded.error().describe()));
			}
			return std::move(decoded).value();
		}

		// Writes an already compressed payload under `scheme`.
		save_result write_record(std::uint8_t local_x, std::uint8_t local_z,
			std::uint8_t scheme, core::byte_view payload)
		{
			const auto slot = checked_slot(local_x, local_z);

			const std::size_t total_length = payload.size() + record_header_bytes;
			if (total_length > max_chunk_bytes) {
				return core::fail(save_error::length_exceeds_maximum(clamp_u32(total_length)));
			}
			// An evenly dividing length still gets one extra sector; readers
			// rely on the same rounding.
			const std::size_t required = total_length / sector_size + 1;
			if (required > max_sector_count) {
				return core::fail(save_error::length_exceeds_maximum(
					clamp_u32(total_length), clamp_u32(max_sector_count * sector_size - 1)));
			}

			const auto old = header_.at(slot);
			auto start = place(slot, required);
			if (!start) {
				return core::fail(std::move(start).error());
			}

			core::byte_buffer buf;
			buf.reserve(required * sector_size);
			core::byteorder::append_be<std::uint32_t>(buf, static_cast<std::uint32_t>(total_length - record_length_bytes));
			buf.push_back(static_cast<core::byte>(scheme));
			buf.insert(buf.end(), payload.begin(), payload.end());
			buf.resize(required * sector_size, core::byte{ 0 });

			const auto base = static_cast<storage::position_type>(start.value()) * sector_size;
			if (!device_.write_at_offset(base, buf.data(), buf.size())) {
				unplace(old, start.value(), required);
				return core::fail(save_error::write_error(
					std::format("unable to write {} bytes at sector {}", buf.size(), start.value())));
			}

			const chunk_metadata meta{
				static_cast<std::uint32_t>(start.value()),
				static_cast<std::uint8_t>(required),
				now_()
			};
			if (!region_header::persist_entry(device_, slot, meta)) {
				unplace(old, start.value(), required);
				return core::fail(save_error::write_error(
					std::format("unable to update header entry {}", slot)));
			}
			header_.set(slot, meta);
			++stats_.writes;
			return {};
		}

		// Encodes, zlib-compresses and stores a chunk tag.
		save_result write_chunk(std::uint8_t local_x, std::uint8_t local_z, const nbt::compound_tag& chunk) {
			auto raw = nbt::encode(chunk);
			if (!raw) {
				return core::fail(save_error::encode_error(raw.error().describe()));
			}
			auto packed = codec::compress_zlib(raw.value(), compression_level_);
			if (!packed) {
				return core::fail(save_error::encode_error(packed.error().describe()));
			}
			return write_record(local_x, local_z,
				static_cast<std::uint8_t>(compression_scheme::zlib), packed.value());
		}

		void set_compression_level(int level) noexcept {
			compression_level_ = level;
		}

		std::size_t sectors_count() const noexcept {
			return allocator_.sectors_count();
		}

		std::size_t used_sectors() const {
			return allocator_.used_count();
		}

		device_type& device() noexcept { return device_; }
		const device_type& device() const noexcept { return device_; }

		stats_type& stats() noexcept { return stats_; }
		const stats_type& stats() const noexcept { return stats_; }

	PRIVATE_TESTABLE:

		region_file(device_type dev, region_header hdr, sector_allocator alloc, time_source now)
			: device_(std::move(dev))
			, header_(std::move(hdr))
			, allocator_(std::move(alloc))
			, now_(now ? std::move(now) : time_source{ system_time_now })
		{}

		static std::size_t checked_slot(std::uint8_t local_x, std::uint8_t local_z) {
			STRATA_ASSERT(is_valid_local(local_x, local_z), "local chunk coordinates must be in [0, 31]");
			return slot_index({ local_x, local_z });
		}

		static std::uint32_t clamp_u32(std::size_t v) {
			return static_cast<std::uint32_t>(std::min<std::size_t>(v, 0xFFFFFFFFu));
		}

		// Picks the first sector for `required` sectors on behalf of `slot`:
		// in place when the size class is unchanged, else the first free run
		// that fits, else the tail of the file, grown as needed.
		core::result<std::size_t, save_error> place(std::size_t slot, std::size_t required) {
			const auto old = header_.at(slot);
			if (!old.is_empty() && old.sector_count == required) {
				++stats_.in_place_writes;
				return static_cast<std::size_t>(old.sector_index);
			}

			if (!old.is_empty()) {
				allocator_.mark_range(old.sector_index, old.sector_count, false);
			}

			if (auto fit = allocator_.first_fit(required)) {
				allocator_.mark_range(*fit, required, true);
				++stats_.gap_reuses;
				return *fit;
			}

			const auto trailing = allocator_.trailing_free();
			const auto start = allocator_.sectors_count() - trailing;
			const auto additional = required - trailing;
			const auto new_size = static_cast<storage::position_type>(allocator_.sectors_count() + additional) * sector_size;
			if (!device_.grow_to(new_size)) {
				if (!old.is_empty()) {
					allocator_.mark_range(old.sector_index, old.sector_count, true);
				}
				return core::fail(save_error::write_error(
					std::format("unable to grow region to {} bytes", new_size)));
			}
			allocator_.grow(additional);
			allocator_.mark_range(start, required, true);
			++stats_.file_grows;
			stats_.sectors_grown += additional;
			return start;
		}

		// Undoes the bitmap side of place() once the write behind it failed;
		// the header still owns `old`.
		void unplace(const chunk_metadata& old, std::size_t start, std::size_t required) {
			if (!old.is_empty() && old.sector_index == start && old.sector_count == required) {
				return;
			}
			allocator_.mark_range(start, required, false);
			if (!old.is_empty()) {
				allocator_.mark_range(old.sector_index, old.sector_count, true);
			}
		}

		device_type device_;
		region_header header_;
		sector_allocator allocator_;
		time_source now_;
		stats_type stats_{};
		int compression_level_ = Z_DEFAULT_COMPRESSION;
	};

} // namespace strata::region
