/*
 * File: region/errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <string>

#include "strata/region/coords.hpp"

namespace strata::region {

	enum class load_errc {
		region_not_found,
		chunk_not_found,
		length_exceeds_maximum,
		unsupported_compression_scheme,
		invalid_length,
		read_error,
		tag_decode_error,
	};

	// Only the fields relevant to `code` are meaningful.
	struct load_error {
		load_errc code = load_errc::read_error;
		region_pos region{};
		local_pos local{};
		std::uint32_t length = 0;
		std::uint32_t maximum = 0;
		std::uint8_t scheme = 0;
		std::string message{};

		static load_error region_not_found(region_pos r) {
			load_error e{ load_errc::region_not_found };
			e.region = r;
			return e;
		}

		static load_error chunk_not_found(local_pos l) {
			load_error e{ load_errc::chunk_not_found };
			e.local = l;
			return e;
		}

		static load_error length_exceeds_maximum(std::uint32_t length, std::uint32_t maximum) {
			load_error e{ load_errc::length_exceeds_maximum };
			e.length = length;
			e.maximum = maximum;
			return e;
		}

		static load_error unsupported_compression_scheme(std::uint8_t scheme) {
			load_error e{ load_errc::unsupported_compression_scheme };
			e.scheme = scheme;
			return e;
		}

		static load_error invalid_length(std::uint32_t length) {
			load_error e{ load_errc::invalid_length };
			e.length = length;
			return e;
		}

		static load_error read_error(std::string msg) {
			load_error e{ load_errc::read_error };
			e.message = std::move(msg);
			return e;
		}

		static load_error tag_decode_error(std::string msg) {
			load_error e{ load_errc::tag_decode_error };
			e.message = std::move(msg);
			return e;
		}

		std::string describe() const {
			switch (code) {
			case load_errc::region_not_found:
				return std::format("region {},{} not found", region.x, region.z);
			case load_errc::chunk_not_found:
				return std::format("chunk {},{} not found in region", local.x, local.z);
			case load_errc::length_exceeds_maximum:
				return std::format("chunk length {} exceeds maximum {}", length, maximum);
			case load_errc::unsupported_compression_scheme:
				return std::format("unsupported compression scheme {}", scheme);
			case load_errc::invalid_length:
				return std::format("invalid chunk length {}", length);
			case load_errc::read_error:
				return std::format("read error: {}", message);
			case load_errc::tag_decode_error:
				return std::format("tag decode error: {}", message);
			}
			return "unknown load error";
		}
	};

	enum class save_errc {
		length_exceeds_maximum,
		write_error,
		encode_error,
	};

	struct save_error {
		save_errc code = save_errc::write_error;
		std::uint32_t length = 0;
		std::uint32_t maximum = 0;
		std::string message{};

		static save_error length_exceeds_maximum(std::uint32_t length,
			std::uint32_t maximum = static_cast<std::uint32_t>(max_chunk_bytes))
		{
			save_error e{ save_errc::length_exceeds_maximum };
			e.length = length;
			e.maximum = maximum;
			return e;
		}

		static save_error write_error(std::string msg) {
			save_error e{ save_errc::write_error };
			e.message = std::move(msg);
			return e;
		}

		// Tag encoding or compression failed before anything was written.
		static save_error encode_error(std::string msg) {
			save_error e{ save_errc::encode_error };
			e.message = std::move(msg);
			return e;
		}

		std::string describe() const {
			switch (code) {
			case save_errc::length_exceeds_maximum:
				return std::format("chunk length {} exceeds maximum {}", length, maximum);
			case save_errc::write_error:
				return std::format("write error: {}", message);
			case save_errc::encode_error:
				return std::format("encode error: {}", message);
			}
			return "unknown save error";
		}
	};

} // namespace strata::region
