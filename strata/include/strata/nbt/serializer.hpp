/*
 * File: nbt/serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/byteorder.hpp"

namespace strata::nbt {

	namespace byteorder = core::byteorder;

	// Big-endian payload codecs for the scalar and array tag bodies.
	// store() appends to `out`; load() reads at `offset`, advancing it on success.
	template <typename T>
	struct serializer;

	template <byteorder::Word WordT>
	struct integer_serializer {
		using value_type = WordT;

		static void store(value_type val, core::byte_buffer& out) {
			byteorder::append_be<value_type>(out, val);
		}

		static std::optional<value_type> load(core::byte_view in, std::size_t& offset) {
			if (offset > in.size() || in.size() - offset < sizeof(value_type)) {
				return std::nullopt;
			}
			const auto val = byteorder::be_to_native<value_type>(in.data() + offset);
			offset += sizeof(value_type);
			return val;
		}
	};

	template <typename FloatT, typename BitsT>
	struct float_serializer {
		static_assert(sizeof(FloatT) == sizeof(BitsT), "Unsupported float size");
		using value_type = FloatT;

		static void store(value_type val, core::byte_buffer& out) {
			integer_serializer<BitsT>::store(std::bit_cast<BitsT>(val), out);
		}

		static std::optional<value_type> load(core::byte_view in, std::size_t& offset) {
			if (auto bits = integer_serializer<BitsT>::load(in, offset)) {
				return std::bit_cast<value_type>(*bits);
			}
			return std::nullopt;
		}
	};

	template <>
	struct serializer<std::int8_t> : public integer_serializer<std::int8_t> {};
	template <>
	struct serializer<std::int16_t> : public integer_serializer<std::int16_t> {};
	template <>
	struct serializer<std::int32_t> : public integer_serializer<std::int32_t> {};
	template <>
	struct serializer<std::int64_t> : public integer_serializer<std::int64_t> {};
	template <>
	struct serializer<std::uint8_t> : public integer_serializer<std::uint8_t> {};
	template <>
	struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};

	template <>
	struct serializer<float> : public float_serializer<float, std::uint32_t> {};
	template <>
	struct serializer<double> : public float_serializer<double, std::uint64_t> {};

	// [len:u16][bytes...], no terminator. Bytes are kept as stored (modified UTF-8).
	template <>
	struct serializer<std::string> {
		using value_type = std::string;

		static bool fits(const value_type& val) noexcept {
			return val.size() <= std::numeric_limits<std::uint16_t>::max();
		}

		static void store(const value_type& val, core::byte_buffer& out) {
			serializer<std::uint16_t>::store(static_cast<std::uint16_t>(val.size()), out);
			const auto* src = reinterpret_cast<const core::byte*>(val.data());
			out.insert(out.end(), src, src + val.size());
		}

		static std::optional<value_type> load(core::byte_view in, std::size_t& offset) {
			auto start = offset;
			const auto len = serializer<std::uint16_t>::load(in, start);
			if (!len || in.size() - start < *len) {
				return std::nullopt;
			}
			value_type val(reinterpret_cast<const char*>(in.data() + start), *len);
			offset = start + *len;
			return val;
		}
	};

	// [count:i32][elements...]
	template <typename ElemT>
	struct array_serializer {
		using value_type = std::vector<ElemT>;

		static void store(const value_type& val, core::byte_buffer& out) {
			serializer<std::int32_t>::store(static_cast<std::int32_t>(val.size()), out);
			out.reserve(out.size() + val.size() * sizeof(ElemT));
			for (const auto& e : val) {
				serializer<ElemT>::store(e, out);
			}
		}

		// A negative count is reported through `negative` so the caller can tell it
		// apart from a short buffer.
		static std::optional<value_type> load(core::byte_view in, std::size_t& offset, bool& negative) {
			negative = false;
			auto pos = offset;
			const auto count = serializer<std::int32_t>::load(in, pos);
			if (!count) {
				return std::nullopt;
			}
			if (*count < 0) {
				negative = true;
				return std::nullopt;
			}
			const auto n = static_cast<std::size_t>(*count);
			if ((in.size() - pos) / sizeof(ElemT) < n) {
				return std::nullopt;
			}
			value_type val;
			val.reserve(n);
			for (std::size_t i = 0; i < n; ++i) {
				val.push_back(*serializer<ElemT>::load(in, pos));
			}
			offset = pos;
			return val;
		}
	};

	template <>
	struct serializer<std::vector<std::int8_t>> : public array_serializer<std::int8_t> {};
	template <>
	struct serializer<std::vector<std::int32_t>> : public array_serializer<std::int32_t> {};
	template <>
	struct serializer<std::vector<std::int64_t>> : public array_serializer<std::int64_t> {};

} // namespace strata::nbt
