/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "strata/core/bytes.hpp"

// Everything the region format stores is big-endian.
namespace strata::core::byteorder {

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 1) || (sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	template <UnsignedWord WordT>
	constexpr inline WordT be_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native == std::endian::big) {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
		else {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				if constexpr (sizeof(WordT) > 1) {
					result = static_cast<WordT>(result << 8);
				}
				result = static_cast<WordT>(result | std::to_integer<WordT>(mem[i]));
			}
			return result;
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_be_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native == std::endian::big) {
			std::memcpy(mem, &val, sizeof(WordT));
		}
		else {
			for (std::size_t i = sizeof(WordT); i > 0; --i) {
				mem[i - 1] = static_cast<core::byte>(val & 0xFF);
				if constexpr (sizeof(WordT) > 1) {
					val = static_cast<WordT>(val >> 8);
				}
			}
		}
	}

	template <Word WordT>
	constexpr inline WordT be_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return be_to_native_unsigned<WordT>(mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			return std::bit_cast<WordT>(be_to_native_unsigned<unsigned_type>(mem));
		}
	}

	template <Word WordT>
	constexpr inline void native_to_be(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_be_unsigned<WordT>(val, mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			native_to_be_unsigned<unsigned_type>(std::bit_cast<unsigned_type>(val), mem);
		}
	}

	// Appends the big-endian form of `val` to a growing buffer.
	template <Word WordT>
	inline void append_be(core::byte_buffer& out, WordT val) {
		const auto pos = out.size();
		out.resize(pos + sizeof(WordT));
		native_to_be<WordT>(val, out.data() + pos);
	}

	// Unaligned big-endian word, safe to embed in packed on-disk structs.
	template <Word WordT = std::uint32_t>
	class word_be {
	public:
		using word_type = WordT;

		word_be() = default;
		word_be(word_type val) {
			native_to_be<word_type>(val, bytes_);
		}

		word_be& operator = (word_type val) {
			native_to_be<word_type>(val, bytes_);
			return *this;
		}

		operator word_type() const {
			return get();
		}

		word_type get() const {
			return be_to_native<word_type>(bytes_);
		}

	private:
		core::byte bytes_[sizeof(word_type)] = {};
	};

} // namespace strata::core::byteorder
