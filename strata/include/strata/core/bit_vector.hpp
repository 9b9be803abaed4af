/*
 * File: core/bit_vector.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <bit>
#include <climits>
#include <concepts>
#include <cstdint>
#include <vector>

#include "strata/core/debug.hpp"

namespace strata::core {

	// Owning, growable bit sequence. Bits past bits_count() read as zero and
	// writes to them are ignored.
	template <typename WordT = std::uint64_t>
		requires std::unsigned_integral<WordT>
	class basic_bit_vector {
	public:
		using word_type = WordT;
		constexpr static std::size_t data_bits = sizeof(word_type) * CHAR_BIT;

		basic_bit_vector() = default;

		explicit basic_bit_vector(std::size_t count, bool value = false) {
			resize(count, value);
		}

		std::size_t bits_count() const noexcept {
			return count_;
		}

		bool empty() const noexcept {
			return count_ == 0;
		}

		bool is_valid(std::size_t pos) const noexcept {
			return pos < count_;
		}

		void set(std::size_t bit_pos) {
			if (!is_valid(bit_pos)) {
				return;
			}
			words_[bit_pos / data_bits] |= (word_type{ 1 } << (bit_pos % data_bits));
		}

		void clear(std::size_t bit_pos) {
			if (!is_valid(bit_pos)) {
				return;
			}
			words_[bit_pos / data_bits] &= ~(word_type{ 1 } << (bit_pos % data_bits));
		}

		void assign(std::size_t bit_pos, bool value) {
			if (value) {
				set(bit_pos);
			}
			else {
				clear(bit_pos);
			}
		}

		[[nodiscard]]
		bool test(std::size_t bit_pos) const {
			if (!is_valid(bit_pos)) {
				return false;
			}
			return (words_[bit_pos / data_bits] >> (bit_pos % data_bits)) & word_type{ 1 };
		}

		bool operator [] (std::size_t bit_pos) const {
			return test(bit_pos);
		}

		void push_back(bool value) {
			if (count_ % data_bits == 0) {
				words_.push_back(0);
			}
			++count_;
			assign(count_ - 1, value);
		}

		void resize(std::size_t count, bool value = false) {
			const auto old_count = count_;
			words_.resize((count + data_bits - 1) / data_bits, 0);
			count_ = count;
			if (count < old_count) {
				trim_tail();
				return;
			}
			if (value) {
				for (std::size_t i = old_count; i < count; ++i) {
					set(i);
				}
			}
		}

		std::size_t popcount() const {
			std::size_t total = 0;
			for (const auto w : words_) {
				total += static_cast<std::size_t>(std::popcount(w));
			}
			return total;
		}

		// Underlying words, lowest bit first. Handy for bitmap assertions.
		const std::vector<word_type>& words() const noexcept {
			return words_;
		}

		friend bool operator == (const basic_bit_vector&, const basic_bit_vector&) = default;

	private:

		void trim_tail() {
			const auto used = count_ % data_bits;
			if (used != 0 && !words_.empty()) {
				words_.back() &= (word_type{ 1 } << used) - 1;
			}
		}

		std::vector<word_type> words_;
		std::size_t count_ = 0;
	};

	using bit_vector = basic_bit_vector<>;

} // namespace strata::core
