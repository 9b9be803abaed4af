/*
 * File: core/result.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-14
 * License: MIT
 */

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "strata/core/debug.hpp"

namespace strata::core {

	// Carrier for the error branch; keeps construction of result<T, E>
	// unambiguous even when T is constructible from E.
	template <typename E>
	struct failure {
		E error;
	};

	template <typename E>
	failure<std::decay_t<E>> fail(E&& err) {
		return { std::forward<E>(err) };
	}

	template <typename T, typename E>
	class result {
	public:
		using value_type = T;
		using error_type = E;

		result(const value_type& val) : data_(std::in_place_index<0>, val) {}
		result(value_type&& val) : data_(std::in_place_index<0>, std::move(val)) {}

		template <typename U>
			requires std::is_constructible_v<error_type, U&&>
		result(failure<U> f) : data_(std::in_place_index<1>, std::move(f.error)) {}

		bool has_value() const noexcept {
			return data_.index() == 0;
		}

		explicit operator bool() const noexcept {
			return has_value();
		}

		value_type& value() & {
			STRATA_ASSERT(has_value(), "result holds an error");
			return std::get<0>(data_);
		}

		const value_type& value() const & {
			STRATA_ASSERT(has_value(), "result holds an error");
			return std::get<0>(data_);
		}

		value_type&& value() && {
			STRATA_ASSERT(has_value(), "result holds an error");
			return std::get<0>(std::move(data_));
		}

		const error_type& error() const & {
			STRATA_ASSERT(!has_value(), "result holds a value");
			return std::get<1>(data_);
		}

		error_type&& error() && {
			STRATA_ASSERT(!has_value(), "result holds a value");
			return std::get<1>(std::move(data_));
		}

		value_type* operator -> () { return &value(); }
		const value_type* operator -> () const { return &value(); }

	private:
		std::variant<value_type, error_type> data_;
	};

	template <typename E>
	class result<void, E> {
	public:
		using value_type = void;
		using error_type = E;

		result() = default;

		template <typename U>
			requires std::is_constructible_v<error_type, U&&>
		result(failure<U> f) : error_(std::move(f.error)) {}

		bool has_value() const noexcept {
			return !error_.has_value();
		}

		explicit operator bool() const noexcept {
			return has_value();
		}

		const error_type& error() const & {
			STRATA_ASSERT(!has_value(), "result holds a value");
			return *error_;
		}

		error_type&& error() && {
			STRATA_ASSERT(!has_value(), "result holds a value");
			return std::move(*error_);
		}

	private:
		std::optional<error_type> error_;
	};

} // namespace strata::core
