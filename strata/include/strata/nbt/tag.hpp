/*
 * File: nbt/tag.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-14
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::nbt {

	// Wire ids of the tag kinds.
	enum class tag_type : std::uint8_t {
		end = 0,
		i8 = 1,
		i16 = 2,
		i32 = 3,
		i64 = 4,
		fp32 = 5,
		fp64 = 6,
		i8_array = 7,
		string = 8,
		list = 9,
		compound = 10,
		i32_array = 11,
		i64_array = 12,
	};

	constexpr bool is_known_type(std::uint8_t id) noexcept {
		return id <= static_cast<std::uint8_t>(tag_type::i64_array);
	}

	constexpr std::string_view type_name(tag_type t) noexcept {
		switch (t) {
		case tag_type::end: return "end";
		case tag_type::i8: return "byte";
		case tag_type::i16: return "short";
		case tag_type::i32: return "int";
		case tag_type::i64: return "long";
		case tag_type::fp32: return "float";
		case tag_type::fp64: return "double";
		case tag_type::i8_array: return "byte[]";
		case tag_type::string: return "string";
		case tag_type::list: return "list";
		case tag_type::compound: return "compound";
		case tag_type::i32_array: return "int[]";
		case tag_type::i64_array: return "long[]";
		}
		return "unknown";
	}

	struct tag;
	struct named_tag;

	// Homogeneous list; element_type is `end` only while the list is empty.
	struct list_tag {
		tag_type element_type = tag_type::end;
		std::vector<tag> items;

		std::size_t size() const noexcept { return items.size(); }
		bool empty() const noexcept { return items.empty(); }

		// Returns false when `value` does not match the element type.
		bool push_back(tag value);

		friend bool operator == (const list_tag& lhs, const list_tag& rhs);
	};

	// Named tags in insertion order; inserting an existing name replaces it.
	class compound_tag {
	public:
		using entries_type = std::vector<named_tag>;
		using const_iterator = entries_type::const_iterator;

		compound_tag() = default;

		std::size_t size() const noexcept { return entries_.size(); }
		bool empty() const noexcept { return entries_.empty(); }
		const_iterator begin() const noexcept { return entries_.begin(); }
		const_iterator end() const noexcept { return entries_.end(); }

		bool contains_key(std::string_view name) const;
		bool erase(std::string_view name);

		const tag* find(std::string_view name) const;
		tag* find(std::string_view name);

		void insert(std::string name, tag value);

		void insert_bool(std::string name, bool value);
		void insert_i8(std::string name, std::int8_t value);
		void insert_i16(std::string name, std::int16_t value);
		void insert_i32(std::string name, std::int32_t value);
		void insert_i64(std::string name, std::int64_t value);
		void insert_f32(std::string name, float value);
		void insert_f64(std::string name, double value);
		void insert_str(std::string name, std::string value);
		void insert_i8_vec(std::string name, std::vector<std::int8_t> value);
		void insert_i32_vec(std::string name, std::vector<std::int32_t> value);
		void insert_i64_vec(std::string name, std::vector<std::int64_t> value);
		void insert_list(std::string name, list_tag value);
		void insert_compound_tag(std::string name, compound_tag value);

		template <typename T>
		const T* get_if(std::string_view name) const;

		std::optional<bool> get_bool(std::string_view name) const;
		std::optional<std::int8_t> get_i8(std::string_view name) const;
		std::optional<std::int16_t> get_i16(std::string_view name) const;
		std::optional<std::int32_t> get_i32(std::string_view name) const;
		std::optional<std::int64_t> get_i64(std::string_view name) const;
		std::optional<float> get_f32(std::string_view name) const;
		std::optional<double> get_f64(std::string_view name) const;

		const std::string* get_str(std::string_view name) const;
		const std::vector<std::int8_t>* get_i8_vec(std::string_view name) const;
		const std::vector<std::int32_t>* get_i32_vec(std::string_view name) const;
		const std::vector<std::int64_t>* get_i64_vec(std::string_view name) const;
		const list_tag* get_list(std::string_view name) const;
		const compound_tag* get_compound_tag(std::string_view name) const;

		friend bool operator == (const compound_tag& lhs, const compound_tag& rhs);

	private:
		template <typename T>
		std::optional<T> get_scalar(std::string_view name) const {
			if (const auto* v = get_if<T>(name)) {
				return *v;
			}
			return std::nullopt;
		}

		entries_type entries_;
	};

	struct tag {
		// Alternative order follows the wire ids 1..12.
		using value_type = std::variant<
			std::int8_t,
			std::int16_t,
			std::int32_t,
			std::int64_t,
			float,
			double,
			std::vector<std::int8_t>,
			std::string,
			list_tag,
			compound_tag,
			std::vector<std::int32_t>,
			std::vector<std::int64_t>
		>;

		tag() = default;

		template <typename T>
			requires (!std::same_as<std::remove_cvref_t<T>, tag>) && std::constructible_from<value_type, T&&>
		tag(T&& v) : value(std::forward<T>(v)) {}

		tag_type type() const noexcept {
			return static_cast<tag_type>(value.index() + 1);
		}

		template <typename T>
		const T* get_if() const noexcept {
			return std::get_if<T>(&value);
		}

		template <typename T>
		T* get_if() noexcept {
			return std::get_if<T>(&value);
		}

		friend bool operator == (const tag& lhs, const tag& rhs) {
			return lhs.value == rhs.value;
		}

		value_type value{};
	};

	struct named_tag {
		std::string name;
		tag value;

		friend bool operator == (const named_tag&, const named_tag&) = default;
	};

	inline bool list_tag::push_back(tag value) {
		if (items.empty() && element_type == tag_type::end) {
			element_type = value.type();
		}
		if (value.type() != element_type) {
			return false;
		}
		items.push_back(std::move(value));
		return true;
	}

	inline bool operator == (const list_tag& lhs, const list_tag& rhs) {
		return lhs.element_type == rhs.element_type && lhs.items == rhs.items;
	}

	inline bool operator == (const compound_tag& lhs, const compound_tag& rhs) {
		return lhs.entries_ == rhs.entries_;
	}

	inline bool compound_tag::contains_key(std::string_view name) const {
		return find(name) != nullptr;
	}

	inline const tag* compound_tag::find(std::string_view name) const {
		auto itr = std::find_if(entries_.begin(), entries_.end(),
			[name](const named_tag& e) { return e.name == name; });
		return itr != entries_.end() ? &itr->value : nullptr;
	}

	inline tag* compound_tag::find(std::string_view name) {
		auto itr = std::find_if(entries_.begin(), entries_.end(),
			[name](const named_tag& e) { return e.name == name; });
		return itr != entries_.end() ? &itr->value : nullptr;
	}

	inline bool compound_tag::erase(std::string_view name) {
		auto itr = std::find_if(entries_.begin(), entries_.end(),
			[name](const named_tag& e) { return e.name == name; });
		if (itr == entries_.end()) {
			return false;
		}
		entries_.erase(itr);
		return true;
	}

	inline void compound_tag::insert(std::string name, tag value) {
		if (auto* existing = find(name)) {
			*existing = std::move(value);
			return;
		}
		entries_.push_back(named_tag{ std::move(name), std::move(value) });
	}

	inline void compound_tag::insert_bool(std::string name, bool value) {
		insert(std::move(name), tag{ static_cast<std::int8_t>(value ? 1 : 0) });
	}
	inline void compound_tag::insert_i8(std::string name, std::int8_t value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_i16(std::string name, std::int16_t value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_i32(std::string name, std::int32_t value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_i64(std::string name, std::int64_t value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_f32(std::string name, float value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_f64(std::string name, double value) { insert(std::move(name), tag{ value }); }
	inline void compound_tag::insert_str(std::string name, std::string value) { insert(std::move(name), tag{ std::move(value) }); }
	inline void compound_tag::insert_i8_vec(std::string name, std::vector<std::int8_t> value) { insert(std::move(name), tag{ std::move(value) }); }
	inline void compound_tag::insert_i32_vec(std::string name, std::vector<std::int32_t> value) { insert(std::move(name), tag{ std::move(value) }); }
	inline void compound_tag::insert_i64_vec(std::string name, std::vector<std::int64_t> value) { insert(std::move(name), tag{ std::move(value) }); }
	inline void compound_tag::insert_list(std::string name, list_tag value) { insert(std::move(name), tag{ std::move(value) }); }
	inline void compound_tag::insert_compound_tag(std::string name, compound_tag value) { insert(std::move(name), tag{ std::move(value) }); }

	template <typename T>
	inline const T* compound_tag::get_if(std::string_view name) const {
		const auto* t = find(name);
		return t ? t->get_if<T>() : nullptr;
	}

	inline std::optional<bool> compound_tag::get_bool(std::string_view name) const {
		if (auto v = get_scalar<std::int8_t>(name)) {
			return *v != 0;
		}
		return std::nullopt;
	}
	inline std::optional<std::int8_t> compound_tag::get_i8(std::string_view name) const { return get_scalar<std::int8_t>(name); }
	inline std::optional<std::int16_t> compound_tag::get_i16(std::string_view name) const { return get_scalar<std::int16_t>(name); }
	inline std::optional<std::int32_t> compound_tag::get_i32(std::string_view name) const { return get_scalar<std::int32_t>(name); }
	inline std::optional<std::int64_t> compound_tag::get_i64(std::string_view name) const { return get_scalar<std::int64_t>(name); }
	inline std::optional<float> compound_tag::get_f32(std::string_view name) const { return get_scalar<float>(name); }
	inline std::optional<double> compound_tag::get_f64(std::string_view name) const { return get_scalar<double>(name); }

	inline const std::string* compound_tag::get_str(std::string_view name) const { return get_if<std::string>(name); }
	inline const std::vector<std::int8_t>* compound_tag::get_i8_vec(std::string_view name) const { return get_if<std::vector<std::int8_t>>(name); }
	inline const std::vector<std::int32_t>* compound_tag::get_i32_vec(std::string_view name) const { return get_if<std::vector<std::int32_t>>(name); }
	inline const std::vector<std::int64_t>* compound_tag::get_i64_vec(std::string_view name) const { return get_if<std::vector<std::int64_t>>(name); }
	inline const list_tag* compound_tag::get_list(std::string_view name) const { return get_if<list_tag>(name); }
	inline const compound_tag* compound_tag::get_compound_tag(std::string_view name) const { return get_if<compound_tag>(name); }

} // namespace strata::nbt
