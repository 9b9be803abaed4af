/*
 * File: nbt/debug_print.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-15
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

#include "strata/nbt/tag.hpp"

namespace strata::nbt {

	namespace detail {

		// Arrays longer than this are summarised.
		constexpr std::size_t array_preview = 8;

		template <typename T>
		void dump_array(std::ostream& os, const std::vector<T>& v) {
			os << "[" << v.size() << "]";
			if (v.empty()) {
				return;
			}
			os << " {";
			const auto n = v.size() < array_preview ? v.size() : array_preview;
			for (std::size_t i = 0; i < n; ++i) {
				os << (i ? ", " : "") << static_cast<std::int64_t>(v[i]);
			}
			if (n < v.size()) {
				os << ", ...";
			}
			os << "}";
		}

		inline void dump_tag(std::ostream& os, const tag& t, int indent);

		inline void dump_compound(std::ostream& os, const compound_tag& c, int indent) {
			auto pad = std::string(indent, ' ');
			for (const auto& entry : c) {
				os << pad << type_name(entry.value.type()) << " '" << entry.name << "': ";
				dump_tag(os, entry.value, indent);
			}
		}

		inline void dump_tag(std::ostream& os, const tag& t, int indent) {
			auto pad = std::string(indent, ' ');
			std::visit([&](const auto& v) {
				using value_type = std::decay_t<decltype(v)>;
				if constexpr (std::is_same_v<value_type, std::int8_t>) {
					os << static_cast<int>(v) << "\n";
				}
				else if constexpr (std::is_same_v<value_type, std::string>) {
					os << "\"" << v << "\"\n";
				}
				else if constexpr (std::is_same_v<value_type, compound_tag>) {
					os << v.size() << " entries\n" << pad << "{\n";
					dump_compound(os, v, indent + 2);
					os << pad << "}\n";
				}
				else if constexpr (std::is_same_v<value_type, list_tag>) {
					os << v.size() << " of " << type_name(v.element_type) << "\n" << pad << "[\n";
					for (const auto& item : v.items) {
						os << pad << "  ";
						dump_tag(os, item, indent + 2);
					}
					os << pad << "]\n";
				}
				else if constexpr (std::is_same_v<value_type, std::vector<std::int8_t>>
					|| std::is_same_v<value_type, std::vector<std::int32_t>>
					|| std::is_same_v<value_type, std::vector<std::int64_t>>) {
					dump_array(os, v);
					os << "\n";
				}
				else {
					os << v << "\n";
				}
			}, t.value);
		}
	}

	inline std::ostream& debug_print(std::ostream& os, const compound_tag& root,
		const std::string& root_name = "", int indent = 0) {
		os << std::string(indent, ' ') << "compound '" << root_name << "': ";
		detail::dump_tag(os, tag{ root }, indent);
		return os;
	}

} // namespace strata::nbt
