/*
 * File: nbt/codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-14
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>

#include "strata/core/bytes.hpp"
#include "strata/core/result.hpp"
#include "strata/nbt/tag.hpp"
#include "strata/nbt/serializer.hpp"

namespace strata::nbt {

    using core::byte;
    using core::byte_view;
    using core::byte_buffer;

    // Java rejects deeper trees; so do we.
    constexpr int max_nesting_depth = 512;

    enum class decode_errc {
        unexpected_end,
        unknown_tag_type,
        root_not_compound,
        negative_length,
        nesting_too_deep,
    };

    struct decode_error {
        decode_errc code = decode_errc::unexpected_end;
        std::size_t offset = 0;     // where decoding stopped
        std::uint8_t tag_id = 0;    // offending id, for type errors

        std::string describe() const {
            switch (code) {
            case decode_errc::unexpected_end:
                return std::format("unexpected end of data at offset {}", offset);
            case decode_errc::unknown_tag_type:
                return std::format("unknown tag type {} at offset {}", tag_id, offset);
            case decode_errc::root_not_compound:
                return std::format("root tag has type {}, expected compound", tag_id);
            case decode_errc::negative_length:
                return std::format("negative length at offset {}", offset);
            case decode_errc::nesting_too_deep:
                return std::format("nesting deeper than {} at offset {}", max_nesting_depth, offset);
            }
            return "unknown decode error";
        }
    };

    enum class encode_errc {
        string_too_long,
        list_too_long,
        list_type_mismatch,
    };

    struct encode_error {
        encode_errc code = encode_errc::string_too_long;
        std::size_t length = 0;

        std::string describe() const {
            if (code == encode_errc::string_too_long) {
                return std::format("string of {} bytes exceeds 65535", length);
            }
            if (code == encode_errc::list_type_mismatch) {
                return std::format("list item {} does not match the list element type", length);
            }
            return std::format("list or array of {} elements exceeds 2^31-1", length);
        }
    };

    class reader {
    public:
        explicit reader(byte_view in) : in_(in) {}

        // Root: [type:u8 = compound][name:string][payload]
        core::result<compound_tag, decode_error> read_root(std::string* root_name = nullptr) {
            const auto id = serializer<std::uint8_t>::load(in_, offset_);
            if (!id) {
                return core::fail(error(decode_errc::unexpected_end));
            }
            if (*id != static_cast<std::uint8_t>(tag_type::compound)) {
                return core::fail(error(decode_errc::root_not_compound, *id));
            }
            auto name = serializer<std::string>::load(in_, offset_);
            if (!name) {
                return core::fail(error(decode_errc::unexpected_end));
            }
            if (root_name) {
                *root_name = std::move(*name);
            }
            compound_tag root;
            if (auto err = read_compound(root, 1)) {
                return core::fail(*err);
            }
            return root;
        }

    private:

        decode_error error(decode_errc code, std::uint8_t id = 0) const {
            return { code, offset_, id };
        }

        std::optional<decode_error> read_compound(compound_tag& out, int depth) {
            if (depth > max_nesting_depth) {
                return error(decode_errc::nesting_too_deep);
            }
            while (true) {
                const auto id = serializer<std::uint8_t>::load(in_, offset_);
                if (!id) {
                    return error(decode_errc::unexpected_end);
                }
                if (*id == static_cast<std::uint8_t>(tag_type::end)) {
                    return std::nullopt;
                }
                if (!is_known_type(*id)) {
                    return error(decode_errc::unknown_tag_type, *id);
                }
                auto name = serializer<std::string>::load(in_, offset_);
                if (!name) {
                    return error(decode_errc::unexpected_end);
                }
                tag value;
                if (auto err = read_payload(static_cast<tag_type>(*id), value, depth)) {
                    return err;
                }
                out.insert(std::move(*name), std::move(value));
            }
        }

        std::optional<decode_error> read_list(list_tag& out, int depth) {
            if (depth > max_nesting_depth) {
                return error(decode_errc::nesting_too_deep);
            }
            const auto id = serializer<std::uint8_t>::load(in_, offset_);
            if (!id) {
                return error(decode_errc::unexpected_end);
            }
            if (!is_known_type(*id)) {
                return error(decode_errc::unknown_tag_type, *id);
            }
            const auto count = serializer<std::int32_t>::load(in_, offset_);
            if (!count) {
                return error(decode_errc::unexpected_end);
            }
            if (*count < 0) {
                return error(decode_errc::negative_length);
            }
            const auto element = static_cast<tag_type>(*id);
            if (element == tag_type::end && *count > 0) {
                return error(decode_errc::unknown_tag_type, *id);
            }
            out.element_type = element;
            // Every element takes at least one byte, which caps bogus counts.
            if (static_cast<std::size_t>(*count) > in_.size() - offset_) {
                return error(decode_errc::unexpected_end);
            }
            out.items.reserve(static_cast<std::size_t>(*count));
            for (std::int32_t i = 0; i < *count; ++i) {
                tag value;
                if (auto err = read_payload(element, value, depth)) {
                    return err;
                }
                out.items.push_back(std::move(value));
            }
            return std::nullopt;
        }

        template <typename T>
        std::optional<decode_error> read_scalar(tag& out) {
            auto v = serializer<T>::load(in_, offset_);
            if (!v) {
                return error(decode_errc::unexpected_end);
            }
            out = tag{ std::move(*v) };
            return std::nullopt;
        }

        template <typename T>
        std::optional<decode_error> read_array(tag& out) {
            bool negative = false;
            auto v = serializer<T>::load(in_, offset_, negative);
            if (!v) {
                return error(negative ? decode_errc::negative_length : decode_errc::unexpected_end);
            }
            out = tag{ std::move(*v) };
            return std::nullopt;
        }

        std::optional<decode_error> read_payload(tag_type type, tag& out, int depth) {
            switch (type) {
            case tag_type::i8: return read_scalar<std::int8_t>(out);
            case tag_type::i16: return read_scalar<std::int16_t>(out);
            case tag_type::i32: return read_scalar<std::int32_t>(out);
            case tag_type::i64: return read_scalar<std::int64_t>(out);
            case tag_type::fp32: return read_scalar<float>(out);
            case tag_type::fp64: return read_scalar<double>(out);
            case tag_type::string: return read_scalar<std::string>(out);
            case tag_type::i8_array: return read_array<std::vector<std::int8_t>>(out);
            case tag_type::i32_array: return read_array<std::vector<std::int32_t>>(out);
            case tag_type::i64_array: return read_array<std::vector<std::int64_t>>(out);
            case tag_type::list: {
                list_tag list;
                if (auto err = read_list(list, depth + 1)) {
                    return err;
                }
                out = tag{ std::move(list) };
                return std::nullopt;
            }
            case tag_type::compound: {
                compound_tag compound;
                if (auto err = read_compound(compound, depth + 1)) {
                    return err;
                }
                out = tag{ std::move(compound) };
                return std::nullopt;
            }
            case tag_type::end:
                break;
            }
            return error(decode_errc::unknown_tag_type, static_cast<std::uint8_t>(type));
        }

        byte_view in_;
        std::size_t offset_ = 0;
    };

    class writer {
    public:
        core::result<byte_buffer, encode_error> write_root(const compound_tag& root, std::string_view root_name) {
            serializer<std::uint8_t>::store(static_cast<std::uint8_t>(tag_type::compound), out_);
            if (auto err = write_string(std::string(root_name))) {
                return core::fail(*err);
            }
            if (auto err = write_compound(root)) {
                return core::fail(*err);
            }
            return std::move(out_);
        }

    private:

        std::optional<encode_error> write_string(const std::string& s) {
            if (!serializer<std::string>::fits(s)) {
                return encode_error{ encode_errc::string_too_long, s.size() };
            }
            serializer<std::string>::store(s, out_);
            return std::nullopt;
        }

        std::optional<encode_error> write_compound(const compound_tag& c) {
            for (const auto& entry : c) {
                serializer<std::uint8_t>::store(static_cast<std::uint8_t>(entry.value.type()), out_);
                if (auto err = write_string(entry.name)) {
                    return err;
                }
                if (auto err = write_payload(entry.value)) {
                    return err;
                }
            }
            serializer<std::uint8_t>::store(static_cast<std::uint8_t>(tag_type::end), out_);
            return std::nullopt;
        }

        template <typename VecT>
        std::optional<encode_error> write_array(const VecT& v) {
            if (v.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
                return encode_error{ encode_errc::list_too_long, v.size() };
            }
            serializer<VecT>::store(v, out_);
            return std::nullopt;
        }

        std::optional<encode_error> write_payload(const tag& t) {
            return std::visit([this](const auto& v) -> std::optional<encode_error> {
                using value_type = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<value_type, std::string>) {
                    return write_string(v);
                }
                else if constexpr (std::is_same_v<value_type, compound_tag>) {
                    return write_compound(v);
                }
                else if constexpr (std::is_same_v<value_type, list_tag>) {
                    if (v.items.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
                        return encode_error{ encode_errc::list_too_long, v.items.size() };
                    }
                    for (std::size_t i = 0; i < v.items.size(); ++i) {
                        if (v.items[i].type() != v.element_type) {
                            return encode_error{ encode_errc::list_type_mismatch, i };
                        }
                    }
                    serializer<std::uint8_t>::store(static_cast<std::uint8_t>(v.element_type), out_);
                    serializer<std::int32_t>::store(static_cast<std::int32_t>(v.items.size()), out_);
                    for (const auto& item : v.items) {
                        if (auto err = write_payload(item)) {
                            return err;
                        }
                    }
                    return std::nullopt;
                }
                else if constexpr (std::is_same_v<value_type, std::vector<std::int8_t>>
                    || std::is_same_v<value_type, std::vector<std::int32_t>>
                    || std::is_same_v<value_type, std::vector<std::int64_t>>) {
                    return write_array(v);
                }
                else {
                    serializer<value_type>::store(v, out_);
                    return std::nullopt;
                }
            }, t.value);
        }

        byte_buffer out_;
    };

    inline core::result<compound_tag, decode_error> decode(byte_view in, std::string* root_name = nullptr) {
        return reader{ in }.read_root(root_name);
    }

    inline core::result<byte_buffer, encode_error> encode(const compound_tag& root, std::string_view root_name = "") {
        return writer{}.write_root(root, root_name);
    }

} // namespace strata::nbt
