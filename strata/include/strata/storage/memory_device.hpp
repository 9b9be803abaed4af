/*
 * File: storage/memory_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-11-26
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <cstring>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/storage/device.hpp"

namespace strata::storage {

    class memory_device {
    public:
        using position_type = storage::position_type;

        memory_device() = default;
        explicit memory_device(core::byte_buffer initial) : data_(std::move(initial)) {}

        bool is_open() const noexcept { return true; }

        position_type get_file_size() const noexcept {
            return data_.size();
        }

        bool grow_to(position_type size) {
            if (size > data_.size()) {
                data_.resize(static_cast<std::size_t>(size), core::byte{0});
            }
            return true;
        }

        bool read_at_offset(position_type off, core::byte* dst, std::size_t n) {
            if (off + n > data_.size()) {
                return false;
            }
            std::memcpy(dst, data_.data() + off, n);
            return true;
        }

        // Writes past the end extend the buffer, as a file would.
        bool write_at_offset(position_type off, const core::byte* src, std::size_t n) {
            if (off + n > data_.size()) {
                data_.resize(static_cast<std::size_t>(off + n), core::byte{0});
            }
            std::memcpy(data_.data() + off, src, n);
            return true;
        }

        const core::byte_buffer& data() const noexcept { return data_; }
        core::byte_buffer& data() noexcept { return data_; }

    private:
        core::byte_buffer data_;
    };

    static_assert(RandomAccessDevice<memory_device>);
}
