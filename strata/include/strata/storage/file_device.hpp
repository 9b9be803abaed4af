/*
 * File: storage/file_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <filesystem>

#include "strata/core/bytes.hpp"
#include "strata/storage/device.hpp"

namespace strata::storage {

// File-backed random-access device (not thread-safe). Opens an existing file
// or creates an empty one.
class file_device {
public:
    using position_type = storage::position_type;

    file_device() = default;

    explicit file_device(const std::filesystem::path& filename)
        : path_(filename) {
        open_or_create_(filename);
    }

    file_device(file_device&&) = default;
    file_device& operator = (file_device&&) = default;

    bool is_open() const noexcept {
        return file_.is_open();
    }

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    bool write_at_offset(position_type offset,
                         const core::byte* data,
                         std::size_t n) {
        if (!is_open()) {
            return false;
        }
        file_.clear();
        file_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file_) {
            return false;
        }
        file_.write(reinterpret_cast<const char*>(data),
                    static_cast<std::streamsize>(n));
        return static_cast<bool>(file_);
    }

    bool read_at_offset(position_type offset,
                        core::byte* dst,
                        std::size_t n) {
        if (!is_open()) {
            return false;
        }
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file_) {
            return false;
        }
        file_.read(reinterpret_cast<char*>(dst),
                   static_cast<std::streamsize>(n));
        return static_cast<std::size_t>(file_.gcount()) == n;
    }

    position_type get_file_size() {
        if (!is_open()) {
            return 0;
        }
        file_.clear();
        file_.seekg(0, std::ios::end);
        const std::streamoff endg = file_.tellg();
        return (endg >= 0) ? static_cast<position_type>(endg) : 0;
    }

    bool grow_to(position_type size) {
        if (!is_open()) {
            return false;
        }
        const auto current = get_file_size();
        if (current >= size) {
            return true;
        }
        // Writing the last byte extends the file; the gap reads back as zeros.
        file_.clear();
        file_.seekp(static_cast<std::streamoff>(size - 1), std::ios::beg);
        file_.put('\0');
        if (!file_) {
            return false;
        }
        file_.flush();
        return static_cast<bool>(file_);
    }

private:
    void open_or_create_(const std::filesystem::path& filename) {
        file_.open(filename, std::ios::in | std::ios::out | std::ios::binary);
        if (!file_.is_open()) {
            file_.open(filename, std::ios::out | std::ios::binary | std::ios::trunc);
            file_.close();
            file_.open(filename, std::ios::in | std::ios::out | std::ios::binary);
        }
    }

    std::filesystem::path path_{};
    std::fstream file_{};
};

static_assert(RandomAccessDevice<file_device>);

} // namespace strata::storage
