/*
 * File: storage/stats.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

 #pragma once
#include <cstdint>

namespace strata::storage {

struct region_stats {
    std::uint64_t reads = 0, writes = 0;
    std::uint64_t in_place_writes = 0, gap_reuses = 0;
    std::uint64_t file_grows = 0, sectors_grown = 0;
};

template <typename T = std::uint64_t>
struct null_field {
    constexpr null_field& operator++() noexcept { return *this; }
    constexpr T operator++(int) noexcept { return T{}; }
    constexpr null_field& operator+=(T) noexcept { return *this; }
    constexpr null_field& operator=(T) noexcept { return *this; }

    // reads as zero
    constexpr operator T() const noexcept { return T{}; }
};

struct null_stats {
    null_field<> reads, writes;
    null_field<> in_place_writes, gap_reuses;
    null_field<> file_grows, sectors_grown;
};

} // namespace strata::storage
