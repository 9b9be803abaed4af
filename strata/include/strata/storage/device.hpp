/*
 * File: storage/device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include "strata/core/bytes.hpp"

namespace strata::storage {

    using position_type = std::uint64_t;

    // Random-access backing store of a region. Sizes only ever grow.
    template <class D>
    concept RandomAccessDevice = requires(
        D dev,
        position_type off,
        core::byte* dst,
        const core::byte* src,
        std::size_t n
    ) {
        { dev.is_open() }    -> std::convertible_to<bool>;

        { dev.read_at_offset(off, dst, n) }  -> std::same_as<bool>;
        { dev.write_at_offset(off, src, n) } -> std::same_as<bool>;

        { dev.get_file_size() }  -> std::convertible_to<position_type>;
        // Zero-extends up to `off` bytes; a no-op when already that large.
        { dev.grow_to(off) }     -> std::same_as<bool>;
    };

} // namespace strata::storage
