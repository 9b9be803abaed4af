/*
 * File: types.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-10-25
 * License: MIT
 */

#pragma once

#include "strata/core/byteorder.hpp"

#if defined(_MSC_VER)
#	define STRATA_PACKED_STRUCT_BEGIN __pragma(pack(push, 1))
#	define STRATA_PACKED_STRUCT_END   __pragma(pack(pop))
#	define STRATA_PACKED
#else
#	define STRATA_PACKED_STRUCT_BEGIN
#	define STRATA_PACKED_STRUCT_END
#	define STRATA_PACKED __attribute__((packed))
#endif

namespace strata::core {
	using word_be32 = byteorder::word_be<std::uint32_t>;
} // namespace strata::core
