/*
 * File: region/clock.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-12-16
 * License: MIT
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace strata::region {

	// Seconds since the unix epoch, truncated to 32 bits (wraps in 2106).
	using time_source = std::function<std::uint32_t()>;

	inline std::uint32_t system_time_now() {
		const auto now = std::chrono::system_clock::now().time_since_epoch();
		return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
	}

} // namespace strata::region
