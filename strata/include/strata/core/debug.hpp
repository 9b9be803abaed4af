/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-11-23
 * License: MIT
 */

#pragma once

#ifndef STRATA_ASSERT
#include <cassert>
#define STRATA_ASSERT(cond, msg) assert((cond) && (msg))
#endif

// Tests reach into engine internals (bitmap, header array) through this.
#ifdef ENABLE_PRIVATE_TESTS
#define PRIVATE_TESTABLE public
#else
#define PRIVATE_TESTABLE private
#endif
