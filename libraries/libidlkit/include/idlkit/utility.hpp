// SPDX-License-Identifier: MIT
#pragma once

#include <fmt/format.h>

// suppress warning "conditional expression is constant" in the while(0) for visual c++
#define IDLKIT_MULTILINE_MACRO_BEGIN do {
#ifdef _MSC_VER
# define IDLKIT_MULTILINE_MACRO_END \
    __pragma(warning(push)) \
    __pragma(warning(disable:4127)) \
    } while (0) \
    __pragma(warning(pop))
#else
# define IDLKIT_MULTILINE_MACRO_END  } while (0)
#endif

/** fmt::format with a compile-time checked format string. */
#define IDLKIT_FMT(FORMAT, ...) \
   fmt::format( FORMAT, ##__VA_ARGS__ )
