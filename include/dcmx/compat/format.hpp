/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a unified formatting entry point for the exporter. Detection is
 * based on the __cpp_lib_format feature test macro; toolchains without
 * std::format fall back to the fmt library.
 *
 * Usage:
 *   #include <dcmx/compat/format.hpp>
 *   auto s = dcmx::compat::format("Extracted {} file(s)", count);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DCMX_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define DCMX_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DCMX_HAS_STD_FORMAT 1
#else
    #define DCMX_HAS_STD_FORMAT 0
#endif

#if DCMX_HAS_STD_FORMAT
    #include <format>
    namespace dcmx::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace dcmx::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
