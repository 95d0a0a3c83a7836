// Copyright (c) 2026, seq-guid contributors
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_SEQ_GUID_COMMON_H_INCLUDED
#define HEADER_SEQ_GUID_COMMON_H_INCLUDED

// Configuration
//
// Must match between the library build and its users:
//   SGUID_USE_EXCEPTIONS - 1 or 0 to force exceptions on or off. Detected from the compiler flags otherwise
//   SGUID_SHARED         - 1 when seq-guid is a shared library
//
// Library build only:
//   SGUID_BUILDING_SGUID - 1 while compiling seq-guid itself
//
// Optional:
//   SGUID_USE_FMT        - 1 to insist on fmt::formatter support. Include <fmt/format.h> before seq-guid headers

#include <cstdint>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <bit>
#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <algorithm>
#include <stdexcept>
#include <ostream>


#ifndef SGUID_USE_EXCEPTIONS
    #if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || (defined(_MSC_VER) && _HAS_EXCEPTIONS)
        #define SGUID_USE_EXCEPTIONS 1
    #else
        #define SGUID_USE_EXCEPTIONS 0
    #endif
#endif

#if !SGUID_SHARED
    #define SGUID_EXPORTED
#elif defined(_WIN32)
    #if SGUID_BUILDING_SGUID
        #define SGUID_EXPORTED __declspec(dllexport)
    #else
        #define SGUID_EXPORTED __declspec(dllimport)
    #endif
#elif defined(__GNUC__)
    #define SGUID_EXPORTED [[gnu::visibility("default")]]
#else
    #define SGUID_EXPORTED
#endif

//libc++ does not define __cpp_lib_format until it is complete, see https://github.com/llvm/llvm-project/issues/77773
#if __has_include(<format>) && (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000))
    #define SGUID_SUPPORTS_STD_FORMAT 1
    #include <format>
#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)
    #define SGUID_SUPPORTS_FMT_FORMAT 1
#endif

#if SGUID_USE_FMT && !SGUID_SUPPORTS_FMT_FORMAT
    #error "SGUID_USE_FMT requires fmt 6.0 or newer. Include <fmt/format.h> before seq-guid headers."
#endif

#if SGUID_USE_EXCEPTIONS
    #define SGUID_THROW(x) throw x
#else
    #define SGUID_THROW(x) ::sguid::impl::fail((x).what())
#endif

namespace sguid::impl {

    template<class T>
    concept byte_like = std::is_standard_layout_v<T> && sizeof(T) == 1 &&
    requires {
        static_cast<T>(uint8_t{});
        static_cast<uint8_t>(T{});
    };

    static_assert(byte_like<char>);
    static_assert(byte_like<uint8_t>);
    static_assert(byte_like<std::byte>);

    //Characters the text form can be read from and written to
    template<class T>
    concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t>;

    //Never defined: reaching it during constant evaluation is a compile error
    void invalid_constexpr_call(const char * reason);

    #if !SGUID_USE_EXCEPTIONS
        [[noreturn]] inline void fail(const char * message) {
            fprintf(stderr, "sguid: fatal error: %s\n", message);
            abort();
        }
    #endif

    //Fixed width integer (de)serialization

    template<std::endian E, std::unsigned_integral T>
    constexpr uint8_t * store(T val, uint8_t * dest) noexcept {
        for (size_t i = 0; i != sizeof(T); ++i) {
            const size_t pos = (E == std::endian::big ? sizeof(T) - 1 - i : i);
            dest[pos] = uint8_t(val >> (8 * i));
        }
        return dest + sizeof(T);
    }

    template<std::endian E, std::unsigned_integral T>
    constexpr const uint8_t * load(const uint8_t * src, T & val) noexcept {
        T ret = 0;
        for (size_t i = 0; i != sizeof(T); ++i) {
            const size_t pos = (E == std::endian::big ? i : sizeof(T) - 1 - i);
            ret = T(T(ret << 8) | src[pos]);
        }
        val = ret;
        return src + sizeof(T);
    }
}

#endif
