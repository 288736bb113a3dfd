#pragma once

#include <Geode/Result.hpp>
#include <string_view>

// Declares a small error type wrapping a plain enum of codes.
// `message()` is defined per type in the matching source file.
#define A2S_MAKE_ERROR_STRUCT(name, ...) \
    class name { \
    public: \
        typedef enum { __VA_ARGS__ } Code; \
        constexpr name(Code code) : m_code(code) {} \
        constexpr Code code() const { return m_code; } \
        constexpr bool operator==(const name& other) const = default; \
        std::string_view message() const; \
    private: \
        Code m_code; \
    }

// Unwraps `x`, replacing any error it holds with `err`
#define A2S_UNWRAP_AS(x, err) GEODE_UNWRAP((x).mapErr([&](const auto&) { return (err); }))

namespace a2s {

using geode::Ok;
using geode::Err;

[[noreturn]] inline void unreachable() {
#if defined __clang__ || defined __GNUC__
    __builtin_unreachable();
#elif defined _MSC_VER
    __assume(0);
#endif
}

}
