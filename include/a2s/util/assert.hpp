#pragma once
#include <string_view>

#define A2S_ASSERT(condition) \
    do { \
        if (!(condition)) [[unlikely]] { \
            ::a2s::_assertionFail(#condition, __FILE__, __LINE__); \
        } \
    } while (false)

namespace a2s {
    [[noreturn]] void _assertionFail(std::string_view what, std::string_view file, int line);
}
