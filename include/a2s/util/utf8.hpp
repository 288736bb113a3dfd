#pragma once

#include <span>
#include <stdint.h>

namespace a2s {

/// Returns true if `data` is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
bool isValidUtf8(std::span<const uint8_t> data);

}
