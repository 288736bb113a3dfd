#pragma once

#include <bit>
#include <cstring>
#include <stdint.h>
#include <stddef.h>

namespace a2s {

// A2S is little-endian on the wire, these convert between wire and host order.

template <typename T>
inline T fromLittleEndian(const uint8_t* data) {
    T out;

    if constexpr (std::endian::native == std::endian::little) {
        std::memcpy(&out, data, sizeof(T));
    } else {
        uint8_t swapped[sizeof(T)];
        for (size_t i = 0; i < sizeof(T); i++) {
            swapped[i] = data[sizeof(T) - 1 - i];
        }
        std::memcpy(&out, swapped, sizeof(T));
    }

    return out;
}

template <typename T>
inline void toLittleEndian(T value, uint8_t* out) {
    if constexpr (std::endian::native == std::endian::little) {
        std::memcpy(out, &value, sizeof(T));
    } else {
        uint8_t raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        for (size_t i = 0; i < sizeof(T); i++) {
            out[i] = raw[sizeof(T) - 1 - i];
        }
    }
}

}
