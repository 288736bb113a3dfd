#pragma once

#include "Error.hpp"
#include <a2s/util/endian.hpp>

#include <span>
#include <string_view>
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace a2s {

/// Append-only little-endian packet builder backed by a growable std::vector<uint8_t>.
class HeapByteWriter {
public:
    template <typename T = void>
    using Result = geode::Result<T, ByteWriterError>;

    HeapByteWriter();
    ~HeapByteWriter() = default;

    HeapByteWriter(const HeapByteWriter& other) = default;
    HeapByteWriter& operator=(const HeapByteWriter& other) = default;
    HeapByteWriter(HeapByteWriter&& other) noexcept = default;
    HeapByteWriter& operator=(HeapByteWriter&& other) noexcept = default;

    void writeBytes(const uint8_t* data, size_t size);
    void writeBytes(std::span<const uint8_t> data);

    void writeU8(uint8_t value);
    void writeU16(uint16_t value);
    void writeU64(uint64_t value);
    void writeI16(int16_t value);
    void writeI32(int32_t value);
    void writeF32(float value);

    /// Writes the string bytes followed by a single NUL terminator.
    /// Fails without writing anything if the string itself contains a NUL byte.
    Result<> writeCString(std::string_view str);

    size_t position() const;
    std::span<const uint8_t> written() const;

    std::vector<uint8_t> toVector() const;
    std::vector<uint8_t> intoVector() &&;

private:
    std::vector<uint8_t> m_buffer;

    template <typename T>
    void writeLittleEndian(T value) {
        uint8_t raw[sizeof(T)];
        toLittleEndian(value, raw);
        this->writeBytes(raw, sizeof(T));
    }
};

}
