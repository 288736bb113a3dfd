#pragma once

#include "Error.hpp"
#include <a2s/util/endian.hpp>

#include <span>
#include <string>
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace a2s {

/// Forward-only little-endian read cursor over a borrowed byte span.
/// A failed read never moves the cursor.
class ByteReader {
public:
    template <typename T = void>
    using Result = geode::Result<T, ByteReaderError>;

    ByteReader(std::span<const uint8_t> data);
    ByteReader(const uint8_t* data, size_t size);
    ByteReader(const std::vector<uint8_t>& data);

    Result<std::span<const uint8_t>> readBytes(size_t size);
    Result<void> skip(size_t size);

    Result<uint8_t> readU8();
    Result<uint16_t> readU16();
    Result<uint64_t> readU64();
    Result<int16_t> readI16();
    Result<int32_t> readI32();
    Result<float> readF32();

    /// Reads a NUL-terminated UTF-8 string and moves past the terminator.
    Result<std::string> readCString();

    std::vector<uint8_t> readToEnd();

    std::span<const uint8_t> remaining() const;
    size_t remainingSize() const;
    size_t position() const;

private:
    std::span<const uint8_t> m_data;
    size_t m_pos = 0;

    template <typename T>
    Result<T> readLittleEndian() {
        auto bytes = GEODE_UNWRAP(this->readBytes(sizeof(T)));
        return Ok(fromLittleEndian<T>(bytes.data()));
    }
};

}
