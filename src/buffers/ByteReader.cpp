#include <a2s/buffers/ByteReader.hpp>
#include <a2s/util/utf8.hpp>

#include <algorithm>

template <typename T = void>
using Result = a2s::ByteReader::Result<T>;

namespace a2s {

ByteReader::ByteReader(std::span<const uint8_t> data) : m_data(data) {}
ByteReader::ByteReader(const uint8_t* data, size_t size) : m_data(data, data + size) {}
ByteReader::ByteReader(const std::vector<uint8_t>& data) : m_data(data.begin(), data.end()) {}

Result<std::span<const uint8_t>> ByteReader::readBytes(size_t size) {
    if (size > this->remainingSize()) {
        return Err(ByteReaderError::OutOfBoundsRead);
    }

    auto out = m_data.subspan(m_pos, size);
    m_pos += size;

    return Ok(out);
}

Result<void> ByteReader::skip(size_t size) {
    if (size > this->remainingSize()) {
        return Err(ByteReaderError::OutOfBoundsRead);
    }

    m_pos += size;

    return Ok();
}

Result<uint8_t> ByteReader::readU8() {
    return this->readLittleEndian<uint8_t>();
}

Result<uint16_t> ByteReader::readU16() {
    return this->readLittleEndian<uint16_t>();
}

Result<uint64_t> ByteReader::readU64() {
    return this->readLittleEndian<uint64_t>();
}

Result<int16_t> ByteReader::readI16() {
    return this->readLittleEndian<int16_t>();
}

Result<int32_t> ByteReader::readI32() {
    return this->readLittleEndian<int32_t>();
}

Result<float> ByteReader::readF32() {
    return this->readLittleEndian<float>();
}

Result<std::string> ByteReader::readCString() {
    auto rest = this->remaining();
    auto terminator = std::find(rest.begin(), rest.end(), uint8_t{0});

    if (terminator == rest.end()) {
        return Err(ByteReaderError::UnterminatedString);
    }

    auto bytes = rest.first(static_cast<size_t>(terminator - rest.begin()));
    if (!isValidUtf8(bytes)) {
        return Err(ByteReaderError::InvalidUtf8);
    }

    // string bytes plus the terminator
    m_pos += bytes.size() + 1;

    return Ok(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

std::vector<uint8_t> ByteReader::readToEnd() {
    auto rest = this->remaining();
    m_pos = m_data.size();
    return std::vector<uint8_t>(rest.begin(), rest.end());
}

std::span<const uint8_t> ByteReader::remaining() const {
    return m_data.subspan(m_pos);
}

size_t ByteReader::remainingSize() const {
    return m_data.size() - m_pos;
}

size_t ByteReader::position() const {
    return m_pos;
}

}
