#include <a2s/buffers/HeapByteWriter.hpp>

template <typename T = void>
using Result = a2s::HeapByteWriter::Result<T>;

namespace a2s {

HeapByteWriter::HeapByteWriter() {}

void HeapByteWriter::writeBytes(const uint8_t* data, size_t size) {
    m_buffer.insert(m_buffer.end(), data, data + size);
}

void HeapByteWriter::writeBytes(std::span<const uint8_t> data) {
    this->writeBytes(data.data(), data.size());
}

void HeapByteWriter::writeU8(uint8_t value) {
    m_buffer.push_back(value);
}

void HeapByteWriter::writeU16(uint16_t value) {
    this->writeLittleEndian(value);
}

void HeapByteWriter::writeU64(uint64_t value) {
    this->writeLittleEndian(value);
}

void HeapByteWriter::writeI16(int16_t value) {
    this->writeLittleEndian(value);
}

void HeapByteWriter::writeI32(int32_t value) {
    this->writeLittleEndian(value);
}

void HeapByteWriter::writeF32(float value) {
    this->writeLittleEndian(value);
}

Result<> HeapByteWriter::writeCString(std::string_view str) {
    if (str.find('\0') != std::string_view::npos) {
        return Err(ByteWriterError::EmbeddedNul);
    }

    this->writeBytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    this->writeU8(0);

    return Ok();
}

size_t HeapByteWriter::position() const {
    return m_buffer.size();
}

std::span<const uint8_t> HeapByteWriter::written() const {
    return std::span{m_buffer.data(), m_buffer.size()};
}

std::vector<uint8_t> HeapByteWriter::toVector() const {
    return m_buffer;
}

std::vector<uint8_t> HeapByteWriter::intoVector() && {
    std::vector<uint8_t> result = std::move(m_buffer);
    m_buffer.clear();
    return result;
}

}
