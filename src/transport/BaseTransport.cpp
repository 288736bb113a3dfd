#include <a2s/transport/BaseTransport.hpp>
#include <a2s/buffers/HeapByteWriter.hpp>
#include <a2s/protocol/constants.hpp>
#include <a2s/Log.hpp>

#include <array>

using namespace asp::time;

namespace a2s {

QueryResult<> BaseTransport::sendRequest(uint8_t header, const RequestPayload& payload) {
    HeapByteWriter writer;
    writer.writeI32(PACKET_WHOLE);
    writer.writeU8(header);

    if (auto str = std::get_if<std::string_view>(&payload)) {
        GEODE_UNWRAP(writer.writeCString(*str));
    } else if (auto value = std::get_if<int32_t>(&payload)) {
        writer.writeI32(*value);
    }

    auto data = writer.written();

    log::debug("Sending request '{}' ({} bytes)", static_cast<char>(header), data.size());

    GEODE_UNWRAP(this->sendDatagram(data));
    m_lastSentAt = Instant::now();

    return Ok();
}

QueryResult<Packet> BaseTransport::receiveResponse() {
    // anything left over belongs to a response we gave up on
    m_splitStore.reset();

    RecvBuffer buffer;
    size_t bytesRead = GEODE_UNWRAP(this->receiveInto(buffer));

    auto latency = m_lastSentAt ? m_lastSentAt->elapsed() : Duration::fromMillis(0);

    ByteReader reader(buffer.data(), bytesRead);
    int32_t marker = A2S_UNWRAP_AS(reader.readI32(), QueryError::MalformedPacket);

    if (marker == PACKET_WHOLE) {
        log::debug("Received response '{}' ({} bytes)", bytesRead > 4 ? static_cast<char>(buffer[4]) : '?', bytesRead);

        return Ok(Packet {
            .data = std::vector<uint8_t>(buffer.begin(), buffer.begin() + bytesRead),
            .latency = latency,
            .datagrams = 1,
        });
    } else if (marker != PACKET_SPLIT) {
        log::warn("Received datagram with unknown marker {:#x}", static_cast<uint32_t>(marker));
        return Err(QueryError::InvalidMarker);
    }

    return this->receiveSplit(reader, latency);
}

QueryResult<Packet> BaseTransport::receiveSplit(ByteReader& first, Duration latency) {
    RecvBuffer buffer;
    ByteReader reader = first;
    size_t datagrams = 1;

    while (true) {
        auto header = A2S_UNWRAP_AS(SplitHeader::decode(reader), QueryError::InvalidSplitHeader);

        log::debug(
            "Received fragment {} of {} for packet {} ({} bytes)",
            header.index + 1, header.total, header.packetId, reader.remainingSize()
        );

        auto complete = GEODE_UNWRAP(m_splitStore.processFragment(header, reader.remaining()));

        if (complete) {
            return Ok(Packet {
                .data = std::move(*complete),
                .latency = latency,
                .datagrams = datagrams,
            });
        }

        auto res = this->receiveInto(buffer);
        if (!res) {
            m_splitStore.reset();
            return Err(std::move(res).unwrapErr());
        }

        size_t bytesRead = res.unwrap();

        datagrams++;
        reader = ByteReader(buffer.data(), bytesRead);

        int32_t marker = A2S_UNWRAP_AS(reader.readI32(), QueryError::MalformedPacket);
        if (marker != PACKET_SPLIT) {
            // a whole response arriving mid-reassembly is some other exchange
            log::warn("Expected a split fragment, got marker {:#x}", static_cast<uint32_t>(marker));
            m_splitStore.reset();
            return Err(QueryError::ReassemblyMismatch);
        }
    }
}

QueryResult<size_t> BaseTransport::receiveInto(RecvBuffer& buffer) {
    size_t bytesRead = GEODE_UNWRAP(this->receiveDatagram(buffer.data(), buffer.size(), m_timeout));

    if (bytesRead == 0) {
        return Err(QueryError::ZeroLengthMessage);
    } else if (bytesRead >= buffer.size()) {
        log::warn("Received a datagram of at least {} bytes, dropping it", buffer.size());
        return Err(QueryError::DatagramTooLarge);
    }

    return Ok(bytesRead);
}

void BaseTransport::setTimeout(Duration timeout) {
    m_timeout = timeout;
}

Duration BaseTransport::timeout() const {
    return m_timeout;
}

}
