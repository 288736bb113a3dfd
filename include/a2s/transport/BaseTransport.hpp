#pragma once

#include "Error.hpp"
#include "Packet.hpp"
#include "SplitPacketStore.hpp"
#include <a2s/protocol/constants.hpp>

#include <asp/time/Duration.hpp>
#include <asp/time/Instant.hpp>

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <stdint.h>

namespace a2s {

/// Request body following the header byte: nothing, a C string or a 4-byte challenge value.
using RequestPayload = std::variant<std::monostate, std::string_view, int32_t>;

/// Frames requests and assembles responses for a single remote server.
/// Subclasses only provide the datagram primitives.
/// Not safe to use from multiple threads at once.
class BaseTransport {
public:
    BaseTransport() = default;
    BaseTransport(BaseTransport&&) = default;
    BaseTransport& operator=(BaseTransport&&) = default;

    virtual ~BaseTransport() = default;

    /// Sends the WHOLE marker, the header byte and the payload as one datagram.
    QueryResult<> sendRequest(uint8_t header, const RequestPayload& payload = {});

    /// Blocks until a full logical response has been received.
    /// Split responses are reassembled, every datagram wait is bounded by `timeout()`.
    QueryResult<Packet> receiveResponse();

    void setTimeout(asp::time::Duration timeout);
    asp::time::Duration timeout() const;

protected:
    virtual QueryResult<> sendDatagram(std::span<const uint8_t> data) = 0;

    /// Receives one datagram into `buffer`, returning its size. Must fail with `TimedOut` once `timeout` elapses.
    virtual QueryResult<size_t> receiveDatagram(uint8_t* buffer, size_t size, const asp::time::Duration& timeout) = 0;

private:
    SplitPacketStore m_splitStore;
    asp::time::Duration m_timeout = asp::time::Duration::fromSecs(3);
    std::optional<asp::time::Instant> m_lastSentAt;

    using RecvBuffer = std::array<uint8_t, RECV_BUFFER_SIZE>;

    /// Receives one datagram, rejecting empty ones and ones that may have been cut to the buffer size.
    QueryResult<size_t> receiveInto(RecvBuffer& buffer);
    QueryResult<Packet> receiveSplit(ByteReader& reader, asp::time::Duration latency);
};

}
