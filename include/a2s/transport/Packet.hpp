#pragma once

#include <a2s/buffers/ByteReader.hpp>
#include <asp/time/Duration.hpp>

#include <optional>
#include <vector>
#include <stdint.h>

namespace a2s {

/// One logical response, either a single datagram or a reassembled split response.
/// The bytes always begin with the WHOLE marker followed by the response header.
struct Packet {
    std::vector<uint8_t> data;
    // time between sending the request and receiving the first datagram of this response
    asp::time::Duration latency = asp::time::Duration::fromMillis(0);
    size_t datagrams = 1;

    /// Returns a cursor positioned at the start of the packet.
    ByteReader reader() const {
        return ByteReader(data);
    }

    /// The response header byte that follows the 4-byte marker, if the packet is long enough to have one.
    std::optional<uint8_t> header() const {
        if (data.size() < 5) {
            return std::nullopt;
        }

        return data[4];
    }
};

}
