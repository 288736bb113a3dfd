#pragma once

#include "Error.hpp"
#include <a2s/buffers/ByteReader.hpp>

#include <optional>
#include <span>
#include <vector>
#include <stdint.h>

namespace a2s {

struct SplitHeader {
    int32_t packetId;
    uint8_t total;
    uint8_t index;
    uint16_t maxSize;

    /// Decodes the header that follows the SPLIT marker.
    static ByteReader::Result<SplitHeader> decode(ByteReader& reader);

    bool compressed() const;
};

/// Collects the fragments of a single split response.
class SplitPacketStore {
public:
    SplitPacketStore();
    ~SplitPacketStore();

    /// Accepts a fragment payload. If every fragment has arrived, the response is reassembled in index order
    /// and returned, otherwise nullopt is returned. Any error discards the response in progress.
    QueryResult<std::optional<std::vector<uint8_t>>> processFragment(
        const SplitHeader& header,
        std::span<const uint8_t> payload
    );

    void reset();
    bool inProgress() const;
    size_t receivedCount() const;

private:
    struct Fragment {
        uint8_t index;
        std::vector<uint8_t> data;
    };

    std::optional<int32_t> m_packetId;
    uint8_t m_total = 0;
    std::vector<Fragment> m_fragments;

    QueryResult<std::optional<std::vector<uint8_t>>> acceptFragment(
        const SplitHeader& header,
        std::span<const uint8_t> payload
    );
    std::vector<uint8_t> reassemble();
};

}
