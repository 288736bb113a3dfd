#include <a2s/transport/SplitPacketStore.hpp>
#include <a2s/protocol/constants.hpp>
#include <a2s/util/assert.hpp>
#include <a2s/Log.hpp>

#include <algorithm>

namespace a2s {

ByteReader::Result<SplitHeader> SplitHeader::decode(ByteReader& reader) {
    SplitHeader header;
    header.packetId = GEODE_UNWRAP(reader.readI32());
    header.total = GEODE_UNWRAP(reader.readU8());
    header.index = GEODE_UNWRAP(reader.readU8());
    header.maxSize = GEODE_UNWRAP(reader.readU16());
    return Ok(header);
}

bool SplitHeader::compressed() const {
    return (static_cast<uint32_t>(packetId) & SPLIT_COMPRESSED_MASK) != 0;
}

SplitPacketStore::SplitPacketStore() {}

SplitPacketStore::~SplitPacketStore() {}

QueryResult<std::optional<std::vector<uint8_t>>> SplitPacketStore::processFragment(
    const SplitHeader& header,
    std::span<const uint8_t> payload
) {
    auto res = this->acceptFragment(header, payload);

    if (!res) {
        this->reset();
    }

    return res;
}

QueryResult<std::optional<std::vector<uint8_t>>> SplitPacketStore::acceptFragment(
    const SplitHeader& header,
    std::span<const uint8_t> payload
) {
    if (header.compressed()) {
        return Err(QueryError::CompressedResponse);
    }

    if (header.total == 0 || header.index >= header.total) {
        log::warn("Invalid split header, fragment {} of {}", header.index, header.total);
        return Err(QueryError::InvalidSplitHeader);
    }

    if (!m_packetId) {
        m_packetId = header.packetId;
        m_total = header.total;
    } else if (*m_packetId != header.packetId) {
        log::warn("Split packet id mismatch, expected {}, got {}", *m_packetId, header.packetId);
        return Err(QueryError::ReassemblyMismatch);
    } else if (m_total != header.total) {
        log::warn("Split packet fragment count changed from {} to {}", m_total, header.total);
        return Err(QueryError::InvalidSplitHeader);
    }

    // check if it's a duplicate
    auto it = std::find_if(m_fragments.begin(), m_fragments.end(), [&](const Fragment& f) {
        return f.index == header.index;
    });

    if (it != m_fragments.end()) {
        if (!std::equal(it->data.begin(), it->data.end(), payload.begin(), payload.end())) {
            return Err(QueryError::DuplicateFragment);
        }

        // exact resend, ignore it
        log::debug("Ignoring duplicate fragment {} of packet {}", header.index, header.packetId);
        return Ok(std::nullopt);
    }

    m_fragments.push_back(Fragment {
        .index = header.index,
        .data = std::vector<uint8_t>(payload.begin(), payload.end()),
    });

    if (m_fragments.size() < m_total) {
        return Ok(std::nullopt);
    }

    auto out = this->reassemble();
    this->reset();

    return Ok(std::move(out));
}

std::vector<uint8_t> SplitPacketStore::reassemble() {
    std::sort(m_fragments.begin(), m_fragments.end(), [](const Fragment& a, const Fragment& b) {
        return a.index < b.index;
    });

    size_t totalSize = 0;
    for (size_t i = 0; i < m_fragments.size(); i++) {
        // every index is below m_total and unique, so a full set is exactly 0..m_total-1
        A2S_ASSERT(m_fragments[i].index == i);
        totalSize += m_fragments[i].data.size();
    }

    std::vector<uint8_t> out;
    out.reserve(totalSize);

    for (auto& fragment : m_fragments) {
        out.insert(out.end(), fragment.data.begin(), fragment.data.end());
    }

    return out;
}

void SplitPacketStore::reset() {
    m_packetId.reset();
    m_total = 0;
    m_fragments.clear();
}

bool SplitPacketStore::inProgress() const {
    return m_packetId.has_value();
}

size_t SplitPacketStore::receivedCount() const {
    return m_fragments.size();
}

}
