#include <a2s/protocol/ChallengeExchange.hpp>
#include <a2s/protocol/constants.hpp>
#include <a2s/util/assert.hpp>
#include <a2s/Log.hpp>

namespace a2s {

ChallengeExchange::ChallengeExchange(uint8_t requestHeader, uint8_t dataHeader)
    : m_requestHeader(requestHeader), m_dataHeader(dataHeader) {}

QueryResult<uint8_t> ChallengeExchange::readHeader(ByteReader& reader) {
    A2S_UNWRAP_AS(reader.skip(4), QueryError::MalformedPacket);
    return Ok(A2S_UNWRAP_AS(reader.readU8(), QueryError::MalformedPacket));
}

QueryResult<Packet> ChallengeExchange::run(BaseTransport& transport) {
    A2S_ASSERT(m_state == State::AwaitingChallenge);

    GEODE_UNWRAP(transport.sendRequest(m_requestHeader, CHALLENGE_REQUEST));
    auto first = GEODE_UNWRAP(transport.receiveResponse());

    auto reader = first.reader();
    uint8_t header = GEODE_UNWRAP(readHeader(reader));

    if (header == m_dataHeader) {
        log::debug("Server answered '{}' without a challenge", static_cast<char>(m_requestHeader));
        m_shortCircuited = true;
        m_state = State::Done;
        return Ok(std::move(first));
    }

    if (header != S2C_CHALLENGE) {
        log::warn("Expected a challenge response, got header {:#04x}, reading it as one anyway", header);
    }

    int32_t challenge = A2S_UNWRAP_AS(reader.readI32(), QueryError::MalformedPacket);
    m_challenge = challenge;

    GEODE_UNWRAP(transport.sendRequest(m_requestHeader, challenge));
    auto second = GEODE_UNWRAP(transport.receiveResponse());

    auto secondReader = second.reader();
    if (GEODE_UNWRAP(readHeader(secondReader)) == S2C_CHALLENGE) {
        log::warn("Sent challenge {} and got another challenge back", challenge);
        return Err(QueryError::ChallengeError);
    }

    m_state = State::Done;
    return Ok(std::move(second));
}

ChallengeExchange::State ChallengeExchange::state() const {
    return m_state;
}

std::optional<int32_t> ChallengeExchange::challenge() const {
    return m_challenge;
}

bool ChallengeExchange::shortCircuited() const {
    return m_shortCircuited;
}

}
