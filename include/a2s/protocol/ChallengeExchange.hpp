#pragma once

#include <a2s/transport/BaseTransport.hpp>

#include <optional>
#include <stdint.h>

namespace a2s {

/// Runs the challenge handshake required by A2S_RULES and A2S_PLAYERS.
///
/// The query is first sent with a challenge of -1. A server either answers with a challenge number,
/// in which case the query is repeated with that number, or it skips the challenge and answers
/// right away (the short-circuit case). Each exchange object runs once.
class ChallengeExchange {
public:
    enum class State {
        AwaitingChallenge,
        Done,
    };

    /// `requestHeader` is the query to send, `dataHeader` the header of the response it expects.
    ChallengeExchange(uint8_t requestHeader, uint8_t dataHeader);

    /// Performs the exchange and returns the data response.
    QueryResult<Packet> run(BaseTransport& transport);

    State state() const;
    std::optional<int32_t> challenge() const;
    bool shortCircuited() const;

private:
    uint8_t m_requestHeader;
    uint8_t m_dataHeader;
    State m_state = State::AwaitingChallenge;
    std::optional<int32_t> m_challenge;
    bool m_shortCircuited = false;

    static QueryResult<uint8_t> readHeader(ByteReader& reader);
};

}
