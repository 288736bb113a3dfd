#include <gtest/gtest.h>

#include "support/ScriptedTransport.hpp"
#include <a2s/protocol/ChallengeExchange.hpp>

using namespace a2s;
using namespace a2s::test;

static std::vector<uint8_t> challengedRequest(uint8_t header, int32_t challenge) {
    HeapByteWriter writer;
    writer.writeI32(PACKET_WHOLE);
    writer.writeU8(header);
    writer.writeI32(challenge);
    return std::move(writer).intoVector();
}

TEST(ChallengeTest, TwoStepExchange) {
    ScriptedTransport transport;
    transport.push(challengeDatagram(0x1234abcd));
    transport.push(wholeDatagram(S2A_RULES, [](HeapByteWriter& w) { w.writeI16(0); }));

    ChallengeExchange exchange{A2S_RULES, S2A_RULES};
    auto packet = exchange.run(transport).unwrap();

    EXPECT_EQ(packet.header(), S2A_RULES);
    EXPECT_EQ(exchange.state(), ChallengeExchange::State::Done);
    EXPECT_EQ(exchange.challenge(), 0x1234abcd);
    EXPECT_FALSE(exchange.shortCircuited());

    ASSERT_EQ(transport.sent.size(), 2);
    EXPECT_EQ(transport.sent[0], challengedRequest(A2S_RULES, CHALLENGE_REQUEST));
    EXPECT_EQ(transport.sent[1], challengedRequest(A2S_RULES, 0x1234abcd));
}

TEST(ChallengeTest, ShortCircuit) {
    ScriptedTransport transport;
    transport.push(wholeDatagram(S2A_PLAYER, [](HeapByteWriter& w) { w.writeU8(0); }));

    ChallengeExchange exchange{A2S_PLAYER, S2A_PLAYER};
    auto packet = exchange.run(transport).unwrap();

    EXPECT_EQ(packet.header(), S2A_PLAYER);
    EXPECT_TRUE(exchange.shortCircuited());
    EXPECT_FALSE(exchange.challenge().has_value());

    // no second round trip
    EXPECT_EQ(transport.sent.size(), 1);
}

TEST(ChallengeTest, ShortCircuitUsesConfiguredHeader) {
    ScriptedTransport transport;
    transport.push(wholeDatagram('m', [](HeapByteWriter& w) { w.writeU8(0); }));

    ChallengeExchange exchange{A2S_RULES, 'm'};
    auto packet = exchange.run(transport).unwrap();

    EXPECT_EQ(packet.header(), 'm');
    EXPECT_EQ(transport.sent.size(), 1);
}

TEST(ChallengeTest, RepeatedChallengeFails) {
    ScriptedTransport transport;
    transport.push(challengeDatagram(5));
    transport.push(challengeDatagram(6));

    ChallengeExchange exchange{A2S_PLAYER, S2A_PLAYER};
    auto res = exchange.run(transport);

    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().is(QueryError::ChallengeError));
    EXPECT_EQ(exchange.state(), ChallengeExchange::State::AwaitingChallenge);
}

TEST(ChallengeTest, TruncatedChallenge) {
    ScriptedTransport transport;
    transport.push(wholeDatagram(S2C_CHALLENGE, [](HeapByteWriter& w) { w.writeU16(1); }));

    ChallengeExchange exchange{A2S_RULES, S2A_RULES};
    auto res = exchange.run(transport);

    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().is(QueryError::MalformedPacket));
    EXPECT_EQ(transport.sent.size(), 1);
}

TEST(ChallengeTest, NoResponse) {
    ScriptedTransport transport;

    ChallengeExchange exchange{A2S_RULES, S2A_RULES};
    auto res = exchange.run(transport);

    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().isTimeout());
}
