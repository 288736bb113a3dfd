#include <gtest/gtest.h>

#include "support/ScriptedTransport.hpp"
#include <a2s/Query.hpp>
#include <a2s/Log.hpp>

using namespace a2s;
using namespace a2s::test;

class QueryClientTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    std::vector<std::pair<log::Level, std::string>> logs;

    void SetUp() override {
        log::setLogFunction([this](log::Level level, const std::string& message) {
            logs.emplace_back(level, message);
        });
    }

    void TearDown() override {
        log::setLogFunction([](log::Level, const std::string&) {});
    }

    size_t warnings() const {
        return std::count_if(logs.begin(), logs.end(), [](auto& entry) {
            return entry.first == log::Level::Warning;
        });
    }
};

TEST_F(QueryClientTest, TimeoutIsApplied) {
    QueryClient client{transport, QueryOptions { .timeout = asp::time::Duration::fromMillis(250) }};
    EXPECT_EQ(transport->timeout().millis(), 250);
}

TEST_F(QueryClientTest, Info) {
    transport->push(wholeDatagram(S2A_INFO, [](HeapByteWriter& w) {
        w.writeU8(17);
        writeStr(w, "Test Server");
        writeStr(w, "de_dust2");
        writeStr(w, "cstrike");
        writeStr(w, "Counter-Strike");
        w.writeU16(10);
        w.writeU8(5);
        w.writeU8(10);
        w.writeU8(0);
        w.writeU8('d');
        w.writeU8('w');
        w.writeU8(1);
        w.writeU8(0);
        writeStr(w, "1.0.0.1");
        w.writeU8(0);
    }));

    QueryClient client{transport};
    auto info = client.info().unwrap();

    EXPECT_EQ(info.name, "Test Server");
    EXPECT_EQ(info.environment, "Windows");
    EXPECT_EQ(info.visibility, "Private");
    EXPECT_EQ(info.vac, "Unsecured");

    ASSERT_EQ(transport->sent.size(), 1);
    EXPECT_EQ(transport->sent[0][4], A2S_INFO);
}

TEST_F(QueryClientTest, RulesWithChallenge) {
    transport->push(challengeDatagram(77));
    transport->push(wholeDatagram(S2A_RULES, [](HeapByteWriter& w) {
        w.writeI16(1);
        writeStr(w, "sv_cheats");
        writeStr(w, "0");
    }));

    QueryClient client{transport};
    auto rules = client.rules().unwrap();

    EXPECT_EQ(rules.at("sv_cheats"), "0");
    ASSERT_EQ(transport->sent.size(), 2);
    EXPECT_EQ(transport->sent[1][4], A2S_RULES);
}

TEST_F(QueryClientTest, StrayResponseAfterChallenge) {
    // a late info response arriving where the rules were expected
    transport->push(challengeDatagram(77));
    transport->push(wholeDatagram(S2A_INFO, [](HeapByteWriter& w) {
        w.writeU8(17);
        writeStr(w, "Test Server");
    }));

    QueryClient client{transport};
    auto res = client.rules();

    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().is(QueryError::UnexpectedHeader));
    EXPECT_EQ(warnings(), 1);
}

TEST_F(QueryClientTest, DegradedPlayersAreLogged) {
    transport->push(wholeDatagram(S2A_PLAYER, [](HeapByteWriter& w) {
        w.writeU8(2);
        w.writeU8(0);
        writeStr(w, "alice");
        w.writeI32(1);
        w.writeF32(1.f);
    }));

    QueryClient client{transport};
    auto players = client.players().unwrap();

    ASSERT_EQ(players.size(), 2);
    EXPECT_TRUE(std::holds_alternative<Player>(players[0]));
    EXPECT_TRUE(std::holds_alternative<IncompletePlayer>(players[1]));
    EXPECT_EQ(warnings(), 1);
}

TEST_F(QueryClientTest, PlayersHeaderIsConfigurable) {
    // a server that answers players queries with a nonstandard header right away
    transport->push(wholeDatagram('d', [](HeapByteWriter& w) { w.writeU8(0); }));

    QueryClient client{transport, QueryOptions { .playersHeader = 'd' }};
    auto players = client.players().unwrap();

    EXPECT_TRUE(players.empty());
    EXPECT_EQ(transport->sent.size(), 1);
}

TEST_F(QueryClientTest, NoResponseTimesOut) {
    QueryClient client{transport};

    auto res = client.info();
    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(res.unwrapErr().isTimeout());
    EXPECT_FALSE(res.unwrapErr().message().empty());
}
