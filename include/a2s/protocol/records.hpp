#pragma once

#include <asp/time/Duration.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <stdint.h>

namespace a2s {

struct ServerInfo {
    // response header byte, 'I' unless configured otherwise
    uint8_t header = 0;
    uint8_t protocol = 0;
    std::string name;
    std::string map;
    std::string folder;
    std::string game;
    uint16_t appId = 0;
    uint8_t players = 0;
    uint8_t maxPlayers = 0;
    uint8_t bots = 0;

    // Descriptive labels, unknown codes are kept as the raw character (type, environment)
    // or as decimal text (visibility, vac)
    std::string serverType;
    std::string environment;
    std::string visibility;
    std::string vac;

    std::string version;
    uint8_t edf = 0;

    // Present only when the matching EDF bit is set
    std::optional<uint16_t> port;
    std::optional<uint64_t> steamId;
    std::optional<uint16_t> sourceTvPort;
    std::optional<std::string> sourceTvName;
    std::optional<std::string> keywords;
    std::optional<uint64_t> gameId;

    asp::time::Duration ping = asp::time::Duration::fromMillis(0);

    // the whole response as received, marker included
    std::vector<uint8_t> raw;
};

// Value recorded for a rule whose name was read but whose value was cut off
constexpr inline std::string_view RULE_VALUE_TRUNCATED = "N/A - packet cut off";

using Rules = std::unordered_map<std::string, std::string>;

inline bool isTruncatedRule(std::string_view value) {
    return value == RULE_VALUE_TRUNCATED;
}

struct Player {
    uint8_t index = 0;
    std::string name;
    int32_t score = 0;
    // seconds connected
    float duration = 0.f;

    bool operator==(const Player& other) const = default;
};

/// Placeholder for a player record that could not be fully decoded.
struct IncompletePlayer {
    // position of the record in the response, not the player's wire index
    size_t slot = 0;

    bool operator==(const IncompletePlayer& other) const = default;
};

using PlayerEntry = std::variant<Player, IncompletePlayer>;

}
