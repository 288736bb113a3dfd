#include <a2s/protocol/decode.hpp>
#include <a2s/Log.hpp>

#define MAP_UNWRAP(x) A2S_UNWRAP_AS(x, QueryError::MalformedPacket)

namespace a2s {

std::string_view serverTypeLabel(char code) {
    switch (code) {
        case 'd': return "Dedicated Server";
        case 'l': return "Non-dedicated Server";
        case 'p': return "SourceTV relay";
        default: return {};
    }
}

std::string_view environmentLabel(char code) {
    switch (code) {
        case 'l': return "Linux";
        case 'w': return "Windows";
        case 'm':
        case 'o': return "Mac";
        default: return {};
    }
}

static std::string labelOrRaw(std::string_view label, char code) {
    return label.empty() ? std::string(1, code) : std::string(label);
}

static std::string flagLabel(uint8_t value, std::string_view zero, std::string_view one) {
    switch (value) {
        case 0: return std::string(zero);
        case 1: return std::string(one);
        default: return std::to_string(value);
    }
}

// Skips the marker and checks the header byte, leaving the reader at the first field
static QueryResult<uint8_t> readHeader(ByteReader& reader, uint8_t expected, std::string_view what) {
    MAP_UNWRAP(reader.skip(4));
    uint8_t header = MAP_UNWRAP(reader.readU8());

    if (header != expected) {
        log::warn("Expected {} header {:#04x}, got {:#04x}", what, expected, header);
        return Err(QueryError::UnexpectedHeader);
    }

    return Ok(header);
}

QueryResult<ServerInfo> decodeInfo(const Packet& packet, uint8_t expectedHeader) {
    auto reader = packet.reader();

    ServerInfo info;
    info.header = GEODE_UNWRAP(readHeader(reader, expectedHeader, "info"));
    info.raw = packet.data;
    info.ping = packet.latency;
    info.protocol = MAP_UNWRAP(reader.readU8());
    info.name = MAP_UNWRAP(reader.readCString());
    info.map = MAP_UNWRAP(reader.readCString());
    info.folder = MAP_UNWRAP(reader.readCString());
    info.game = MAP_UNWRAP(reader.readCString());
    info.appId = MAP_UNWRAP(reader.readU16());
    info.players = MAP_UNWRAP(reader.readU8());
    info.maxPlayers = MAP_UNWRAP(reader.readU8());
    info.bots = MAP_UNWRAP(reader.readU8());

    char type = static_cast<char>(MAP_UNWRAP(reader.readU8()));
    info.serverType = labelOrRaw(serverTypeLabel(type), type);

    char env = static_cast<char>(MAP_UNWRAP(reader.readU8()));
    info.environment = labelOrRaw(environmentLabel(env), env);

    info.visibility = flagLabel(MAP_UNWRAP(reader.readU8()), "Public", "Private");
    info.vac = flagLabel(MAP_UNWRAP(reader.readU8()), "Unsecured", "Secured");

    info.version = MAP_UNWRAP(reader.readCString());
    info.edf = MAP_UNWRAP(reader.readU8());

    // extra data flags are read in this exact order, not bit order
    if (info.edf & EDF_PORT) {
        info.port = MAP_UNWRAP(reader.readU16());
    }

    if (info.edf & EDF_STEAMID) {
        info.steamId = MAP_UNWRAP(reader.readU64());
    }

    if (info.edf & EDF_SOURCETV) {
        info.sourceTvPort = MAP_UNWRAP(reader.readU16());
        info.sourceTvName = MAP_UNWRAP(reader.readCString());
    }

    if (info.edf & EDF_KEYWORDS) {
        info.keywords = MAP_UNWRAP(reader.readCString());
    }

    if (info.edf & EDF_GAMEID) {
        info.gameId = MAP_UNWRAP(reader.readU64());
    }

    return Ok(std::move(info));
}

QueryResult<Rules> decodeRules(const Packet& packet, uint8_t expectedHeader) {
    auto reader = packet.reader();

    GEODE_UNWRAP(readHeader(reader, expectedHeader, "rules"));
    int16_t count = MAP_UNWRAP(reader.readI16());

    Rules rules;
    size_t truncated = 0;

    for (int16_t i = 0; i < count; i++) {
        auto name = reader.readCString();
        if (!name) {
            truncated++;
            continue;
        }

        auto value = reader.readCString();
        if (!value) {
            truncated++;
            rules[std::move(name).unwrap()] = std::string(RULE_VALUE_TRUNCATED);
            continue;
        }

        rules[std::move(name).unwrap()] = std::move(value).unwrap();
    }

    if (truncated > 0) {
        log::warn("Rules response was cut off, {} of {} rules incomplete", truncated, count);
    }

    return Ok(std::move(rules));
}

static ByteReader::Result<Player> readPlayer(ByteReader& reader) {
    Player player;
    player.index = GEODE_UNWRAP(reader.readU8());
    player.name = GEODE_UNWRAP(reader.readCString());
    player.score = GEODE_UNWRAP(reader.readI32());
    player.duration = GEODE_UNWRAP(reader.readF32());
    return Ok(std::move(player));
}

QueryResult<std::vector<PlayerEntry>> decodePlayers(const Packet& packet, uint8_t expectedHeader) {
    auto reader = packet.reader();

    GEODE_UNWRAP(readHeader(reader, expectedHeader, "players"));
    uint8_t count = MAP_UNWRAP(reader.readU8());

    std::vector<PlayerEntry> players;
    players.reserve(count);
    size_t incomplete = 0;

    for (size_t slot = 0; slot < count; slot++) {
        // no resync on failure, the next record starts wherever the cursor stopped
        if (auto player = readPlayer(reader)) {
            players.emplace_back(std::move(player).unwrap());
        } else {
            players.emplace_back(IncompletePlayer{slot});
            incomplete++;
        }
    }

    if (incomplete > 0) {
        log::warn("Players response was cut off, {} of {} players incomplete", incomplete, count);
    }

    return Ok(std::move(players));
}

}
