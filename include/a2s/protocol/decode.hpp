#pragma once

#include "records.hpp"
#include "constants.hpp"
#include <a2s/transport/Packet.hpp>
#include <a2s/transport/Error.hpp>

#include <vector>

namespace a2s {

/// Decodes an A2S_INFO response. Every field is required, a short packet fails with `MalformedPacket`,
/// and a header other than `expectedHeader` fails with `UnexpectedHeader`.
QueryResult<ServerInfo> decodeInfo(const Packet& packet, uint8_t expectedHeader = S2A_INFO);

/// Decodes an A2S_RULES response. The header and the rule count are required: a rule whose name is cut off is
/// dropped, a rule whose value is cut off is kept with `RULE_VALUE_TRUNCATED` as its value.
QueryResult<Rules> decodeRules(const Packet& packet, uint8_t expectedHeader = S2A_RULES);

/// Decodes an A2S_PLAYER response. The header and the player count are required: every record that cannot be
/// decoded becomes an `IncompletePlayer` holding its slot, and decoding carries on after it.
QueryResult<std::vector<PlayerEntry>> decodePlayers(const Packet& packet, uint8_t expectedHeader = S2A_PLAYER);

std::string_view serverTypeLabel(char code);
std::string_view environmentLabel(char code);

}
