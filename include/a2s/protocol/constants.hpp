#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string_view>

namespace a2s {

// Leading 4-byte framing markers
constexpr inline int32_t PACKET_WHOLE = -1;
constexpr inline int32_t PACKET_SPLIT = -2;

// Set on the split packet id when the payload is bzip2 compressed
constexpr inline uint32_t SPLIT_COMPRESSED_MASK = 0x80000000;

// Request headers
constexpr inline uint8_t A2S_INFO = 'T';
constexpr inline uint8_t A2S_PLAYER = 'U';
constexpr inline uint8_t A2S_RULES = 'V';

constexpr inline std::string_view A2S_INFO_PAYLOAD = "Source Engine Query";

// Response headers
constexpr inline uint8_t S2A_INFO = 'I';
constexpr inline uint8_t S2A_PLAYER = 'D';
constexpr inline uint8_t S2A_RULES = 'E';
constexpr inline uint8_t S2C_CHALLENGE = 'A';

// Challenge value sent on the first attempt of a challenged query
constexpr inline int32_t CHALLENGE_REQUEST = -1;

// Extra data flags in the A2S_INFO response, listed in wire order
constexpr inline uint8_t EDF_PORT = 0x80;
constexpr inline uint8_t EDF_STEAMID = 0x10;
constexpr inline uint8_t EDF_SOURCETV = 0x40;
constexpr inline uint8_t EDF_KEYWORDS = 0x20;
constexpr inline uint8_t EDF_GAMEID = 0x01;

constexpr inline uint16_t DEFAULT_PORT = 27015;

// Largest datagram a Source server sends, split fragments included
constexpr inline size_t UDP_PACKET_LIMIT = 1400;

// Receive buffer size. A datagram that fills it entirely may have been cut by the socket and is rejected
constexpr inline size_t RECV_BUFFER_SIZE = 4096;

}
