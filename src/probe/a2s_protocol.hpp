#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scout::probe::a2s {

constexpr uint8_t INFO_REQUEST = 0x54;
constexpr uint8_t INFO_REPLY = 0x49;
constexpr uint8_t CHALLENGE_REPLY = 0x41;
constexpr const char *INFO_PAYLOAD = "Source Engine Query";
constexpr std::size_t MAX_PACKET_SIZE = 1400;

// Extra data flag bits, in wire order.
constexpr uint8_t EDF_GAME_PORT = 0x80;
constexpr uint8_t EDF_STEAM_ID = 0x10;
constexpr uint8_t EDF_SOURCE_TV = 0x40;
constexpr uint8_t EDF_KEYWORDS = 0x20;
constexpr uint8_t EDF_GAME_ID = 0x01;

enum class ReplyType {
    Info,
    Challenge,
    Invalid
};

struct InfoReply {
    uint8_t protocol = 0;
    std::string name;
    std::string map;
    std::string folder;
    std::string game;
    uint16_t appId = 0;
    int players = 0;
    int maxPlayers = 0;
    int bots = 0;
    char serverType = 0;
    char environment = 0;
    bool passwordProtected = false;
    bool vacSecured = false;
    std::string version;
    uint16_t gamePort = 0;
    uint64_t steamId = 0;
    std::string keywords;
    uint64_t gameId = 0;
};

struct Reply {
    ReplyType type = ReplyType::Invalid;
    uint32_t challenge = 0;
    InfoReply info;
};

// FF FF FF FF 54 "Source Engine Query\0" followed by the challenge when one was issued.
std::vector<uint8_t> BuildInfoRequest(std::optional<uint32_t> challenge = std::nullopt);

Reply ParseReply(const uint8_t *data, std::size_t size);

} // namespace scout::probe::a2s
