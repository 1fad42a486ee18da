#include "probe/a2s_protocol.hpp"

#include <cstring>

namespace {

class Reader {
public:
    Reader(const uint8_t *data, std::size_t size) : data(data), size(size) {}

    bool readU8(uint8_t &out) {
        if (offset + 1 > size) {
            return false;
        }
        out = data[offset++];
        return true;
    }

    // Little-endian on the wire.
    bool readU16(uint16_t &out) {
        if (offset + 2 > size) {
            return false;
        }
        out = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
        offset += 2;
        return true;
    }

    bool readU32(uint32_t &out) {
        if (offset + 4 > size) {
            return false;
        }
        out = static_cast<uint32_t>(data[offset]) |
            (static_cast<uint32_t>(data[offset + 1]) << 8) |
            (static_cast<uint32_t>(data[offset + 2]) << 16) |
            (static_cast<uint32_t>(data[offset + 3]) << 24);
        offset += 4;
        return true;
    }

    bool readU64(uint64_t &out) {
        uint32_t low = 0;
        uint32_t high = 0;
        if (offset + 8 > size || !readU32(low) || !readU32(high)) {
            return false;
        }
        out = static_cast<uint64_t>(low) | (static_cast<uint64_t>(high) << 32);
        return true;
    }

    bool readString(std::string &out) {
        const auto *begin = data + offset;
        const auto *terminator = static_cast<const uint8_t *>(std::memchr(begin, 0, size - offset));
        if (!terminator) {
            return false;
        }
        out.assign(reinterpret_cast<const char *>(begin), static_cast<std::size_t>(terminator - begin));
        offset += out.size() + 1;
        return true;
    }

private:
    const uint8_t *data;
    std::size_t size;
    std::size_t offset = 0;
};

// Everything after max players is optional. A truncated tail keeps whatever
// was read before it.
void readTrailingFields(Reader &reader, scout::probe::a2s::InfoReply &info) {
    using namespace scout::probe::a2s;

    uint8_t bots = 0;
    uint8_t serverType = 0;
    uint8_t environment = 0;
    uint8_t visibility = 0;
    uint8_t vac = 0;
    if (!reader.readU8(bots)) {
        return;
    }
    info.bots = bots;
    if (!reader.readU8(serverType) || !reader.readU8(environment) ||
        !reader.readU8(visibility) || !reader.readU8(vac)) {
        return;
    }
    info.serverType = static_cast<char>(serverType);
    info.environment = static_cast<char>(environment);
    info.passwordProtected = visibility != 0;
    info.vacSecured = vac != 0;
    if (!reader.readString(info.version)) {
        return;
    }

    uint8_t edf = 0;
    if (!reader.readU8(edf)) {
        return;
    }
    if ((edf & EDF_GAME_PORT) && !reader.readU16(info.gamePort)) {
        return;
    }
    if ((edf & EDF_STEAM_ID) && !reader.readU64(info.steamId)) {
        return;
    }
    if (edf & EDF_SOURCE_TV) {
        uint16_t tvPort = 0;
        std::string tvName;
        if (!reader.readU16(tvPort) || !reader.readString(tvName)) {
            return;
        }
    }
    if ((edf & EDF_KEYWORDS) && !reader.readString(info.keywords)) {
        return;
    }
    if (edf & EDF_GAME_ID) {
        reader.readU64(info.gameId);
    }
}

} // namespace

namespace scout::probe::a2s {

std::vector<uint8_t> BuildInfoRequest(std::optional<uint32_t> challenge) {
    std::vector<uint8_t> packet = {0xFF, 0xFF, 0xFF, 0xFF, INFO_REQUEST};
    const std::size_t payloadLength = std::strlen(INFO_PAYLOAD);
    packet.insert(packet.end(), INFO_PAYLOAD, INFO_PAYLOAD + payloadLength);
    packet.push_back(0x00);

    if (challenge) {
        const uint32_t value = *challenge;
        packet.push_back(static_cast<uint8_t>(value & 0xFF));
        packet.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        packet.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        packet.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }
    return packet;
}

Reply ParseReply(const uint8_t *data, std::size_t size) {
    Reply reply;
    if (!data) {
        return reply;
    }

    Reader reader(data, size);
    uint32_t header = 0;
    uint8_t type = 0;
    if (!reader.readU32(header) || header != 0xFFFFFFFFu || !reader.readU8(type)) {
        return reply;
    }

    if (type == CHALLENGE_REPLY) {
        if (!reader.readU32(reply.challenge)) {
            return reply;
        }
        reply.type = ReplyType::Challenge;
        return reply;
    }

    if (type != INFO_REPLY) {
        return reply;
    }

    InfoReply &info = reply.info;
    uint8_t players = 0;
    uint8_t maxPlayers = 0;
    if (!reader.readU8(info.protocol) ||
        !reader.readString(info.name) ||
        !reader.readString(info.map) ||
        !reader.readString(info.folder) ||
        !reader.readString(info.game) ||
        !reader.readU16(info.appId) ||
        !reader.readU8(players) ||
        !reader.readU8(maxPlayers)) {
        return reply;
    }
    readTrailingFields(reader, info);

    info.players = players;
    info.maxPlayers = maxPlayers;
    reply.type = ReplyType::Info;
    return reply;
}

} // namespace scout::probe::a2s
