#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "common/clock.hpp"

namespace scout {

enum class SourceKind {
    Official,
    Community,
    Private
};

const char *SourceKindName(SourceKind kind);
std::optional<SourceKind> ParseSourceKind(std::string_view text);

enum class Perspective {
    Unknown,
    FirstPerson,
    ThirdPerson,
    Both
};

// "1PP", "3PP", "1PP/3PP" or "Unknown".
const char *PerspectiveName(Perspective perspective);
Perspective ParsePerspective(std::string_view text);
// Reads the 1pp/3pp tags a server advertises in its query keywords.
Perspective PerspectiveFromKeywords(std::string_view keywords);

struct ServerAddress {
    std::string host;
    uint16_t port = 0;

    std::string key() const;
    bool operator==(const ServerAddress &other) const = default;
};

struct ServerRecord {
    ServerAddress address;
    // Endpoint answering liveness queries; 0 means address.port + 1.
    uint16_t queryPort = 0;
    std::string name;
    std::string map;
    std::string country;
    SourceKind sourceKind = SourceKind::Community;
    bool modsPresent = false;
    Perspective perspective = Perspective::Unknown;
    int playerCount = 0;
    int maxPlayers = 0;
    std::optional<int> pingMs;
    Timestamp lastSeenAt{};
    Timestamp fetchedAt{};

    ServerAddress probeEndpoint() const;
};

// Clamps counts so that 0 <= playerCount <= maxPlayers.
void NormalizeCounts(ServerRecord &record);

} // namespace scout

template <>
struct std::hash<scout::ServerAddress> {
    std::size_t operator()(const scout::ServerAddress &address) const noexcept {
        return std::hash<std::string>{}(address.host) ^ (std::hash<uint16_t>{}(address.port) << 1);
    }
};
