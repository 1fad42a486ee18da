#include "browser/server_record.hpp"

#include <algorithm>
#include <cctype>

namespace scout {

const char *SourceKindName(SourceKind kind) {
    switch (kind) {
        case SourceKind::Official:
            return "official";
        case SourceKind::Community:
            return "community";
        case SourceKind::Private:
            return "private";
    }
    return "community";
}

std::optional<SourceKind> ParseSourceKind(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "official") {
        return SourceKind::Official;
    }
    if (lowered == "community") {
        return SourceKind::Community;
    }
    if (lowered == "private") {
        return SourceKind::Private;
    }
    return std::nullopt;
}

const char *PerspectiveName(Perspective perspective) {
    switch (perspective) {
        case Perspective::FirstPerson:
            return "1PP";
        case Perspective::ThirdPerson:
            return "3PP";
        case Perspective::Both:
            return "1PP/3PP";
        case Perspective::Unknown:
            break;
    }
    return "Unknown";
}

Perspective ParsePerspective(std::string_view text) {
    if (text == "1PP") {
        return Perspective::FirstPerson;
    }
    if (text == "3PP") {
        return Perspective::ThirdPerson;
    }
    if (text == "1PP/3PP") {
        return Perspective::Both;
    }
    return Perspective::Unknown;
}

Perspective PerspectiveFromKeywords(std::string_view keywords) {
    std::string lowered(keywords);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    const bool first = lowered.find("1pp") != std::string::npos;
    const bool third = lowered.find("3pp") != std::string::npos;
    if (first && third) {
        return Perspective::Both;
    }
    if (first) {
        return Perspective::FirstPerson;
    }
    if (third) {
        return Perspective::ThirdPerson;
    }
    return Perspective::Unknown;
}

std::string ServerAddress::key() const {
    return host + ":" + std::to_string(port);
}

ServerAddress ServerRecord::probeEndpoint() const {
    ServerAddress endpoint = address;
    if (queryPort != 0) {
        endpoint.port = queryPort;
    } else if (address.port < 65535) {
        endpoint.port = static_cast<uint16_t>(address.port + 1);
    }
    return endpoint;
}

void NormalizeCounts(ServerRecord &record) {
    record.maxPlayers = std::max(record.maxPlayers, 0);
    record.playerCount = std::clamp(record.playerCount, 0, record.maxPlayers);
}

} // namespace scout
