#include "catalog/catalog_parser.hpp"

#include "common/json.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <utility>

namespace {

constexpr uint16_t kDefaultGamePort = 2302;

struct MapPattern {
    const char *title;
    std::array<const char *, 2> needles;
};

const std::array<MapPattern, 15> kMapPatterns = {{
    {"Chernarus", {"chernarus", "cherno"}},
    {"Livonia", {"livonia", nullptr}},
    {"Namalsk", {"namalsk", nullptr}},
    {"Sakhal", {"sakhal", nullptr}},
    {"Banov", {"banov", nullptr}},
    {"Esseker", {"esseker", nullptr}},
    {"Deer Isle", {"deer isle", "deerisle"}},
    {"Takistan", {"takistan", nullptr}},
    {"Alteria", {"alteria", nullptr}},
    {"Pripyat", {"pripyat", nullptr}},
    {"Valning", {"valning", nullptr}},
    {"Melkart", {"melkart", nullptr}},
    {"Rostow", {"rostow", nullptr}},
    {"Iztek", {"iztek", nullptr}},
    {"Swans Island", {"swans island", "swansisland"}},
}};

std::string lowerCopy(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

bool containsAny(const std::string &haystack, std::initializer_list<const char *> needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const char *needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

int parseIntegerField(const scout::json::Value &object, const char *key, int fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }

    if (it->is_number()) {
        return scout::json::ToInt(*it).value_or(fallback);
    }
    try {
        if (it->is_string()) {
            return std::stoi(it->get<std::string>());
        }
    } catch (const std::exception &) {
        return fallback;
    }

    return fallback;
}

uint16_t parsePortField(const scout::json::Value &object, const char *key, uint16_t fallback) {
    const int value = parseIntegerField(object, key, -1);
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        return fallback;
    }
    return static_cast<uint16_t>(value);
}

std::string parseStringField(const scout::json::Value &object, const char *key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

bool isDigits(const std::string &value) {
    return !value.empty() && std::all_of(value.begin(), value.end(),
                                         [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

bool listHasMod(const scout::json::Value &list) {
    if (!list.is_array()) {
        return false;
    }
    for (const auto &entry : list) {
        if (entry.is_number_integer()) {
            return true;
        }
        if (entry.is_string() && isDigits(entry.get<std::string>())) {
            return true;
        }
        if (entry.is_object() && entry.contains("id")) {
            return true;
        }
    }
    return false;
}

bool detailsHaveMods(const scout::json::Value &details) {
    if (!details.is_object()) {
        return false;
    }
    for (const char *key : {"modIds", "mods"}) {
        auto it = details.find(key);
        if (it == details.end()) {
            continue;
        }
        if (listHasMod(*it)) {
            return true;
        }
        if (it->is_string()) {
            const std::string text = it->get<std::string>();
            std::size_t start = 0;
            while (start <= text.size()) {
                std::size_t comma = text.find(',', start);
                std::string token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
                token.erase(std::remove_if(token.begin(), token.end(),
                                           [](unsigned char ch) { return std::isspace(ch) != 0; }),
                            token.end());
                if (isDigits(token)) {
                    return true;
                }
                if (comma == std::string::npos) {
                    break;
                }
                start = comma + 1;
            }
        }
    }
    if (auto it = details.find("modNames"); it != details.end() && it->is_array() && !it->empty()) {
        return true;
    }
    return false;
}

} // namespace

namespace scout::catalog {

std::string ExtractMapFromName(std::string_view serverName) {
    const std::string lowered = lowerCopy(serverName);
    for (const auto &pattern : kMapPatterns) {
        for (const char *needle : pattern.needles) {
            if (needle && lowered.find(needle) != std::string::npos) {
                return pattern.title;
            }
        }
    }
    return "Unknown";
}

SourceKind ClassifySourceKind(std::string_view serverName, bool privateFlag, bool modsPresent) {
    const std::string lowered = lowerCopy(serverName);

    if (privateFlag || containsAny(lowered, {"private", "whitelist", "closed"})) {
        return SourceKind::Private;
    }

    const bool officialNaming = lowered.find("dayz") != std::string::npos &&
        containsAny(lowered, {" de ", " us ", " eu ", " uk ", " fr ", " au ", " ca "});
    const bool decorated = containsAny(lowered, {"[", "]", "|", "★", "♦", "●", "~", "!"});
    const bool communityWording =
        containsAny(lowered, {"discord", "www", "http", "x10", "loot+", "rp", "roleplay", "clan"});

    if (officialNaming && !modsPresent && !decorated && !communityWording) {
        return SourceKind::Official;
    }

    return SourceKind::Community;
}

bool ParseCatalogPage(std::string_view body, Timestamp fetchedAt, CatalogPage &out, std::string *error) {
    out.records.clear();
    out.nextUrl.reset();

    scout::json::Value document;
    try {
        document = scout::json::Parse(body);
    } catch (const std::exception &ex) {
        if (error) {
            *error = std::string("invalid JSON: ") + ex.what();
        }
        return false;
    }

    if (!document.is_object()) {
        if (error) {
            *error = "catalog response is not an object";
        }
        return false;
    }

    auto dataIt = document.find("data");
    if (dataIt == document.end() || !dataIt->is_array()) {
        if (error) {
            *error = "catalog response missing 'data' array";
        }
        return false;
    }

    for (const auto &entry : *dataIt) {
        if (!entry.is_object()) {
            continue;
        }
        auto attributesIt = entry.find("attributes");
        if (attributesIt == entry.end() || !attributesIt->is_object()) {
            continue;
        }
        const auto &attributes = *attributesIt;

        ServerRecord record;
        record.address.host = parseStringField(attributes, "ip");
        if (record.address.host.empty()) {
            continue;
        }
        record.address.port = parsePortField(attributes, "port", kDefaultGamePort);

        record.name = parseStringField(attributes, "name");
        if (record.name.empty()) {
            record.name = "Unknown Server";
        }
        record.country = parseStringField(attributes, "country");
        record.playerCount = parseIntegerField(attributes, "players", 0);
        record.maxPlayers = parseIntegerField(attributes, "maxPlayers", 0);

        static const scout::json::Value emptyDetails = scout::json::Object();
        auto detailsIt = attributes.find("details");
        const auto &details = (detailsIt != attributes.end() && detailsIt->is_object()) ? *detailsIt : emptyDetails;

        const uint16_t defaultQueryPort = record.address.port == std::numeric_limits<uint16_t>::max()
            ? record.address.port
            : static_cast<uint16_t>(record.address.port + 1);
        record.queryPort = parsePortField(details, "queryPort", defaultQueryPort);

        record.modsPresent = detailsHaveMods(details);
        bool privateFlag = false;
        if (auto privateIt = attributes.find("private"); privateIt != attributes.end() && privateIt->is_boolean()) {
            privateFlag = privateIt->get<bool>();
        }

        record.map = ExtractMapFromName(record.name);
        record.sourceKind = ClassifySourceKind(record.name, privateFlag, record.modsPresent);
        record.fetchedAt = fetchedAt;
        record.lastSeenAt = fetchedAt;
        NormalizeCounts(record);

        out.records.push_back(std::move(record));
    }

    if (auto linksIt = document.find("links"); linksIt != document.end() && linksIt->is_object()) {
        auto nextIt = linksIt->find("next");
        if (nextIt != linksIt->end() && nextIt->is_string() && !nextIt->get<std::string>().empty()) {
            out.nextUrl = nextIt->get<std::string>();
        }
    }

    spdlog::trace("CatalogParser: Decoded {} record(s), next page {}", out.records.size(),
                  out.nextUrl ? "present" : "absent");
    return true;
}

} // namespace scout::catalog
