#include "cache/cache_store.hpp"

#include <algorithm>

namespace {

bool pingLess(const scout::ServerRecord &lhs, const scout::ServerRecord &rhs) {
    if (lhs.pingMs.has_value() != rhs.pingMs.has_value()) {
        return lhs.pingMs.has_value();
    }
    if (lhs.pingMs && *lhs.pingMs != *rhs.pingMs) {
        return *lhs.pingMs < *rhs.pingMs;
    }
    if (lhs.name != rhs.name) {
        return lhs.name < rhs.name;
    }
    return lhs.address.key() < rhs.address.key();
}

} // namespace

namespace scout::cache {

const char *SortKeyName(SortKey key) {
    switch (key) {
        case SortKey::Players:
            return "players";
        case SortKey::Ping:
            return "ping";
        case SortKey::Name:
            return "name";
        case SortKey::LastSeen:
            return "last_seen";
    }
    return "players";
}

std::optional<SortKey> ParseSortKey(const std::string &text) {
    if (text == "players") {
        return SortKey::Players;
    }
    if (text == "ping") {
        return SortKey::Ping;
    }
    if (text == "name") {
        return SortKey::Name;
    }
    if (text == "last_seen") {
        return SortKey::LastSeen;
    }
    return std::nullopt;
}

void SortForListing(std::vector<ServerRecord> &records) {
    std::sort(records.begin(), records.end(), pingLess);
}

void SortByKey(std::vector<ServerRecord> &records, SortKey sortKey) {
    switch (sortKey) {
        case SortKey::Players:
            std::sort(records.begin(), records.end(), [](const ServerRecord &lhs, const ServerRecord &rhs) {
                if (lhs.playerCount != rhs.playerCount) {
                    return lhs.playerCount > rhs.playerCount;
                }
                return lhs.name < rhs.name;
            });
            break;
        case SortKey::Ping:
            std::sort(records.begin(), records.end(), pingLess);
            break;
        case SortKey::Name:
            std::sort(records.begin(), records.end(), [](const ServerRecord &lhs, const ServerRecord &rhs) {
                if (lhs.name != rhs.name) {
                    return lhs.name < rhs.name;
                }
                return lhs.address.key() < rhs.address.key();
            });
            break;
        case SortKey::LastSeen:
            std::sort(records.begin(), records.end(), [](const ServerRecord &lhs, const ServerRecord &rhs) {
                if (lhs.lastSeenAt != rhs.lastSeenAt) {
                    return lhs.lastSeenAt > rhs.lastSeenAt;
                }
                return lhs.name < rhs.name;
            });
            break;
    }
}

bool IsStale(Timestamp fetchedAt, Timestamp now, std::chrono::seconds ttl) {
    return now - fetchedAt > ttl;
}

} // namespace scout::cache
