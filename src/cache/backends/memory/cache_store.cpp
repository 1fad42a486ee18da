#include "cache/backends/memory/cache_store.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <set>

namespace scout::cache {

std::size_t MemoryCacheStore::shardIndex(const ServerAddress &address) const {
    return std::hash<ServerAddress>{}(address) % kShardCount;
}

void MemoryCacheStore::ensureOpen() const {
    if (closed.load()) {
        throw CacheError("memory cache store is closed");
    }
}

template <typename Fn>
void MemoryCacheStore::forEachRow(Fn &&fn) const {
    for (const auto &shard : shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto &[address, row] : shard.rows) {
            fn(row);
        }
    }
}

void MemoryCacheStore::upsertBatch(const std::vector<ServerRecord> &records) {
    ensureOpen();
    if (records.empty()) {
        return;
    }

    std::set<std::size_t> touched;
    for (const auto &record : records) {
        touched.insert(shardIndex(record.address));
    }

    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(touched.size());
    for (std::size_t index : touched) {
        locks.emplace_back(shards[index].mutex);
    }

    for (const auto &incoming : records) {
        auto &rows = shards[shardIndex(incoming.address)].rows;
        auto it = rows.find(incoming.address);
        if (it == rows.end()) {
            Row row;
            row.record = incoming;
            NormalizeCounts(row.record);
            rows.emplace(incoming.address, std::move(row));
            continue;
        }

        Row &row = it->second;
        const Timestamp lastSeen = std::max(row.record.lastSeenAt, incoming.lastSeenAt);
        const std::optional<int> ping = incoming.pingMs ? incoming.pingMs : row.record.pingMs;
        const Perspective perspective =
            incoming.perspective != Perspective::Unknown ? incoming.perspective : row.record.perspective;
        row.record = incoming;
        row.record.lastSeenAt = lastSeen;
        row.record.pingMs = ping;
        row.record.perspective = perspective;
        NormalizeCounts(row.record);
        row.active = true;
    }
}

void MemoryCacheStore::updatePing(const ServerAddress &address,
                                  std::optional<int> pingMs,
                                  int playerCount,
                                  Timestamp observedAt) {
    ensureOpen();
    auto &shard = shards[shardIndex(address)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.rows.find(address);
    if (it == shard.rows.end()) {
        spdlog::trace("MemoryCacheStore: Ignoring ping for unknown server {}", address.key());
        return;
    }

    Row &row = it->second;
    if (!pingMs) {
        row.record.pingMs.reset();
        return;
    }

    row.record.pingMs = std::max(0, *pingMs);
    row.record.playerCount = playerCount;
    row.record.lastSeenAt = std::max(row.record.lastSeenAt, observedAt);
    NormalizeCounts(row.record);
    row.active = true;
}

void MemoryCacheStore::updateDetails(const ServerAddress &address, const ProbeDetails &details) {
    ensureOpen();
    auto &shard = shards[shardIndex(address)];
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.rows.find(address);
    if (it == shard.rows.end()) {
        return;
    }
    ServerRecord &record = it->second.record;
    if (!details.name.empty()) {
        record.name = details.name;
    }
    if (!details.map.empty()) {
        record.map = details.map;
    }
    if (details.perspective != Perspective::Unknown) {
        record.perspective = details.perspective;
    }
}

std::vector<ServerRecord> MemoryCacheStore::getAll(const std::optional<FilterCriteria> &filter) const {
    ensureOpen();
    std::vector<ServerRecord> result;
    forEachRow([&](const Row &row) {
        if (!row.active) {
            return;
        }
        if (filter && !filter->matches(row.record)) {
            return;
        }
        result.push_back(row.record);
    });
    SortForListing(result);
    return result;
}

std::vector<ServerRecord> MemoryCacheStore::getTopServers(std::size_t n, SortKey sortKey) const {
    ensureOpen();
    std::vector<ServerRecord> result;
    forEachRow([&](const Row &row) { result.push_back(row.record); });
    SortByKey(result, sortKey);
    if (result.size() > n) {
        result.resize(n);
    }
    return result;
}

std::optional<CacheEntry> MemoryCacheStore::getEntry(const ServerAddress &address,
                                                     Timestamp now,
                                                     std::chrono::seconds ttl) const {
    ensureOpen();
    const auto &shard = shards[shardIndex(address)];
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.rows.find(address);
    if (it == shard.rows.end()) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.record = it->second.record;
    entry.fetchedAt = it->second.record.fetchedAt;
    entry.isStale = IsStale(entry.fetchedAt, now, ttl);
    entry.active = it->second.active;
    return entry;
}

std::size_t MemoryCacheStore::pruneStale(Timestamp now, std::chrono::seconds maxAge) {
    ensureOpen();
    std::size_t pruned = 0;
    for (auto &shard : shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto &[address, row] : shard.rows) {
            if (row.active && now - row.record.lastSeenAt > maxAge) {
                row.active = false;
                ++pruned;
            }
        }
    }
    return pruned;
}

std::size_t MemoryCacheStore::purgeExpired(Timestamp now, std::chrono::seconds maxAge) {
    ensureOpen();
    std::size_t purged = 0;
    for (auto &shard : shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.rows.begin(); it != shard.rows.end();) {
            if (now - it->second.record.lastSeenAt > maxAge) {
                it = shard.rows.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }
    }
    return purged;
}

void MemoryCacheStore::recordFetch(const std::string &criteriaKey, Timestamp fetchedAt) {
    ensureOpen();
    std::lock_guard<std::mutex> lock(fetchLogMutex);
    fetchLog[criteriaKey] = fetchedAt;
}

std::optional<Timestamp> MemoryCacheStore::lastFetch(const std::string &criteriaKey) const {
    ensureOpen();
    std::lock_guard<std::mutex> lock(fetchLogMutex);
    auto it = fetchLog.find(criteriaKey);
    if (it == fetchLog.end()) {
        return std::nullopt;
    }
    return it->second;
}

CacheStats MemoryCacheStore::stats() const {
    ensureOpen();
    CacheStats result;
    forEachRow([&](const Row &row) {
        ++result.total;
        if (row.active) {
            ++result.active;
        }
        switch (row.record.sourceKind) {
            case SourceKind::Official:
                ++result.official;
                break;
            case SourceKind::Community:
                ++result.community;
                break;
            case SourceKind::Private:
                ++result.privateServers;
                break;
        }
    });
    return result;
}

void MemoryCacheStore::close() {
    closed.store(true);
}

} // namespace scout::cache
