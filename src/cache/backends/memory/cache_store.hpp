#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <unordered_map>

#include "cache/cache_store.hpp"

namespace scout::cache {

// Process-local store. Rows are spread over lock-striped shards; a batch locks
// only the shards it touches, always in ascending shard order.
class MemoryCacheStore final : public CacheStore {
public:
    MemoryCacheStore() = default;

    const char *backendName() const override { return "memory"; }

    void upsertBatch(const std::vector<ServerRecord> &records) override;
    void updatePing(const ServerAddress &address,
                    std::optional<int> pingMs,
                    int playerCount,
                    Timestamp observedAt) override;
    void updateDetails(const ServerAddress &address, const ProbeDetails &details) override;
    std::vector<ServerRecord> getAll(const std::optional<FilterCriteria> &filter) const override;
    std::vector<ServerRecord> getTopServers(std::size_t n, SortKey sortKey) const override;
    std::optional<CacheEntry> getEntry(const ServerAddress &address,
                                       Timestamp now,
                                       std::chrono::seconds ttl) const override;
    std::size_t pruneStale(Timestamp now, std::chrono::seconds maxAge) override;
    std::size_t purgeExpired(Timestamp now, std::chrono::seconds maxAge) override;
    void recordFetch(const std::string &criteriaKey, Timestamp fetchedAt) override;
    std::optional<Timestamp> lastFetch(const std::string &criteriaKey) const override;
    CacheStats stats() const override;
    void close() override;

    using CacheStore::getAll;

private:
    static constexpr std::size_t kShardCount = 16;

    struct Row {
        ServerRecord record;
        bool active = true;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<ServerAddress, Row> rows;
    };

    std::size_t shardIndex(const ServerAddress &address) const;
    void ensureOpen() const;

    template <typename Fn>
    void forEachRow(Fn &&fn) const;

    std::array<Shard, kShardCount> shards;
    mutable std::mutex fetchLogMutex;
    std::unordered_map<std::string, Timestamp> fetchLog;
    std::atomic<bool> closed{false};
};

} // namespace scout::cache
