#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

#include "cache/backends/sqlite/sqlite_db.hpp"
#include "cache/cache_store.hpp"

namespace scout::cache {

// Persistent store backed by one SQLite file in WAL mode. Batch merges and
// ping write-backs run on separate connections so neither waits on the
// other's process-level lock; SQLite serializes the actual row writes.
class SqliteCacheStore final : public CacheStore {
public:
    explicit SqliteCacheStore(const std::filesystem::path &path,
                              std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));
    ~SqliteCacheStore() override;

    const char *backendName() const override { return "sqlite"; }

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
    void createSchema();
    sqlite::SqliteDB &bulkConnection() const;
    sqlite::SqliteDB &pingConnection() const;

    std::filesystem::path path;
    mutable std::mutex bulkMutex;
    mutable std::mutex pingMutex;
    std::unique_ptr<sqlite::SqliteDB> bulk;
    std::unique_ptr<sqlite::SqliteDB> ping;
};

} // namespace scout::cache
