#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "browser/filter_criteria.hpp"
#include "browser/server_record.hpp"
#include "common/clock.hpp"

namespace scout::cache {

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string &msg) : std::runtime_error(msg) {}
};

enum class SortKey {
    Players,
    Ping,
    Name,
    LastSeen
};

const char *SortKeyName(SortKey key);
std::optional<SortKey> ParseSortKey(const std::string &text);

inline constexpr std::chrono::minutes kDefaultTtl{15};
inline constexpr std::chrono::hours kDefaultStaleAge{2};
inline constexpr std::chrono::hours kDefaultPurgeAge{24};

struct CacheEntry {
    ServerRecord record;
    Timestamp fetchedAt{};
    bool isStale = false;
    bool active = true;
};

// What a live server reported about itself. Empty strings and an unknown
// perspective leave the stored values in place.
struct ProbeDetails {
    std::string name;
    std::string map;
    Perspective perspective = Perspective::Unknown;
};

struct CacheStats {
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t official = 0;
    std::size_t community = 0;
    std::size_t privateServers = 0;
};

// Keyed store of server records. Every method may throw CacheError on storage failure.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual const char *backendName() const = 0;

    // Insert-or-update keyed by address, applied atomically. lastSeenAt keeps the
    // later of the stored and incoming values and a known ping is preserved.
    virtual void upsertBatch(const std::vector<ServerRecord> &records) = 0;

    // Probe write-back. A known ping reactivates the row, clamps playerCount to
    // maxPlayers and raises lastSeenAt; an unknown ping only clears pingMs.
    virtual void updatePing(const ServerAddress &address,
                            std::optional<int> pingMs,
                            int playerCount,
                            Timestamp observedAt) = 0;
    virtual void updateDetails(const ServerAddress &address, const ProbeDetails &details) = 0;

    // Active rows matching filter, ordered by ping (unknown last) then name.
    virtual std::vector<ServerRecord> getAll(const std::optional<FilterCriteria> &filter) const = 0;
    std::vector<ServerRecord> getAll() const { return getAll(std::nullopt); }

    // Includes rows already pruned but not yet purged.
    virtual std::vector<ServerRecord> getTopServers(std::size_t n, SortKey sortKey) const = 0;

    virtual std::optional<CacheEntry> getEntry(const ServerAddress &address,
                                               Timestamp now,
                                               std::chrono::seconds ttl) const = 0;

    // Marks rows unseen for longer than maxAge inactive. Returns the number marked.
    virtual std::size_t pruneStale(Timestamp now, std::chrono::seconds maxAge) = 0;
    // Deletes rows unseen for longer than maxAge. Returns the number removed.
    virtual std::size_t purgeExpired(Timestamp now, std::chrono::seconds maxAge) = 0;

    virtual void recordFetch(const std::string &criteriaKey, Timestamp fetchedAt) = 0;
    virtual std::optional<Timestamp> lastFetch(const std::string &criteriaKey) const = 0;

    virtual CacheStats stats() const = 0;
    virtual void close() = 0;
};

// Orders records for listings: ping ascending with unknown pings last, then name.
void SortForListing(std::vector<ServerRecord> &records);
void SortByKey(std::vector<ServerRecord> &records, SortKey sortKey);

bool IsStale(Timestamp fetchedAt, Timestamp now, std::chrono::seconds ttl);

} // namespace scout::cache
