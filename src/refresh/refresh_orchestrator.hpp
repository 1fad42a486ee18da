#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "browser/errors.hpp"
#include "browser/filter_criteria.hpp"
#include "cache/cache_store.hpp"
#include "catalog/catalog_client.hpp"
#include "common/clock.hpp"
#include "probe/liveness_prober.hpp"
#include "refresh/refresh_options.hpp"
#include "refresh/update_stream.hpp"

namespace scout {

enum class RefreshState {
    Idle,
    Deciding,
    Fetching,
    CacheWarm,
    Merging,
    Probing,
    PartialReady,
    Complete,
    Failed,
    Superseded
};

const char *RefreshStateName(RefreshState state);
bool IsTerminal(RefreshState state);

/*
  Drives refresh cycles end to end. Each requestRefresh() opens a new
  generation and runs its cycle on a worker thread; older cycles stop
  emitting and writing back as soon as they notice the newer generation.
  shutdown() (also run by the destructor) invalidates the generation, waits
  for cycle threads to drain their probes and closes the cache.
*/
class RefreshOrchestrator {
public:
    RefreshOrchestrator(RefreshOptions options,
                        catalog::CatalogSource &catalogSource,
                        std::unique_ptr<cache::CacheStore> cacheStore,
                        probe::LivenessProber &prober,
                        UpdateStream &stream,
                        const Clock &clock);
    ~RefreshOrchestrator();

    RefreshOrchestrator(const RefreshOrchestrator &) = delete;
    RefreshOrchestrator &operator=(const RefreshOrchestrator &) = delete;

    // Returns the new generation, or nothing with error filled when the
    // criteria are malformed or the orchestrator has shut down.
    std::optional<Generation> requestRefresh(const FilterCriteria &criteria, bool force = false, Error *error = nullptr);

    // Records of the current generation, ordered by ping then name.
    std::vector<ServerRecord> currentServers() const;
    std::vector<ServerRecord> cachedTopServers(std::size_t n, cache::SortKey sortKey);

    Generation currentGeneration() const;
    RefreshState state() const;
    std::optional<RefreshState> stateOf(Generation generation) const;
    bool isDegraded() const;
    std::chrono::seconds cooldownRemaining() const;

    // Blocks until the cycle of generation reaches a terminal state. States of
    // finished generations are forgotten once a newer one has been requested,
    // so stateOf() returns nothing for them.
    bool waitForCycle(Generation generation, std::chrono::milliseconds timeout) const;

    void shutdown();

private:
    struct CycleWorker {
        Generation generation = 0;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void runCycle(Generation generation, FilterCriteria criteria, bool force);
    void runCycleSteps(Generation generation, const FilterCriteria &criteria, bool force);
    void probeCandidates(Generation generation, const std::vector<ServerRecord> &candidates);
    void applyProbeResult(Generation generation, const ServerAddress &address, const probe::ProbeOutcome *outcome);
    void failCycle(Generation generation, ErrorKind kind, const std::string &message);
    void startCooldown(std::chrono::seconds wait);
    void runMaintenance();

    bool isCurrent(Generation generation) const;
    void setState(Generation generation, RefreshState next);
    void publish(Generation generation, UpdateEvent event);

    void replaceSnapshot(Generation generation, const std::vector<ServerRecord> &records);
    std::optional<ServerRecord> snapshotRecord(Generation generation, const ServerAddress &address) const;
    void storeSnapshotRecord(Generation generation, const ServerRecord &record);

    std::shared_ptr<cache::CacheStore> activeCache() const;
    void degradeCache(const std::shared_ptr<cache::CacheStore> &failed, const cache::CacheError &error);

    // Runs fn against the active cache. A CacheError degrades to the in-memory
    // store and fn is retried there once.
    template <typename Fn>
    auto withCache(Fn &&fn) -> decltype(fn(std::declval<cache::CacheStore &>()));

    void reapFinishedCyclesLocked();
    // Drops terminal states of generations older than current.
    void forgetFinishedStatesLocked(Generation current);

    const RefreshOptions options;
    catalog::CatalogSource &catalogSource;
    probe::LivenessProber &prober;
    UpdateStream &stream;
    const Clock &clock;

    mutable std::mutex cacheMutex;
    std::shared_ptr<cache::CacheStore> cacheStore;
    std::atomic<bool> degraded{false};

    std::atomic<Generation> generation{0};
    std::atomic<bool> stopping{false};

    mutable std::mutex stateMutex;
    mutable std::condition_variable stateCv;
    std::unordered_map<Generation, RefreshState> states;

    mutable std::mutex snapshotMutex;
    Generation snapshotGeneration = 0;
    std::unordered_map<ServerAddress, ServerRecord> snapshot;

    mutable std::mutex timingMutex;
    std::optional<Timestamp> cooldownUntil;
    std::optional<Timestamp> lastMaintenance;

    std::mutex cyclesMutex;
    std::vector<CycleWorker> cycles;
};

} // namespace scout
