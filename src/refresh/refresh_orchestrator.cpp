#include "refresh/refresh_orchestrator.hpp"

#include "cache/backends/memory/cache_store.hpp"
#include "catalog/http_transport.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cmath>
#include <string_view>
#include <unordered_set>

namespace {

constexpr std::chrono::milliseconds kProbePollSlice{50};

std::size_t readinessCount(std::size_t total, double threshold) {
    const double scaled = std::ceil(static_cast<double>(total) * threshold - 1e-9);
    return std::clamp<std::size_t>(static_cast<std::size_t>(std::max(scaled, 1.0)), 1, total);
}

} // namespace

namespace scout {

const char *RefreshStateName(RefreshState state) {
    switch (state) {
        case RefreshState::Idle:
            return "idle";
        case RefreshState::Deciding:
            return "deciding";
        case RefreshState::Fetching:
            return "fetching";
        case RefreshState::CacheWarm:
            return "cache_warm";
        case RefreshState::Merging:
            return "merging";
        case RefreshState::Probing:
            return "probing";
        case RefreshState::PartialReady:
            return "partial_ready";
        case RefreshState::Complete:
            return "complete";
        case RefreshState::Failed:
            return "failed";
        case RefreshState::Superseded:
            return "superseded";
    }
    return "unknown";
}

bool IsTerminal(RefreshState state) {
    return state == RefreshState::Complete || state == RefreshState::Failed || state == RefreshState::Superseded;
}

template <typename Fn>
auto RefreshOrchestrator::withCache(Fn &&fn) -> decltype(fn(std::declval<cache::CacheStore &>())) {
    auto store = activeCache();
    try {
        return fn(*store);
    } catch (const cache::CacheError &ex) {
        if (std::string_view(store->backendName()) == "memory" && degraded.load()) {
            throw;
        }
        degradeCache(store, ex);
    }
    auto fallback = activeCache();
    return fn(*fallback);
}

RefreshOrchestrator::RefreshOrchestrator(RefreshOptions options,
                                         catalog::CatalogSource &catalogSource,
                                         std::unique_ptr<cache::CacheStore> cacheStore,
                                         probe::LivenessProber &prober,
                                         UpdateStream &stream,
                                         const Clock &clock)
    : options(std::move(options)),
      catalogSource(catalogSource),
      prober(prober),
      stream(stream),
      clock(clock),
      cacheStore(std::move(cacheStore)) {
    if (!this->cacheStore) {
        spdlog::warn("RefreshOrchestrator: No cache store supplied; using in-memory cache");
        this->cacheStore = std::make_shared<cache::MemoryCacheStore>();
        degraded.store(true);
    }
}

RefreshOrchestrator::~RefreshOrchestrator() {
    shutdown();
}

std::optional<Generation> RefreshOrchestrator::requestRefresh(const FilterCriteria &criteria, bool force, Error *error) {
    if (stopping.load()) {
        if (error) {
            *error = Error{ErrorKind::Config, "orchestrator is shut down"};
        }
        return std::nullopt;
    }

    std::string validationError;
    if (!criteria.validate(&validationError)) {
        spdlog::warn("RefreshOrchestrator: Rejected filter criteria: {}", validationError);
        if (error) {
            *error = Error{ErrorKind::Config, validationError};
        }
        return std::nullopt;
    }

    std::lock_guard<std::mutex> cyclesLock(cyclesMutex);
    // shutdown() may have drained the worker list since the check above.
    if (stopping.load()) {
        if (error) {
            *error = Error{ErrorKind::Config, "orchestrator is shut down"};
        }
        return std::nullopt;
    }
    reapFinishedCyclesLocked();

    const Generation next = generation.load() + 1;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        forgetFinishedStatesLocked(generation.load());
        for (auto &[previous, previousState] : states) {
            if (!IsTerminal(previousState)) {
                spdlog::debug("RefreshOrchestrator: Generation {} superseded in state {}",
                              previous, RefreshStateName(previousState));
                previousState = RefreshState::Superseded;
            }
        }
        states[next] = RefreshState::Idle;
        generation.store(next);
    }
    stateCv.notify_all();
    stream.beginGeneration(next);

    spdlog::info("RefreshOrchestrator: Starting refresh generation {} ({}{})",
                 next, criteria.cacheKey(), force ? ", forced" : "");

    auto done = std::make_shared<std::atomic<bool>>(false);
    CycleWorker worker;
    worker.generation = next;
    worker.done = done;
    worker.thread = std::thread([this, next, criteria, force, done]() {
        runCycle(next, criteria, force);
        done->store(true);
    });
    cycles.push_back(std::move(worker));
    return next;
}

std::vector<ServerRecord> RefreshOrchestrator::currentServers() const {
    std::vector<ServerRecord> records;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex);
        records.reserve(snapshot.size());
        for (const auto &[address, record] : snapshot) {
            records.push_back(record);
        }
    }
    cache::SortForListing(records);
    return records;
}

std::vector<ServerRecord> RefreshOrchestrator::cachedTopServers(std::size_t n, cache::SortKey sortKey) {
    return withCache([&](cache::CacheStore &store) { return store.getTopServers(n, sortKey); });
}

Generation RefreshOrchestrator::currentGeneration() const {
    return generation.load();
}

RefreshState RefreshOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    auto it = states.find(generation.load());
    return it == states.end() ? RefreshState::Idle : it->second;
}

std::optional<RefreshState> RefreshOrchestrator::stateOf(Generation target) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    auto it = states.find(target);
    if (it == states.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RefreshOrchestrator::isDegraded() const {
    return degraded.load();
}

std::chrono::seconds RefreshOrchestrator::cooldownRemaining() const {
    std::lock_guard<std::mutex> lock(timingMutex);
    if (!cooldownUntil) {
        return std::chrono::seconds(0);
    }
    const auto remaining = *cooldownUntil - clock.now();
    if (remaining <= Timestamp::duration::zero()) {
        return std::chrono::seconds(0);
    }
    return std::chrono::ceil<std::chrono::seconds>(remaining);
}

bool RefreshOrchestrator::waitForCycle(Generation target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex);
    return stateCv.wait_for(lock, timeout, [&]() {
        auto it = states.find(target);
        if (it == states.end()) {
            // Forgotten generations had already finished.
            return target != 0 && target < generation.load();
        }
        return IsTerminal(it->second);
    });
}

void RefreshOrchestrator::shutdown() {
    bool expected = false;
    if (!stopping.compare_exchange_strong(expected, true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        for (auto &[previous, previousState] : states) {
            if (!IsTerminal(previousState)) {
                previousState = RefreshState::Superseded;
            }
        }
        generation.fetch_add(1);
    }
    stateCv.notify_all();

    std::vector<CycleWorker> pending;
    {
        std::lock_guard<std::mutex> lock(cyclesMutex);
        pending = std::move(cycles);
        cycles.clear();
    }
    for (auto &worker : pending) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    try {
        activeCache()->close();
    } catch (const cache::CacheError &ex) {
        spdlog::warn("RefreshOrchestrator: Failed to close cache: {}", ex.what());
    }
    spdlog::debug("RefreshOrchestrator: Shut down");
}

void RefreshOrchestrator::runCycle(Generation cycle, FilterCriteria criteria, bool force) {
    try {
        runCycleSteps(cycle, criteria, force);
    } catch (const cache::CacheError &ex) {
        spdlog::error("RefreshOrchestrator: Cache failure in generation {}: {}", cycle, ex.what());
        failCycle(cycle, ErrorKind::Cache, ex.what());
    } catch (const std::exception &ex) {
        spdlog::error("RefreshOrchestrator: Generation {} failed unexpectedly: {}", cycle, ex.what());
        failCycle(cycle, ErrorKind::Network, ex.what());
    }

    if (!stopping.load()) {
        runMaintenance();
    }
}

void RefreshOrchestrator::runCycleSteps(Generation cycle, const FilterCriteria &criteria, bool force) {
    setState(cycle, RefreshState::Deciding);

    const std::string criteriaKey = criteria.cacheKey();
    const Timestamp decidedAt = clock.now();

    std::vector<ServerRecord> candidates;
    bool warm = false;
    if (!force) {
        const auto lastFetch = withCache([&](cache::CacheStore &store) { return store.lastFetch(criteriaKey); });
        if (lastFetch && decidedAt - *lastFetch < options.cacheTtl) {
            candidates = withCache([&](cache::CacheStore &store) { return store.getAll(criteria); });
            warm = !candidates.empty();
            if (!warm) {
                spdlog::debug("RefreshOrchestrator: Cache fresh for {} but holds no active rows; fetching",
                              criteriaKey);
            }
        }
    }

    if (!isCurrent(cycle)) {
        return;
    }

    if (warm) {
        setState(cycle, RefreshState::CacheWarm);
        spdlog::info("RefreshOrchestrator: Generation {} served {} record(s) from cache", cycle, candidates.size());
    } else {
        const auto cooldown = cooldownRemaining();
        if (cooldown.count() > 0) {
            spdlog::warn("RefreshOrchestrator: Catalog cooldown active for {}s; skipping fetch", cooldown.count());
            failCycle(cycle, ErrorKind::RateLimit,
                      "catalog cooldown active (" + std::to_string(cooldown.count()) + "s remaining)");
            return;
        }

        setState(cycle, RefreshState::Fetching);
        catalog::CatalogResult result = catalogSource.fetchCatalog(criteria, options.catalogLimit);
        // The cooldown outlives the cycle that hit the limit.
        if (!result.ok && result.kind == ErrorKind::RateLimit) {
            startCooldown(result.retryAfter.value_or(options.rateLimitCooldown));
        }
        if (!isCurrent(cycle)) {
            return;
        }

        if (!result.ok) {
            failCycle(cycle, result.kind, result.message);
            return;
        }
        candidates = std::move(result.records);
    }

    setState(cycle, RefreshState::Merging);
    if (!warm) {
        withCache([&](cache::CacheStore &store) {
            store.upsertBatch(candidates);
            store.recordFetch(criteriaKey, decidedAt);
        });
        // Everything is merged; only rows the warm path would also return are probed.
        const auto fetched = candidates.size();
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](const ServerRecord &record) { return !criteria.matches(record); }),
                         candidates.end());
        if (candidates.size() != fetched) {
            spdlog::debug("RefreshOrchestrator: {} of {} fetched server(s) match {}",
                          candidates.size(), fetched, criteriaKey);
        }
    }
    if (!isCurrent(cycle)) {
        return;
    }
    replaceSnapshot(cycle, candidates);

    probeCandidates(cycle, candidates);
}

void RefreshOrchestrator::probeCandidates(Generation cycle, const std::vector<ServerRecord> &candidates) {
    if (candidates.empty()) {
        setState(cycle, RefreshState::PartialReady);
        publish(cycle, UpdateEvent::PartialReady(cycle));
        publish(cycle, UpdateEvent::Complete(cycle));
        setState(cycle, RefreshState::Complete);
        spdlog::info("RefreshOrchestrator: Generation {} complete with no servers", cycle);
        return;
    }

    setState(cycle, RefreshState::Probing);

    std::vector<probe::ProbeTarget> targets;
    std::unordered_set<ServerAddress> unresolved;
    targets.reserve(candidates.size());
    for (const auto &record : candidates) {
        if (unresolved.insert(record.address).second) {
            targets.push_back(probe::ProbeTarget{record.address, record.probeEndpoint()});
        }
    }

    const std::size_t needed = readinessCount(targets.size(), options.readinessThreshold);
    bool partialSent = false;
    auto emitPartial = [&]() {
        if (partialSent) {
            return;
        }
        partialSent = true;
        setState(cycle, RefreshState::PartialReady);
        publish(cycle, UpdateEvent::PartialReady(cycle));
    };

    auto round = prober.probeAll(std::move(targets), options.probeTimeout, options.concurrencyLimit);
    const auto deadline = std::chrono::steady_clock::now() + options.cycleTimeout;
    std::size_t resolved = 0;

    while (!unresolved.empty()) {
        if (!isCurrent(cycle)) {
            spdlog::debug("RefreshOrchestrator: Generation {} superseded while probing; draining", cycle);
            round->cancel();
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto result = round->next(std::min(deadline, now + kProbePollSlice));
        if (!result) {
            if (round->exhausted()) {
                break;
            }
            continue;
        }
        if (unresolved.erase(result->address) == 0) {
            continue;
        }

        applyProbeResult(cycle, result->address, &result->outcome);
        ++resolved;
        if (resolved >= needed) {
            emitPartial();
        }
    }

    if (!unresolved.empty()) {
        round->cancel();
        if (!isCurrent(cycle)) {
            return;
        }
        spdlog::warn("RefreshOrchestrator: Cycle timeout in generation {}; {} server(s) marked unreachable",
                     cycle, unresolved.size());
        for (const auto &address : unresolved) {
            applyProbeResult(cycle, address, nullptr);
        }
    }

    if (!isCurrent(cycle)) {
        return;
    }
    emitPartial();
    publish(cycle, UpdateEvent::Complete(cycle));
    setState(cycle, RefreshState::Complete);
    spdlog::info("RefreshOrchestrator: Generation {} complete ({} probed, peak {} in flight)",
                 cycle, candidates.size(), round->inFlightPeak());
}

void RefreshOrchestrator::applyProbeResult(Generation cycle,
                                           const ServerAddress &address,
                                           const probe::ProbeOutcome *outcome) {
    auto record = snapshotRecord(cycle, address);
    if (!record) {
        return;
    }

    const Timestamp observedAt = clock.now();
    const bool reachable = outcome && outcome->reachable;
    cache::ProbeDetails details;
    if (reachable) {
        record->pingMs = outcome->pingMs;
        record->playerCount = outcome->playerCount;
        record->lastSeenAt = std::max(record->lastSeenAt, observedAt);
        NormalizeCounts(*record);

        details.name = outcome->name;
        details.map = outcome->map;
        details.perspective = outcome->perspective;
        if (!details.name.empty()) {
            record->name = details.name;
        }
        if (!details.map.empty()) {
            record->map = details.map;
        }
        if (details.perspective != Perspective::Unknown) {
            record->perspective = details.perspective;
        }
    } else {
        record->pingMs.reset();
    }

    if (!isCurrent(cycle)) {
        return;
    }

    withCache([&](cache::CacheStore &store) {
        store.updatePing(address, record->pingMs, record->playerCount, observedAt);
        if (reachable) {
            store.updateDetails(address, details);
        }
    });
    storeSnapshotRecord(cycle, *record);
    publish(cycle, UpdateEvent::ServerUpdated(cycle, *record));
}

void RefreshOrchestrator::failCycle(Generation cycle, ErrorKind kind, const std::string &message) {
    if (!isCurrent(cycle)) {
        return;
    }
    setState(cycle, RefreshState::Failed);
    spdlog::warn("RefreshOrchestrator: Generation {} failed ({}): {}", cycle, ErrorKindName(kind), message);

    std::vector<ServerRecord> fallback;
    try {
        fallback = withCache([&](cache::CacheStore &store) {
            return store.getTopServers(options.fallbackLimit, cache::SortKey::Players);
        });
    } catch (const cache::CacheError &ex) {
        spdlog::error("RefreshOrchestrator: Fallback read failed: {}", ex.what());
    }

    replaceSnapshot(cycle, fallback);
    if (!fallback.empty()) {
        spdlog::info("RefreshOrchestrator: Serving {} cached server(s) as fallback", fallback.size());
    }
    for (auto &record : fallback) {
        publish(cycle, UpdateEvent::ServerUpdated(cycle, std::move(record)));
    }
    publish(cycle, UpdateEvent::Failed(cycle, kind, message));
}

void RefreshOrchestrator::startCooldown(std::chrono::seconds wait) {
    wait = std::clamp(wait, std::chrono::seconds(0), catalog::kMaxRetryAfter);
    std::lock_guard<std::mutex> lock(timingMutex);
    const Timestamp until = clock.now() + wait;
    if (!cooldownUntil || *cooldownUntil < until) {
        cooldownUntil = until;
    }
}

void RefreshOrchestrator::runMaintenance() {
    const Timestamp now = clock.now();
    {
        std::lock_guard<std::mutex> lock(timingMutex);
        if (lastMaintenance && now - *lastMaintenance < options.pruneInterval) {
            return;
        }
        lastMaintenance = now;
    }

    try {
        const auto pruned = withCache([&](cache::CacheStore &store) { return store.pruneStale(now, options.staleAge); });
        const auto purged = withCache([&](cache::CacheStore &store) { return store.purgeExpired(now, options.purgeAge); });
        spdlog::debug("RefreshOrchestrator: Maintenance pruned {} and purged {} server(s)", pruned, purged);
    } catch (const cache::CacheError &ex) {
        spdlog::warn("RefreshOrchestrator: Cache maintenance failed: {}", ex.what());
    }
}

bool RefreshOrchestrator::isCurrent(Generation cycle) const {
    return !stopping.load() && generation.load() == cycle;
}

void RefreshOrchestrator::setState(Generation cycle, RefreshState next) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        auto it = states.find(cycle);
        if (it == states.end() || IsTerminal(it->second)) {
            return;
        }
        spdlog::debug("RefreshOrchestrator: Generation {} {} -> {}",
                      cycle, RefreshStateName(it->second), RefreshStateName(next));
        it->second = next;
    }
    stateCv.notify_all();
}

void RefreshOrchestrator::publish(Generation cycle, UpdateEvent event) {
    if (!isCurrent(cycle)) {
        return;
    }
    stream.publish(std::move(event));
}

void RefreshOrchestrator::replaceSnapshot(Generation cycle, const std::vector<ServerRecord> &records) {
    std::lock_guard<std::mutex> lock(snapshotMutex);
    if (!isCurrent(cycle)) {
        return;
    }
    snapshotGeneration = cycle;
    snapshot.clear();
    for (const auto &record : records) {
        snapshot[record.address] = record;
    }
}

std::optional<ServerRecord> RefreshOrchestrator::snapshotRecord(Generation cycle, const ServerAddress &address) const {
    std::lock_guard<std::mutex> lock(snapshotMutex);
    if (snapshotGeneration != cycle) {
        return std::nullopt;
    }
    auto it = snapshot.find(address);
    if (it == snapshot.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RefreshOrchestrator::storeSnapshotRecord(Generation cycle, const ServerRecord &record) {
    std::lock_guard<std::mutex> lock(snapshotMutex);
    if (snapshotGeneration != cycle) {
        return;
    }
    snapshot[record.address] = record;
}

std::shared_ptr<cache::CacheStore> RefreshOrchestrator::activeCache() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return cacheStore;
}

void RefreshOrchestrator::degradeCache(const std::shared_ptr<cache::CacheStore> &failed,
                                       const cache::CacheError &error) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    if (cacheStore != failed) {
        return;
    }
    spdlog::warn("RefreshOrchestrator: {} cache failed ({}); continuing with in-memory cache",
                 failed->backendName(), error.what());
    cacheStore = std::make_shared<cache::MemoryCacheStore>();
    degraded.store(true);
}

void RefreshOrchestrator::forgetFinishedStatesLocked(Generation current) {
    for (auto it = states.begin(); it != states.end();) {
        if (it->first < current && IsTerminal(it->second)) {
            it = states.erase(it);
        } else {
            ++it;
        }
    }
}

void RefreshOrchestrator::reapFinishedCyclesLocked() {
    for (auto it = cycles.begin(); it != cycles.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = cycles.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace scout
