#include <catch2/catch.hpp>

#include <algorithm>
#include <future>

#include "cache/backends/memory/cache_store.hpp"
#include "refresh/refresh_orchestrator.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using scout::ErrorKind;
using scout::FilterCriteria;
using scout::Generation;
using scout::RefreshOrchestrator;
using scout::RefreshOptions;
using scout::RefreshState;
using scout::ServerAddress;
using scout::ServerRecord;
using scout::UpdateEvent;
using scout::UpdateEventType;
using scout::UpdateStream;
using scout::test::FakeCatalogSource;
using scout::test::MakeRecord;
using scout::test::ManualClock;
using scout::test::ScriptedProbe;
using scout::test::ScriptedProbeTransport;

namespace {

RefreshOptions fastOptions() {
    RefreshOptions options;
    options.probeTimeout = 200ms;
    options.concurrencyLimit = 16;
    options.cycleTimeout = 5s;
    options.readinessThreshold = 0.6;
    return options;
}

std::vector<ServerRecord> makeRecords(int count) {
    std::vector<ServerRecord> records;
    for (int i = 0; i < count; ++i) {
        records.push_back(MakeRecord("10.1.0." + std::to_string(i), 2302, "Server " + std::to_string(i)));
    }
    return records;
}

struct Harness {
    explicit Harness(RefreshOptions options = fastOptions(),
                     std::unique_ptr<scout::cache::CacheStore> cache = std::make_unique<scout::cache::MemoryCacheStore>())
        : prober(probes),
          orchestrator(options, catalog, std::move(cache), prober, stream, clock) {}

    Generation run(const FilterCriteria &criteria = {}, bool force = false) {
        auto generation = orchestrator.requestRefresh(criteria, force);
        REQUIRE(generation.has_value());
        REQUIRE(orchestrator.waitForCycle(*generation, 10s));
        return *generation;
    }

    ManualClock clock;
    FakeCatalogSource catalog;
    ScriptedProbeTransport probes;
    scout::probe::LivenessProber prober;
    UpdateStream stream;
    RefreshOrchestrator orchestrator;
};

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

std::size_t countType(const std::vector<UpdateEvent> &events, UpdateEventType type) {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
                                                  [&](const UpdateEvent &event) { return event.type == type; }));
}

} // namespace

TEST_CASE("A refresh streams probe results then readiness then completion", "[refresh]") {
    Harness harness;
    auto records = makeRecords(10);
    for (auto &record : records) {
        record.name = "Official " + record.name;
    }
    harness.catalog.setRecords(records);
    for (int i = 0; i < 10; ++i) {
        const bool answers = i < 6;
        harness.probes.script(records[i].probeEndpoint(),
                              answers ? ScriptedProbe{10ms, true, 20 + i, 8} : ScriptedProbe{1000ms, false, 0, 0});
    }

    FilterCriteria criteria;
    criteria.search = "official";
    const Generation generation = harness.run(criteria);
    CHECK(harness.orchestrator.state() == RefreshState::Complete);
    CHECK(harness.orchestrator.cachedTopServers(50, scout::cache::SortKey::Name).size() == 10);

    const auto events = harness.stream.consume();
    REQUIRE(events.size() == 12);
    CHECK(countType(events, UpdateEventType::PartialReady) == 1);
    CHECK(countType(events, UpdateEventType::Complete) == 1);

    for (std::size_t i = 0; i < 6; ++i) {
        REQUIRE(events[i].type == UpdateEventType::ServerUpdated);
        CHECK(events[i].record->pingMs.has_value());
        CHECK(events[i].record->playerCount == 8);
    }
    CHECK(events[6].type == UpdateEventType::PartialReady);
    for (std::size_t i = 7; i < 11; ++i) {
        REQUIRE(events[i].type == UpdateEventType::ServerUpdated);
        CHECK_FALSE(events[i].record->pingMs.has_value());
    }
    CHECK(events[11].type == UpdateEventType::Complete);
    for (const auto &event : events) {
        CHECK(event.generation == generation);
    }

    const auto current = harness.orchestrator.currentServers();
    REQUIRE(current.size() == 10);
    CHECK(current.front().pingMs.has_value());
    CHECK_FALSE(current.back().pingMs.has_value());
}

TEST_CASE("A fresh cache serves repeat requests without the catalog", "[refresh]") {
    Harness harness;
    harness.catalog.setRecords(makeRecords(3));

    harness.run();
    CHECK(harness.catalog.callCount() == 1);
    harness.stream.consume();

    harness.clock.advance(5min);
    harness.run();
    CHECK(harness.catalog.callCount() == 1);
    const auto warm = harness.stream.consume();
    CHECK(countType(warm, UpdateEventType::ServerUpdated) == 3);
    CHECK(countType(warm, UpdateEventType::Complete) == 1);

    SECTION("forcing bypasses the cache") {
        harness.run(FilterCriteria{}, true);
        CHECK(harness.catalog.callCount() == 2);
    }

    SECTION("an expired ttl fetches again") {
        harness.clock.advance(16min);
        harness.run();
        CHECK(harness.catalog.callCount() == 2);
    }

    SECTION("different criteria fetch again") {
        FilterCriteria europe;
        europe.region = scout::Region::Europe;
        harness.run(europe);
        CHECK(harness.catalog.callCount() == 2);
    }
}

TEST_CASE("A newer request silences the older generation", "[refresh]") {
    Harness harness;
    const auto records = makeRecords(4);
    harness.catalog.setRecords(records);
    for (const auto &record : records) {
        harness.probes.script(record.probeEndpoint(), ScriptedProbe{300ms, true, 30, 2});
    }

    auto first = harness.orchestrator.requestRefresh(FilterCriteria{});
    REQUIRE(first);
    std::this_thread::sleep_for(50ms);

    for (const auto &record : records) {
        harness.probes.script(record.probeEndpoint(), ScriptedProbe{5ms, true, 30, 2});
    }
    const Generation second = harness.run(FilterCriteria{}, true);
    REQUIRE(second > *first);

    CHECK(harness.orchestrator.stateOf(*first) == RefreshState::Superseded);
    CHECK(harness.orchestrator.stateOf(second) == RefreshState::Complete);

    // Give the old cycle time to finish its in-flight probes.
    std::this_thread::sleep_for(400ms);
    const auto events = harness.stream.consume();
    REQUIRE_FALSE(events.empty());
    for (const auto &event : events) {
        CHECK(event.generation == second);
    }
    CHECK(countType(events, UpdateEventType::Complete) == 1);
}

TEST_CASE("Rate limiting falls back to cached servers and starts a cooldown", "[refresh]") {
    auto cache = std::make_unique<scout::cache::MemoryCacheStore>();
    cache->upsertBatch(makeRecords(3));
    Harness harness(fastOptions(), std::move(cache));
    harness.catalog.setFailure(ErrorKind::RateLimit, "catalog returned HTTP 429", 120s);

    harness.run();
    CHECK(harness.orchestrator.state() == RefreshState::Failed);
    CHECK(harness.orchestrator.cooldownRemaining() == 120s);

    auto events = harness.stream.consume();
    REQUIRE(events.size() == 4);
    CHECK(countType(events, UpdateEventType::ServerUpdated) == 3);
    REQUIRE(events.back().type == UpdateEventType::Failed);
    CHECK(*events.back().failure == ErrorKind::RateLimit);
    CHECK(harness.orchestrator.currentServers().size() == 3);

    // Still cooling down: no catalog traffic.
    harness.clock.advance(60s);
    harness.run(FilterCriteria{}, true);
    CHECK(harness.catalog.callCount() == 1);
    events = harness.stream.consume();
    REQUIRE_FALSE(events.empty());
    CHECK(*events.back().failure == ErrorKind::RateLimit);

    harness.clock.advance(61s);
    CHECK(harness.orchestrator.cooldownRemaining() == 0s);
    harness.catalog.setRecords(makeRecords(2));
    harness.run(FilterCriteria{}, true);
    CHECK(harness.catalog.callCount() == 2);
    CHECK(harness.orchestrator.state() == RefreshState::Complete);
}

TEST_CASE("A rate limit without retry-after uses the configured cooldown", "[refresh]") {
    RefreshOptions options = fastOptions();
    options.rateLimitCooldown = 45s;
    Harness harness(options);
    harness.catalog.setFailure(ErrorKind::RateLimit, "catalog returned HTTP 429");

    harness.run();
    CHECK(harness.orchestrator.cooldownRemaining() == 45s);
}

TEST_CASE("Network failures fail the cycle with an empty fallback", "[refresh]") {
    Harness harness;
    harness.catalog.setFailure(ErrorKind::Network, "Couldn't resolve host name");

    harness.run();
    const auto events = harness.stream.consume();
    REQUIRE(events.size() == 1);
    CHECK(events[0].type == UpdateEventType::Failed);
    CHECK(*events[0].failure == ErrorKind::Network);
    CHECK(events[0].message == "Couldn't resolve host name");
    CHECK(harness.orchestrator.cooldownRemaining() == 0s);
}

TEST_CASE("A broken cache degrades to memory and the cycle still completes", "[refresh]") {
    Harness harness(fastOptions(), std::make_unique<scout::test::BrokenCacheStore>());
    harness.catalog.setRecords(makeRecords(2));

    harness.run();
    CHECK(harness.orchestrator.isDegraded());
    CHECK(harness.orchestrator.state() == RefreshState::Complete);
    CHECK(harness.orchestrator.cachedTopServers(10, scout::cache::SortKey::Players).size() == 2);
}

TEST_CASE("Malformed criteria are rejected before a cycle starts", "[refresh]") {
    Harness harness;

    FilterCriteria criteria;
    SECTION("search too long") {
        criteria.search = std::string(200, 'x');
    }
    SECTION("countries outside the region") {
        criteria.region = scout::Region::Oceania;
        criteria.countries = std::vector<std::string>{"DE"};
    }

    scout::Error error;
    const Generation before = harness.orchestrator.currentGeneration();
    CHECK_FALSE(harness.orchestrator.requestRefresh(criteria, false, &error).has_value());
    CHECK(error.kind == ErrorKind::Config);
    CHECK_FALSE(error.message.empty());
    CHECK(harness.orchestrator.currentGeneration() == before);
    CHECK(harness.catalog.callCount() == 0);
}

TEST_CASE("An empty catalog completes immediately", "[refresh]") {
    Harness harness;
    harness.catalog.setRecords({});

    harness.run();
    const auto events = harness.stream.consume();
    REQUIRE(events.size() == 2);
    CHECK(events[0].type == UpdateEventType::PartialReady);
    CHECK(events[1].type == UpdateEventType::Complete);
    CHECK(harness.probes.callCount() == 0);
}

TEST_CASE("The cycle timeout marks unanswered servers unreachable", "[refresh]") {
    RefreshOptions options = fastOptions();
    options.cycleTimeout = 1s;
    Harness harness(options);
    const auto records = makeRecords(2);
    harness.catalog.setRecords(records);
    harness.probes.script(records[0].probeEndpoint(), ScriptedProbe{5ms, true, 25, 3});
    harness.probes.script(records[1].probeEndpoint(), ScriptedProbe{2500ms, true, 25, 3});

    const auto started = std::chrono::steady_clock::now();
    auto generation = harness.orchestrator.requestRefresh(FilterCriteria{});
    REQUIRE(generation);
    REQUIRE(harness.orchestrator.waitForCycle(*generation, 10s));
    CHECK(std::chrono::steady_clock::now() - started < 2000ms);

    const auto events = harness.stream.consume();
    REQUIRE(events.size() == 4);
    CHECK(events[0].record->pingMs == 25);
    CHECK(events[1].record->address == records[1].address);
    CHECK_FALSE(events[1].record->pingMs.has_value());
    CHECK(events[2].type == UpdateEventType::PartialReady);
    CHECK(events[3].type == UpdateEventType::Complete);
}

TEST_CASE("Probe results are written back to the cache", "[refresh]") {
    Harness harness;
    const auto records = makeRecords(2);
    harness.catalog.setRecords(records);
    harness.probes.script(records[0].probeEndpoint(), ScriptedProbe{0ms, true, 33, 70});

    harness.run();
    const auto top = harness.orchestrator.cachedTopServers(10, scout::cache::SortKey::Ping);
    REQUIRE(top.size() == 2);
    CHECK(top[0].address == records[0].address);
    CHECK(top[0].pingMs == 33);
    CHECK(top[0].playerCount == 60);
    CHECK(top[1].address == records[1].address);
    CHECK(top[1].pingMs == 40);
}

TEST_CASE("Requests after shutdown are refused", "[refresh]") {
    Harness harness;
    harness.orchestrator.shutdown();

    scout::Error error;
    CHECK_FALSE(harness.orchestrator.requestRefresh(FilterCriteria{}, false, &error).has_value());
    CHECK(error.kind == ErrorKind::Config);
}

TEST_CASE("Only fetched servers matching the criteria are probed", "[refresh]") {
    Harness harness;
    auto records = makeRecords(4);
    records[0].name = "Official Chernarus";
    records[2].name = "official Livonia";
    harness.catalog.setRecords(records);

    FilterCriteria criteria;
    criteria.search = "Official";
    harness.run(criteria);
    CHECK(harness.probes.callCount() == 2);
    CHECK(harness.orchestrator.cachedTopServers(10, scout::cache::SortKey::Name).size() == 4);

    const auto cold = harness.orchestrator.currentServers();
    REQUIRE(cold.size() == 2);
    CHECK(countType(harness.stream.consume(), UpdateEventType::ServerUpdated) == 2);

    harness.clock.advance(1min);
    harness.run(criteria);
    CHECK(harness.catalog.callCount() == 1);
    CHECK(countType(harness.stream.consume(), UpdateEventType::ServerUpdated) == 2);

    const auto warm = harness.orchestrator.currentServers();
    REQUIRE(warm.size() == cold.size());
    for (std::size_t i = 0; i < warm.size(); ++i) {
        CHECK(warm[i].address == cold[i].address);
    }
}

TEST_CASE("A rate limit hit by a superseded cycle still starts the cooldown", "[refresh]") {
    Harness harness;
    harness.catalog.setRecords(makeRecords(3));
    harness.run();
    harness.stream.consume();

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    harness.catalog.setFailure(ErrorKind::RateLimit, "catalog returned HTTP 429", 120s);
    harness.catalog.setHook([released]() { released.wait(); });

    auto throttled = harness.orchestrator.requestRefresh(FilterCriteria{}, true);
    REQUIRE(throttled);
    REQUIRE(eventually([&]() { return harness.catalog.callCount() == 2; }));

    // A warm request takes over while the catalog call is still outstanding.
    const Generation warm = harness.run();
    CHECK(harness.orchestrator.stateOf(warm) == RefreshState::Complete);
    CHECK(harness.orchestrator.stateOf(*throttled) == RefreshState::Superseded);

    release.set_value();
    REQUIRE(eventually([&]() { return harness.orchestrator.cooldownRemaining() > 0s; }));
    CHECK(harness.orchestrator.cooldownRemaining() == 120s);

    harness.stream.consume();
    harness.run(FilterCriteria{}, true);
    CHECK(harness.catalog.callCount() == 2);
    const auto events = harness.stream.consume();
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.back().type == UpdateEventType::Failed);
    CHECK(*events.back().failure == ErrorKind::RateLimit);
}

TEST_CASE("An absurd retry-after is capped at a day", "[refresh]") {
    Harness harness;
    harness.catalog.setFailure(ErrorKind::RateLimit, "catalog returned HTTP 429",
                               std::chrono::seconds(10'000'000'000'000));

    harness.run();
    CHECK(harness.orchestrator.cooldownRemaining() == std::chrono::hours(24));
}

TEST_CASE("Finished generations are forgotten once newer ones exist", "[refresh]") {
    Harness harness;
    harness.catalog.setRecords(makeRecords(1));

    std::vector<Generation> generations;
    for (int i = 0; i < 5; ++i) {
        generations.push_back(harness.run());
    }

    CHECK_FALSE(harness.orchestrator.stateOf(generations[0]).has_value());
    CHECK_FALSE(harness.orchestrator.stateOf(generations[2]).has_value());
    CHECK(harness.orchestrator.stateOf(generations[3]) == RefreshState::Complete);
    CHECK(harness.orchestrator.stateOf(generations[4]) == RefreshState::Complete);
    CHECK(harness.orchestrator.waitForCycle(generations[0], 0ms));
}

TEST_CASE("Probe replies update name, map and perspective", "[refresh]") {
    Harness harness;
    const auto records = makeRecords(1);
    harness.catalog.setRecords(records);

    ScriptedProbe probe{0ms, true, 28, 9};
    probe.name = "DayZ DE 0451 1PP";
    probe.map = "enoch";
    probe.perspective = scout::Perspective::FirstPerson;
    harness.probes.script(records[0].probeEndpoint(), probe);

    harness.run();
    const auto events = harness.stream.consume();
    REQUIRE(events.front().type == UpdateEventType::ServerUpdated);
    CHECK(events.front().record->perspective == scout::Perspective::FirstPerson);
    CHECK(events.front().record->map == "enoch");

    const auto top = harness.orchestrator.cachedTopServers(1, scout::cache::SortKey::Ping);
    REQUIRE(top.size() == 1);
    CHECK(top[0].name == "DayZ DE 0451 1PP");
    CHECK(top[0].map == "enoch");
    CHECK(top[0].perspective == scout::Perspective::FirstPerson);
}

TEST_CASE("Maintenance after a cycle prunes servers not seen recently", "[refresh]") {
    auto cache = std::make_unique<scout::cache::MemoryCacheStore>();
    auto *store = cache.get();
    Harness harness(fastOptions(), std::move(cache));

    const auto records = makeRecords(2);
    harness.catalog.setRecords(records);
    harness.run();
    REQUIRE(eventually([&]() { return store->getAll().size() == 2; }));

    // Only the second server is still listed three hours later.
    harness.clock.advance(3h);
    auto survivor = records[1];
    survivor.lastSeenAt = harness.clock.now();
    survivor.fetchedAt = harness.clock.now();
    harness.catalog.setRecords({survivor});
    harness.run(FilterCriteria{}, true);

    REQUIRE(eventually([&]() { return store->getAll().size() == 1; }));
    CHECK(store->getAll().front().address == records[1].address);

    const auto top = harness.orchestrator.cachedTopServers(10, scout::cache::SortKey::Name);
    CHECK(top.size() == 2);
    const auto entry = store->getEntry(records[0].address, harness.clock.now(), std::chrono::minutes(15));
    REQUIRE(entry);
    CHECK_FALSE(entry->active);
}

TEST_CASE("Shutdown racing new requests leaves no cycle thread behind", "[refresh]") {
    for (int attempt = 0; attempt < 20; ++attempt) {
        Harness harness;
        harness.catalog.setRecords(makeRecords(2));

        std::thread requester([&]() {
            while (harness.orchestrator.requestRefresh(FilterCriteria{}, true)) {
                std::this_thread::yield();
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(attempt % 4));
        harness.orchestrator.shutdown();
        requester.join();

        CHECK_FALSE(harness.orchestrator.requestRefresh(FilterCriteria{}).has_value());
    }
}
