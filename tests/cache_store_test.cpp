#include <catch2/catch.hpp>

#include <thread>

#include "cache/backends/memory/cache_store.hpp"
#include "cache/backends/sqlite/cache_store.hpp"
#include "cache/cache_store_factory.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using scout::FilterCriteria;
using scout::ServerAddress;
using scout::SourceKind;
using scout::Timestamp;
using scout::cache::CacheStore;
using scout::cache::SortKey;
using scout::test::MakeRecord;

namespace {

const Timestamp kBase = scout::time::FromUnixMillis(1700000000000);

struct MemoryBackend {
    MemoryBackend() : store(std::make_unique<scout::cache::MemoryCacheStore>()) {}
    std::unique_ptr<CacheStore> store;
};

struct SqliteBackend {
    SqliteBackend() : store(std::make_unique<scout::cache::SqliteCacheStore>(database.path)) {}
    scout::test::TempDatabase database;
    std::unique_ptr<CacheStore> store;
};

} // namespace

TEMPLATE_TEST_CASE("Upserting the same batch twice is idempotent", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    const std::vector<scout::ServerRecord> batch = {
        MakeRecord("10.0.0.1", 2302, "Alpha"),
        MakeRecord("10.0.0.2", 2302, "Bravo"),
    };
    store.upsertBatch(batch);
    store.upsertBatch(batch);

    auto all = store.getAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].name == "Alpha");
    CHECK(all[1].name == "Bravo");
    CHECK(store.stats().total == 2);
}

TEMPLATE_TEST_CASE("Merges keep the latest sighting and a known ping", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;
    const ServerAddress address{"10.0.0.1", 2302};

    store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha", 10, 60, kBase + 10min)});
    store.updatePing(address, 35, 12, kBase + 10min);

    auto older = MakeRecord("10.0.0.1", 2302, "Alpha renamed", 20, 60, kBase);
    store.upsertBatch({older});

    auto entry = store.getEntry(address, kBase + 10min, 15min);
    REQUIRE(entry.has_value());
    CHECK(entry->record.name == "Alpha renamed");
    CHECK(entry->record.playerCount == 20);
    CHECK(entry->record.lastSeenAt == kBase + 10min);
    REQUIRE(entry->record.pingMs.has_value());
    CHECK(*entry->record.pingMs == 35);
}

TEMPLATE_TEST_CASE("Ping write-back clamps counts and clears unknown pings", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;
    const ServerAddress address{"10.0.0.1", 2302};

    store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha", 10, 60, kBase)});

    SECTION("known ping") {
        store.updatePing(address, 48, 75, kBase + 5min);
        auto entry = store.getEntry(address, kBase + 5min, 15min);
        REQUIRE(entry.has_value());
        REQUIRE(entry->record.pingMs.has_value());
        CHECK(*entry->record.pingMs == 48);
        CHECK(entry->record.playerCount == 60);
        CHECK(entry->record.lastSeenAt == kBase + 5min);
    }

    SECTION("unknown ping") {
        store.updatePing(address, 48, 12, kBase + 1min);
        store.updatePing(address, std::nullopt, 0, kBase + 2min);
        auto entry = store.getEntry(address, kBase + 2min, 15min);
        REQUIRE(entry.has_value());
        CHECK_FALSE(entry->record.pingMs.has_value());
        CHECK(entry->record.playerCount == 12);
        CHECK(entry->record.lastSeenAt == kBase + 1min);
    }

    SECTION("unknown server") {
        store.updatePing(ServerAddress{"10.9.9.9", 2302}, 20, 1, kBase);
        CHECK(store.getAll().size() == 1);
    }
}

TEMPLATE_TEST_CASE("Probe details overwrite only what was reported", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;
    const ServerAddress address{"10.0.0.1", 2302};

    store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha", 10, 60, kBase)});

    scout::cache::ProbeDetails details;
    details.map = "sakhal";
    details.perspective = scout::Perspective::Both;
    store.updateDetails(address, details);
    store.updateDetails(ServerAddress{"10.9.9.9", 2302}, details);

    auto entry = store.getEntry(address, kBase, 15min);
    REQUIRE(entry.has_value());
    CHECK(entry->record.name == "Alpha");
    CHECK(entry->record.map == "sakhal");
    CHECK(entry->record.perspective == scout::Perspective::Both);
    CHECK(store.getAll().size() == 1);

    // A catalog merge knows nothing about perspective and must not erase it.
    store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha", 12, 60, kBase + 1min)});
    entry = store.getEntry(address, kBase + 1min, 15min);
    REQUIRE(entry.has_value());
    CHECK(entry->record.perspective == scout::Perspective::Both);
    CHECK(entry->record.map == "Chernarus");
}

TEMPLATE_TEST_CASE("Listings order by ping with unknown pings last", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    store.upsertBatch({
        MakeRecord("10.0.0.1", 2302, "Charlie", 30),
        MakeRecord("10.0.0.2", 2302, "Alpha", 5),
        MakeRecord("10.0.0.3", 2302, "Bravo", 50),
    });
    store.updatePing(ServerAddress{"10.0.0.1", 2302}, 80, 30, kBase);
    store.updatePing(ServerAddress{"10.0.0.3", 2302}, 20, 50, kBase);

    auto all = store.getAll();
    REQUIRE(all.size() == 3);
    CHECK(all[0].name == "Bravo");
    CHECK(all[1].name == "Charlie");
    CHECK(all[2].name == "Alpha");

    auto byPlayers = store.getTopServers(2, SortKey::Players);
    REQUIRE(byPlayers.size() == 2);
    CHECK(byPlayers[0].name == "Bravo");
    CHECK(byPlayers[1].name == "Charlie");

    auto byName = store.getTopServers(10, SortKey::Name);
    REQUIRE(byName.size() == 3);
    CHECK(byName[0].name == "Alpha");
}

TEMPLATE_TEST_CASE("Filters narrow cached listings", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    auto official = MakeRecord("10.0.0.1", 2302, "DE 0123 Official");
    official.sourceKind = SourceKind::Official;
    auto modded = MakeRecord("10.0.0.2", 2302, "Deer Isle PvE");
    modded.modsPresent = true;
    modded.country = "fr";
    auto american = MakeRecord("10.0.0.3", 2302, "Texas Survival");
    american.country = "US";
    store.upsertBatch({official, modded, american});

    FilterCriteria europe;
    europe.region = scout::Region::Europe;
    CHECK(store.getAll(europe).size() == 2);

    FilterCriteria officialOnly;
    officialOnly.serverType = SourceKind::Official;
    auto officials = store.getAll(officialOnly);
    REQUIRE(officials.size() == 1);
    CHECK(officials[0].address.host == "10.0.0.1");

    FilterCriteria withMods;
    withMods.mods = true;
    auto moddedOnly = store.getAll(withMods);
    REQUIRE(moddedOnly.size() == 1);
    CHECK(moddedOnly[0].name == "Deer Isle PvE");

    FilterCriteria search;
    search.search = "  texas ";
    auto found = store.getAll(search);
    REQUIRE(found.size() == 1);
    CHECK(found[0].country == "US");
}

TEMPLATE_TEST_CASE("Pruned rows leave listings but remain as fallback", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    store.upsertBatch({
        MakeRecord("10.0.0.1", 2302, "Old", 10, 60, kBase),
        MakeRecord("10.0.0.2", 2302, "Fresh", 10, 60, kBase + 3h),
    });

    CHECK(store.pruneStale(kBase + 3h, std::chrono::hours(2)) == 1);
    CHECK(store.pruneStale(kBase + 3h, std::chrono::hours(2)) == 0);

    auto listing = store.getAll();
    REQUIRE(listing.size() == 1);
    CHECK(listing[0].name == "Fresh");
    CHECK(store.getTopServers(10, SortKey::Name).size() == 2);

    auto stats = store.stats();
    CHECK(stats.total == 2);
    CHECK(stats.active == 1);

    SECTION("a fresh sighting reactivates the row") {
        store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Old", 10, 60, kBase + 3h)});
        CHECK(store.getAll().size() == 2);
    }

    SECTION("purging deletes the row") {
        CHECK(store.purgeExpired(kBase + 25h, std::chrono::hours(24)) == 1);
        CHECK(store.getTopServers(10, SortKey::Name).size() == 1);
        CHECK_FALSE(store.getEntry(ServerAddress{"10.0.0.1", 2302}, kBase + 25h, 15min).has_value());
    }
}

TEMPLATE_TEST_CASE("Entries report staleness against the ttl", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;
    const ServerAddress address{"10.0.0.1", 2302};

    store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha", 10, 60, kBase)});

    auto fresh = store.getEntry(address, kBase + 10min, 15min);
    REQUIRE(fresh.has_value());
    CHECK_FALSE(fresh->isStale);
    CHECK(fresh->fetchedAt == kBase);

    auto stale = store.getEntry(address, kBase + 16min, 15min);
    REQUIRE(stale.has_value());
    CHECK(stale->isStale);

    CHECK_FALSE(store.getEntry(ServerAddress{"10.0.0.9", 2302}, kBase, 15min).has_value());
}

TEMPLATE_TEST_CASE("Fetch log tracks the last fetch per criteria", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    CHECK_FALSE(store.lastFetch("countries=DE").has_value());
    store.recordFetch("countries=DE", kBase);
    store.recordFetch("countries=DE", kBase + 1min);
    store.recordFetch("countries=US", kBase + 2min);

    REQUIRE(store.lastFetch("countries=DE").has_value());
    CHECK(*store.lastFetch("countries=DE") == kBase + 1min);
    CHECK(*store.lastFetch("countries=US") == kBase + 2min);
}

TEMPLATE_TEST_CASE("Ping write-backs interleave with batch merges", "[cache]", MemoryBackend, SqliteBackend) {
    TestType backend;
    CacheStore &store = *backend.store;

    std::vector<scout::ServerRecord> batch;
    for (int i = 0; i < 40; ++i) {
        batch.push_back(MakeRecord("10.0.1." + std::to_string(i), 2302, "Server " + std::to_string(i)));
    }
    store.upsertBatch(batch);

    std::thread writer([&] {
        for (int round = 0; round < 10; ++round) {
            store.upsertBatch(batch);
        }
    });
    std::thread prober([&] {
        for (int round = 0; round < 10; ++round) {
            for (const auto &record : batch) {
                store.updatePing(record.address, 30 + round, 10, kBase + std::chrono::minutes(round));
            }
        }
    });
    writer.join();
    prober.join();

    auto all = store.getAll();
    REQUIRE(all.size() == batch.size());
    for (const auto &record : all) {
        REQUIRE(record.pingMs.has_value());
        CHECK(*record.pingMs == 39);
    }
}

TEST_CASE("Closed memory stores refuse further operations", "[cache]") {
    scout::cache::MemoryCacheStore store;
    store.close();
    CHECK_THROWS_AS(store.getAll(), scout::cache::CacheError);
    CHECK_THROWS_AS(store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha")}), scout::cache::CacheError);
}

TEST_CASE("SQLite rows survive reopening the file", "[cache][sqlite]") {
    scout::test::TempDatabase database;
    {
        scout::cache::SqliteCacheStore store(database.path);
        store.upsertBatch({MakeRecord("10.0.0.1", 2302, "Alpha")});
        store.recordFetch("countries=DE", kBase);
        store.close();
    }

    scout::cache::SqliteCacheStore reopened(database.path);
    auto all = reopened.getAll();
    REQUIRE(all.size() == 1);
    CHECK(all[0].name == "Alpha");
    CHECK(all[0].map == "Chernarus");
    CHECK(reopened.lastFetch("countries=DE").has_value());
}

TEST_CASE("Unopenable persistent stores degrade to memory", "[cache]") {
    bool degraded = false;
    auto store = scout::cache::CreateCacheStore(scout::cache::CacheBackend::Sqlite,
                                                "/proc/serverscout/does-not-exist/servers.db",
                                                &degraded);
    REQUIRE(store);
    CHECK(degraded);
    CHECK(std::string(store->backendName()) == "memory");

    store = scout::cache::CreateCacheStore(scout::cache::CacheBackend::Memory, {}, &degraded);
    CHECK_FALSE(degraded);
}
