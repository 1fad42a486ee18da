#include "cache/backends/sqlite/cache_store.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

using scout::cache::sqlite::Statement;

constexpr const char *kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS servers(
    host TEXT NOT NULL,
    port INTEGER NOT NULL,
    query_port INTEGER NOT NULL,
    name TEXT NOT NULL,
    map TEXT NOT NULL,
    country TEXT NOT NULL,
    source_kind TEXT NOT NULL,
    mods_present INTEGER NOT NULL,
    perspective TEXT NOT NULL DEFAULT 'Unknown',
    player_count INTEGER NOT NULL,
    max_players INTEGER NOT NULL,
    ping_ms INTEGER NULL,
    last_seen_ms INTEGER NOT NULL,
    fetched_at_ms INTEGER NOT NULL,
    active INTEGER NOT NULL DEFAULT 1,
    PRIMARY KEY(host, port)
);
CREATE INDEX IF NOT EXISTS idx_servers_player_count ON servers(player_count);
CREATE INDEX IF NOT EXISTS idx_servers_ping_ms ON servers(ping_ms);
CREATE INDEX IF NOT EXISTS idx_servers_last_seen_ms ON servers(last_seen_ms);
CREATE INDEX IF NOT EXISTS idx_servers_name ON servers(name);
CREATE INDEX IF NOT EXISTS idx_servers_active ON servers(active);
CREATE TABLE IF NOT EXISTS fetch_log(
    criteria_key TEXT PRIMARY KEY,
    fetched_at_ms INTEGER NOT NULL
);
)SQL";

constexpr const char *kSelectColumns =
    "SELECT host, port, query_port, name, map, country, source_kind, mods_present, "
    "player_count, max_players, ping_ms, last_seen_ms, fetched_at_ms, active, perspective FROM servers";

constexpr const char *kUpsertSql =
    "INSERT INTO servers(host, port, query_port, name, map, country, source_kind, mods_present, "
    "player_count, max_players, ping_ms, last_seen_ms, fetched_at_ms, perspective, active) "
    "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1) "
    "ON CONFLICT(host, port) DO UPDATE SET "
    "query_port = excluded.query_port, name = excluded.name, map = excluded.map, "
    "country = excluded.country, source_kind = excluded.source_kind, "
    "mods_present = excluded.mods_present, player_count = excluded.player_count, "
    "max_players = excluded.max_players, ping_ms = COALESCE(excluded.ping_ms, servers.ping_ms), "
    "last_seen_ms = MAX(servers.last_seen_ms, excluded.last_seen_ms), "
    "fetched_at_ms = excluded.fetched_at_ms, "
    "perspective = CASE excluded.perspective WHEN 'Unknown' THEN servers.perspective "
    "ELSE excluded.perspective END, active = 1;";

scout::ServerRecord readRecord(const Statement &st, bool *activeOut = nullptr) {
    scout::ServerRecord record;
    record.address.host = st.ColText(0);
    record.address.port = static_cast<uint16_t>(st.ColInt(1));
    record.queryPort = static_cast<uint16_t>(st.ColInt(2));
    record.name = st.ColText(3);
    record.map = st.ColText(4);
    record.country = st.ColText(5);
    record.sourceKind = scout::ParseSourceKind(st.ColText(6)).value_or(scout::SourceKind::Community);
    record.modsPresent = st.ColInt(7) != 0;
    record.playerCount = st.ColInt(8);
    record.maxPlayers = st.ColInt(9);
    record.pingMs = st.ColOptionalInt(10);
    record.lastSeenAt = scout::time::FromUnixMillis(st.ColInt64(11));
    record.fetchedAt = scout::time::FromUnixMillis(st.ColInt64(12));
    if (activeOut) {
        *activeOut = st.ColInt(13) != 0;
    }
    record.perspective = scout::ParsePerspective(st.ColText(14));
    return record;
}

std::string escapeLike(const std::string &term) {
    std::string escaped;
    escaped.reserve(term.size() + 2);
    escaped.push_back('%');
    for (char ch : term) {
        if (ch == '%' || ch == '_' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    escaped.push_back('%');
    return escaped;
}

std::string trimCopy(const std::string &value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) { return std::isspace(ch) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

const char *orderClause(scout::cache::SortKey sortKey) {
    switch (sortKey) {
        case scout::cache::SortKey::Players:
            return " ORDER BY player_count DESC, name ASC";
        case scout::cache::SortKey::Ping:
            return " ORDER BY ping_ms IS NULL, ping_ms ASC, name ASC, host ASC, port ASC";
        case scout::cache::SortKey::Name:
            return " ORDER BY name ASC, host ASC, port ASC";
        case scout::cache::SortKey::LastSeen:
            return " ORDER BY last_seen_ms DESC, name ASC";
    }
    return " ORDER BY player_count DESC, name ASC";
}

template <typename Fn>
auto guarded(const char *operation, Fn &&fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const scout::cache::sqlite::SqliteError &ex) {
        throw scout::cache::CacheError(std::string(operation) + ": " + ex.what());
    }
}

} // namespace

namespace scout::cache {

SqliteCacheStore::SqliteCacheStore(const std::filesystem::path &path, std::chrono::milliseconds busyTimeout)
    : path(path) {
    guarded("open", [&] {
        bulk = std::make_unique<sqlite::SqliteDB>(path.string(), busyTimeout);
        createSchema();
        ping = std::make_unique<sqlite::SqliteDB>(path.string(), busyTimeout);
    });
    spdlog::debug("SqliteCacheStore: Opened {}", path.string());
}

SqliteCacheStore::~SqliteCacheStore() {
    close();
}

void SqliteCacheStore::createSchema() {
    bulk->Exec(kSchemaSql);

    // Files written before perspective was tracked lack the column.
    bool hasPerspective = false;
    {
        Statement st(*bulk, "PRAGMA table_info(servers);");
        while (st.Step()) {
            if (st.ColText(1) == "perspective") {
                hasPerspective = true;
            }
        }
    }
    if (!hasPerspective) {
        spdlog::info("SqliteCacheStore: Adding perspective column to {}", path.string());
        bulk->Exec("ALTER TABLE servers ADD COLUMN perspective TEXT NOT NULL DEFAULT 'Unknown';");
    }
}

sqlite::SqliteDB &SqliteCacheStore::bulkConnection() const {
    if (!bulk) {
        throw CacheError("sqlite cache store is closed");
    }
    return *bulk;
}

sqlite::SqliteDB &SqliteCacheStore::pingConnection() const {
    if (!ping) {
        throw CacheError("sqlite cache store is closed");
    }
    return *ping;
}

void SqliteCacheStore::upsertBatch(const std::vector<ServerRecord> &records) {
    if (records.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    guarded("upsertBatch", [&] {
        sqlite::Transaction tx(db);
        Statement st(db, kUpsertSql);
        for (const auto &incoming : records) {
            ServerRecord record = incoming;
            NormalizeCounts(record);

            st.BindText(1, record.address.host);
            st.BindInt(2, record.address.port);
            st.BindInt(3, record.probeEndpoint().port);
            st.BindText(4, record.name);
            st.BindText(5, record.map);
            st.BindText(6, record.country);
            st.BindText(7, SourceKindName(record.sourceKind));
            st.BindInt(8, record.modsPresent ? 1 : 0);
            st.BindInt(9, record.playerCount);
            st.BindInt(10, record.maxPlayers);
            st.BindOptionalInt(11, record.pingMs);
            st.BindInt64(12, time::ToUnixMillis(record.lastSeenAt));
            st.BindInt64(13, time::ToUnixMillis(record.fetchedAt));
            st.BindText(14, PerspectiveName(record.perspective));
            st.Step();
            st.Reset();
        }
        tx.Commit();
    });
    spdlog::debug("SqliteCacheStore: Merged {} record(s)", records.size());
}

void SqliteCacheStore::updatePing(const ServerAddress &address,
                                  std::optional<int> pingMs,
                                  int playerCount,
                                  Timestamp observedAt) {
    std::lock_guard<std::mutex> lock(pingMutex);
    auto &db = pingConnection();
    guarded("updatePing", [&] {
        if (!pingMs) {
            Statement st(db, "UPDATE servers SET ping_ms = NULL WHERE host = ? AND port = ?;");
            st.BindText(1, address.host);
            st.BindInt(2, address.port);
            st.Step();
            return;
        }

        Statement st(db,
                     "UPDATE servers SET ping_ms = ?, "
                     "player_count = MIN(MAX(?, 0), max_players), "
                     "last_seen_ms = MAX(last_seen_ms, ?), active = 1 "
                     "WHERE host = ? AND port = ?;");
        st.BindInt(1, std::max(0, *pingMs));
        st.BindInt(2, playerCount);
        st.BindInt64(3, time::ToUnixMillis(observedAt));
        st.BindText(4, address.host);
        st.BindInt(5, address.port);
        st.Step();
    });
}

void SqliteCacheStore::updateDetails(const ServerAddress &address, const ProbeDetails &details) {
    std::lock_guard<std::mutex> lock(pingMutex);
    auto &db = pingConnection();
    guarded("updateDetails", [&] {
        Statement st(db,
                     "UPDATE servers SET "
                     "name = CASE WHEN ? = '' THEN name ELSE ? END, "
                     "map = CASE WHEN ? = '' THEN map ELSE ? END, "
                     "perspective = CASE WHEN ? = 'Unknown' THEN perspective ELSE ? END "
                     "WHERE host = ? AND port = ?;");
        const char *perspective = PerspectiveName(details.perspective);
        st.BindText(1, details.name);
        st.BindText(2, details.name);
        st.BindText(3, details.map);
        st.BindText(4, details.map);
        st.BindText(5, perspective);
        st.BindText(6, perspective);
        st.BindText(7, address.host);
        st.BindInt(8, address.port);
        st.Step();
    });
}

std::vector<ServerRecord> SqliteCacheStore::getAll(const std::optional<FilterCriteria> &filter) const {
    std::string sql = std::string(kSelectColumns) + " WHERE active = 1";
    std::vector<std::string> countries;
    std::optional<std::string> search;

    if (filter) {
        countries = filter->effectiveCountries();
        if (!countries.empty()) {
            sql += " AND UPPER(country) IN (";
            for (std::size_t i = 0; i < countries.size(); ++i) {
                sql += i == 0 ? "?" : ", ?";
            }
            sql += ")";
        }
        if (filter->serverType) {
            sql += " AND source_kind = ?";
        }
        if (filter->mods) {
            sql += " AND mods_present = ?";
        }
        if (filter->search) {
            std::string term = trimCopy(*filter->search);
            if (!term.empty()) {
                search = std::move(term);
                sql += " AND name LIKE ? ESCAPE '\\'";
            }
        }
    }
    sql += " ORDER BY ping_ms IS NULL, ping_ms ASC, name ASC, host ASC, port ASC;";

    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    return guarded("getAll", [&] {
        Statement st(db, sql.c_str());
        int index = 1;
        for (const auto &code : countries) {
            st.BindText(index++, code);
        }
        if (filter && filter->serverType) {
            st.BindText(index++, SourceKindName(*filter->serverType));
        }
        if (filter && filter->mods) {
            st.BindInt(index++, *filter->mods ? 1 : 0);
        }
        if (search) {
            st.BindText(index++, escapeLike(*search));
        }

        std::vector<ServerRecord> records;
        while (st.Step()) {
            records.push_back(readRecord(st));
        }
        return records;
    });
}

std::vector<ServerRecord> SqliteCacheStore::getTopServers(std::size_t n, SortKey sortKey) const {
    const std::string sql = std::string(kSelectColumns) + orderClause(sortKey) + " LIMIT ?;";

    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    return guarded("getTopServers", [&] {
        Statement st(db, sql.c_str());
        st.BindInt64(1, static_cast<int64_t>(n));
        std::vector<ServerRecord> records;
        while (st.Step()) {
            records.push_back(readRecord(st));
        }
        return records;
    });
}

std::optional<CacheEntry> SqliteCacheStore::getEntry(const ServerAddress &address,
                                                     Timestamp now,
                                                     std::chrono::seconds ttl) const {
    const std::string sql = std::string(kSelectColumns) + " WHERE host = ? AND port = ?;";

    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    return guarded("getEntry", [&]() -> std::optional<CacheEntry> {
        Statement st(db, sql.c_str());
        st.BindText(1, address.host);
        st.BindInt(2, address.port);
        if (!st.Step()) {
            return std::nullopt;
        }

        CacheEntry entry;
        entry.record = readRecord(st, &entry.active);
        entry.fetchedAt = entry.record.fetchedAt;
        entry.isStale = IsStale(entry.fetchedAt, now, ttl);
        return entry;
    });
}

std::size_t SqliteCacheStore::pruneStale(Timestamp now, std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    const std::size_t pruned = guarded("pruneStale", [&] {
        Statement st(db, "UPDATE servers SET active = 0 WHERE active = 1 AND last_seen_ms < ?;");
        st.BindInt64(1, time::ToUnixMillis(now - maxAge));
        st.Step();
        return static_cast<std::size_t>(sqlite3_changes(db.Handle()));
    });
    if (pruned > 0) {
        spdlog::info("SqliteCacheStore: Marked {} stale server(s) inactive", pruned);
    }
    return pruned;
}

std::size_t SqliteCacheStore::purgeExpired(Timestamp now, std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    const std::size_t purged = guarded("purgeExpired", [&] {
        Statement st(db, "DELETE FROM servers WHERE last_seen_ms < ?;");
        st.BindInt64(1, time::ToUnixMillis(now - maxAge));
        st.Step();
        return static_cast<std::size_t>(sqlite3_changes(db.Handle()));
    });
    if (purged > 0) {
        spdlog::info("SqliteCacheStore: Deleted {} expired server(s)", purged);
    }
    return purged;
}

void SqliteCacheStore::recordFetch(const std::string &criteriaKey, Timestamp fetchedAt) {
    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    guarded("recordFetch", [&] {
        Statement st(db,
                     "INSERT INTO fetch_log(criteria_key, fetched_at_ms) VALUES(?, ?) "
                     "ON CONFLICT(criteria_key) DO UPDATE SET fetched_at_ms = excluded.fetched_at_ms;");
        st.BindText(1, criteriaKey);
        st.BindInt64(2, time::ToUnixMillis(fetchedAt));
        st.Step();
    });
}

std::optional<Timestamp> SqliteCacheStore::lastFetch(const std::string &criteriaKey) const {
    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    return guarded("lastFetch", [&]() -> std::optional<Timestamp> {
        Statement st(db, "SELECT fetched_at_ms FROM fetch_log WHERE criteria_key = ?;");
        st.BindText(1, criteriaKey);
        if (!st.Step()) {
            return std::nullopt;
        }
        return time::FromUnixMillis(st.ColInt64(0));
    });
}

CacheStats SqliteCacheStore::stats() const {
    std::lock_guard<std::mutex> lock(bulkMutex);
    auto &db = bulkConnection();
    return guarded("stats", [&] {
        CacheStats result;
        Statement st(db, "SELECT source_kind, active, COUNT(*) FROM servers GROUP BY source_kind, active;");
        while (st.Step()) {
            const auto count = static_cast<std::size_t>(st.ColInt64(2));
            result.total += count;
            if (st.ColInt(1) != 0) {
                result.active += count;
            }
            switch (ParseSourceKind(st.ColText(0)).value_or(SourceKind::Community)) {
                case SourceKind::Official:
                    result.official += count;
                    break;
                case SourceKind::Community:
                    result.community += count;
                    break;
                case SourceKind::Private:
                    result.privateServers += count;
                    break;
            }
        }
        return result;
    });
}

void SqliteCacheStore::close() {
    std::scoped_lock lock(bulkMutex, pingMutex);
    if (ping || bulk) {
        spdlog::debug("SqliteCacheStore: Closing {}", path.string());
    }
    ping.reset();
    bulk.reset();
}

} // namespace scout::cache
