#include "cache/backends/sqlite/sqlite_db.hpp"

#include "spdlog/spdlog.h"

#include <utility>

namespace scout::cache::sqlite {

namespace {
void ThrowIf(int rc, sqlite3 *db, const char *what) {
    if (rc != SQLITE_OK) {
        throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db));
    }
}
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busyTimeout) : path(std::move(path)) {
    int rc = sqlite3_open_v2(this->path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "sqlite open failed";
        if (db) {
            sqlite3_close(db);
        }
        db = nullptr;
        throw SqliteError(rc, "open " + this->path + ": " + msg);
    }

    try {
        Configure(busyTimeout);
    } catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SqliteDB::~SqliteDB() {
    if (db) {
        sqlite3_close(db);
    }
}

void SqliteDB::Exec(const std::string &sql) {
    char *err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw SqliteError(rc, msg);
    }
}

void SqliteDB::Configure(std::chrono::milliseconds busyTimeout) {
    // Wait for locks instead of failing immediately.
    ThrowIf(sqlite3_busy_timeout(db, static_cast<int>(busyTimeout.count())), db, "busy_timeout");

    // WAL lets readers proceed while the writer holds the lock.
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
    Exec("PRAGMA temp_store=MEMORY;");
}

Statement::Statement(SqliteDB &db, const char *sql) : db(db) {
    ThrowIf(sqlite3_prepare_v2(db.Handle(), sql, -1, &stmt, nullptr), db.Handle(), "sqlite prepare");
}

Statement::~Statement() {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

void Statement::BindText(int index, const std::string &value) {
    ThrowIf(sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT), db.Handle(), "sqlite bind");
}

void Statement::BindInt(int index, int value) {
    ThrowIf(sqlite3_bind_int(stmt, index, value), db.Handle(), "sqlite bind");
}

void Statement::BindInt64(int index, int64_t value) {
    ThrowIf(sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)), db.Handle(), "sqlite bind");
}

void Statement::BindNull(int index) {
    ThrowIf(sqlite3_bind_null(stmt, index), db.Handle(), "sqlite bind");
}

void Statement::BindOptionalInt(int index, const std::optional<int> &value) {
    if (value) {
        BindInt(index, *value);
    } else {
        BindNull(index);
    }
}

bool Statement::Step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw SqliteError(rc, std::string("sqlite step: ") + sqlite3_errmsg(db.Handle()));
}

void Statement::Reset() {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

std::string Statement::ColText(int col) const {
    const unsigned char *text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char *>(text) : "";
}

int Statement::ColInt(int col) const {
    return sqlite3_column_int(stmt, col);
}

int64_t Statement::ColInt64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
}

std::optional<int> Statement::ColOptionalInt(int col) const {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, col);
}

Transaction::Transaction(SqliteDB &db) : db(db) {
    db.Exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!committed) {
        try {
            db.Exec("ROLLBACK;");
        } catch (const std::exception &ex) {
            spdlog::warn("SqliteDB: Rollback on {} failed: {}", db.Path(), ex.what());
        }
    }
}

void Transaction::Commit() {
    db.Exec("COMMIT;");
    committed = true;
}

} // namespace scout::cache::sqlite
