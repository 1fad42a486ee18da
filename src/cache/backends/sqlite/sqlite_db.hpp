#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace scout::cache::sqlite {

class SqliteError : public std::runtime_error {
public:
    SqliteError(int code, const std::string &msg) : std::runtime_error(msg), code(code) {}

    int code;
};

/*
  RAII wrapper around one sqlite3 connection.
*/
class SqliteDB {
public:
    SqliteDB(std::string path, std::chrono::milliseconds busyTimeout);
    ~SqliteDB();

    SqliteDB(const SqliteDB &) = delete;
    SqliteDB &operator=(const SqliteDB &) = delete;

    sqlite3 *Handle() const {
        return db;
    }

    const std::string &Path() const {
        return path;
    }

    // Execute a SQL string (pragmas, schema, transaction control).
    void Exec(const std::string &sql);

private:
    void Configure(std::chrono::milliseconds busyTimeout);

    sqlite3 *db = nullptr;
    std::string path;
};

// Prepared statement finalized on destruction.
class Statement {
public:
    Statement(SqliteDB &db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void BindText(int index, const std::string &value);
    void BindInt(int index, int value);
    void BindInt64(int index, int64_t value);
    void BindNull(int index);
    void BindOptionalInt(int index, const std::optional<int> &value);

    // Returns true while a row is available; throws on error.
    bool Step();
    void Reset();

    std::string ColText(int col) const;
    int ColInt(int col) const;
    int64_t ColInt64(int col) const;
    std::optional<int> ColOptionalInt(int col) const;

private:
    SqliteDB &db;
    sqlite3_stmt *stmt = nullptr;
};

/*
  BEGIN IMMEDIATE takes the write lock up front; an uncommitted transaction
  rolls back when destroyed.
*/
class Transaction {
public:
    explicit Transaction(SqliteDB &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void Commit();

private:
    SqliteDB &db;
    bool committed = false;
};

} // namespace scout::cache::sqlite
