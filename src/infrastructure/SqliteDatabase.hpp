/**
 * @file SqliteDatabase.hpp
 * @brief Thin RAII layer over the SQLite C API plus the engine schema.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "domain/Embedding.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace notedrift::infrastructure {

/**
 * @class SqliteDatabase
 * @brief Owns one connection. Creates the schema on a fresh file and refuses
 *        (CacheCorruption) any file whose schema does not match.
 */
class SqliteDatabase {
public:
    static constexpr int kSchemaVersion = 1;

    /** @brief Opens or creates the database. ":memory:" is accepted. */
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    sqlite3* handle() const { return m_db; }
    const std::string& path() const { return m_path; }

    /** @brief Runs one or more statements without results. Throws on error. */
    void exec(const std::string& sql);

    /** @brief Serializes multi-statement sequences across callers sharing the connection. */
    std::mutex& mutex() { return m_mutex; }

    /** @brief ISO-8601 UTC "now", used for bookkeeping columns only. */
    static std::string UtcTimestamp();

private:
    void ensureSchema();
    void verifySchema();
    int userVersion();
    bool hasAnyTable();

    std::string m_path;
    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

/**
 * @class Statement
 * @brief Prepared statement finalized on scope exit.
 */
class Statement {
public:
    Statement(SqliteDatabase& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value);
    void bind(int index, std::int64_t value);
    void bind(int index, int value) { bind(index, static_cast<std::int64_t>(value)); }
    void bind(int index, double value);
    void bind(int index, const domain::Vector& value);

    /** @brief Advances. True while a row is available. Throws on error. */
    bool step();
    void reset();

    std::string columnText(int index) const;
    std::int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    /** @brief Decodes a float32 blob. Throws CacheCorruption on a malformed blob. */
    domain::Vector columnVector(int index) const;
    bool columnIsNull(int index) const;

private:
    SqliteDatabase& m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

/**
 * @class Transaction
 * @brief BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
 */
class Transaction {
public:
    explicit Transaction(SqliteDatabase& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDatabase& m_db;
    bool m_done = false;
};

} // namespace notedrift::infrastructure
