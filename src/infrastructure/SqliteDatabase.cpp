/**
 * @file SqliteDatabase.cpp
 * @brief Implementation of SqliteDatabase, Statement and Transaction.
 */

#include "infrastructure/SqliteDatabase.hpp"

#include <sqlite3.h>

#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

#include "domain/Errors.hpp"

namespace notedrift::infrastructure {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE notes (
    id TEXT PRIMARY KEY,
    title TEXT NOT NULL,
    content TEXT NOT NULL DEFAULT '',
    content_hash TEXT NOT NULL,
    created INTEGER NOT NULL,
    modified INTEGER NOT NULL,
    is_virtual INTEGER NOT NULL DEFAULT 0,
    source_ref TEXT NOT NULL DEFAULT ''
);
CREATE TABLE sessions (
    date TEXT PRIMARY KEY,
    vault_state_hash TEXT NOT NULL,
    note_count INTEGER NOT NULL,
    created_at TEXT NOT NULL
);
CREATE TABLE session_embeddings (
    session_date TEXT NOT NULL REFERENCES sessions(date),
    note_id TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    embedding BLOB NOT NULL,
    cluster_id INTEGER NOT NULL,
    cluster_label TEXT NOT NULL DEFAULT '',
    staleness_days REAL NOT NULL,
    word_count INTEGER NOT NULL DEFAULT 0,
    heading_count INTEGER NOT NULL DEFAULT 0,
    list_item_count INTEGER NOT NULL DEFAULT 0,
    outgoing_link_count INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (session_date, note_id)
);
CREATE INDEX idx_session_embeddings_note ON session_embeddings(note_id, session_date);
CREATE TABLE session_links (
    session_date TEXT NOT NULL REFERENCES sessions(date),
    source_id TEXT NOT NULL,
    target_id TEXT NOT NULL,
    PRIMARY KEY (session_date, source_id, target_id)
);
CREATE TABLE semantic_cache (
    model TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    dimension INTEGER NOT NULL,
    vector BLOB NOT NULL,
    created_at TEXT NOT NULL,
    PRIMARY KEY (model, content_hash)
);
CREATE TABLE embedding_metrics (
    session_date TEXT PRIMARY KEY,
    note_count INTEGER NOT NULL,
    mean_similarity REAL NOT NULL,
    std_similarity REAL NOT NULL,
    diversity REAL NOT NULL,
    intrinsic_dimension REAL NOT NULL,
    cluster_count INTEGER NOT NULL,
    noise_count INTEGER NOT NULL,
    gap_percent REAL NOT NULL,
    shannon_entropy REAL NOT NULL,
    silhouette REAL NOT NULL,
    cluster_labels TEXT NOT NULL,
    computed_at TEXT NOT NULL
);
)SQL";

const std::map<std::string, std::vector<std::string>>& expectedColumns() {
    static const std::map<std::string, std::vector<std::string>> kColumns = {
        {"notes", {"id", "title", "content", "content_hash", "created", "modified", "is_virtual", "source_ref"}},
        {"sessions", {"date", "vault_state_hash", "note_count", "created_at"}},
        {"session_embeddings", {"session_date", "note_id", "content_hash", "embedding", "cluster_id",
                                "cluster_label", "staleness_days", "word_count", "heading_count",
                                "list_item_count", "outgoing_link_count"}},
        {"session_links", {"session_date", "source_id", "target_id"}},
        {"semantic_cache", {"model", "content_hash", "dimension", "vector", "created_at"}},
        {"embedding_metrics", {"session_date", "note_count", "mean_similarity", "std_similarity", "diversity",
                               "intrinsic_dimension", "cluster_count", "noise_count", "gap_percent",
                               "shannon_entropy", "silhouette", "cluster_labels", "computed_at"}},
    };
    return kColumns;
}

} // namespace

SqliteDatabase::SqliteDatabase(const std::string& path) : m_path(path) {
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
        std::string err = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("Failed to open database " + path + ": " + err);
    }

    sqlite3_busy_timeout(m_db, 5000);
    exec("PRAGMA foreign_keys=ON;");
    if (path != ":memory:") {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
    }

    try {
        ensureSchema();
    } catch (...) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

SqliteDatabase::~SqliteDatabase() {
    if (m_db) sqlite3_close(m_db);
}

void SqliteDatabase::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

int SqliteDatabase::userVersion() {
    Statement stmt(*this, "PRAGMA user_version;");
    return stmt.step() ? static_cast<int>(stmt.columnInt64(0)) : 0;
}

bool SqliteDatabase::hasAnyTable() {
    Statement stmt(*this, "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table';");
    return stmt.step() && stmt.columnInt64(0) > 0;
}

void SqliteDatabase::ensureSchema() {
    int version = userVersion();
    if (version == 0) {
        if (hasAnyTable()) {
            throw domain::CacheCorruption(m_path + " contains tables but no schema version");
        }
        Transaction tx(*this);
        exec(kSchema);
        exec("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");
        tx.commit();
        std::cout << "[SqliteDatabase] Created schema v" << kSchemaVersion << " in " << m_path << std::endl;
        return;
    }
    if (version != kSchemaVersion) {
        throw domain::CacheCorruption(m_path + " has schema version " + std::to_string(version) +
                                      ", expected " + std::to_string(kSchemaVersion));
    }
    verifySchema();
}

void SqliteDatabase::verifySchema() {
    for (const auto& [table, columns] : expectedColumns()) {
        Statement stmt(*this, "PRAGMA table_info(" + table + ");");
        std::set<std::string> present;
        while (stmt.step()) {
            present.insert(stmt.columnText(1));
        }
        if (present.empty()) {
            throw domain::CacheCorruption("missing table " + table);
        }
        for (const auto& column : columns) {
            if (!present.count(column)) {
                throw domain::CacheCorruption("table " + table + " lacks column " + column);
            }
        }
    }
}

std::string SqliteDatabase::UtcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// Statement

Statement::Statement(SqliteDatabase& db, const std::string& sql) : m_db(db) {
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SQLite prepare failed: " + std::string(sqlite3_errmsg(db.handle())) +
                                 " [" + sql + "]");
    }
}

Statement::~Statement() {
    if (m_stmt) sqlite3_finalize(m_stmt);
}

void Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(m_stmt, index, value);
}

void Statement::bind(int index, double value) {
    sqlite3_bind_double(m_stmt, index, value);
}

void Statement::bind(int index, const domain::Vector& value) {
    sqlite3_bind_blob(m_stmt, index, value.data(), static_cast<int>(value.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
}

bool Statement::step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error("SQLite step failed: " + std::string(sqlite3_errmsg(m_db.handle())));
}

void Statement::reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

std::string Statement::columnText(int index) const {
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(m_stmt, index)));
}

std::int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(m_stmt, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(m_stmt, index);
}

domain::Vector Statement::columnVector(int index) const {
    const void* blob = sqlite3_column_blob(m_stmt, index);
    int bytes = sqlite3_column_bytes(m_stmt, index);
    if (bytes % static_cast<int>(sizeof(float)) != 0) {
        throw domain::CacheCorruption("vector blob of " + std::to_string(bytes) + " bytes");
    }
    domain::Vector out(static_cast<size_t>(bytes) / sizeof(float));
    if (bytes > 0) std::memcpy(out.data(), blob, static_cast<size_t>(bytes));
    return out;
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// Transaction

Transaction::Transaction(SqliteDatabase& db) : m_db(db) {
    m_db.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (m_done) return;
    char* err = nullptr;
    if (sqlite3_exec(m_db.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[SqliteDatabase] Rollback failed: " << (err ? err : "unknown") << std::endl;
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    m_db.exec("COMMIT;");
    m_done = true;
}

} // namespace notedrift::infrastructure
