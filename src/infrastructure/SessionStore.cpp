/**
 * @file SessionStore.cpp
 * @brief Implementation of SessionStore over SQLite.
 */

#include "infrastructure/SessionStore.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace notedrift::infrastructure {

using json = nlohmann::json;

namespace {

// Columns shared by every query returning a SessionRecord.
const char* kRecordColumns =
    "note_id, content_hash, embedding, cluster_id, cluster_label, staleness_days, "
    "word_count, heading_count, list_item_count, outgoing_link_count";

domain::CalendarDate parseStoredDate(const std::string& text) {
    auto date = domain::CalendarDate::parse(text);
    if (!date) throw domain::CacheCorruption("malformed session date '" + text + "'");
    return *date;
}

} // namespace

SessionStore::SessionStore(std::shared_ptr<SqliteDatabase> db) : m_db(std::move(db)) {
    if (!m_db) throw std::invalid_argument("SessionStore requires a database");
}

domain::SessionRecord SessionStore::readRecord(const Statement& stmt, int c) {
    domain::SessionRecord r;
    r.noteId = stmt.columnText(c);
    r.contentHash = stmt.columnText(c + 1);
    r.embedding = stmt.columnVector(c + 2);
    r.clusterId = static_cast<int>(stmt.columnInt64(c + 3));
    r.clusterLabel = stmt.columnText(c + 4);
    r.stalenessDays = stmt.columnDouble(c + 5);
    r.structure.wordCount = static_cast<int>(stmt.columnInt64(c + 6));
    r.structure.headingCount = static_cast<int>(stmt.columnInt64(c + 7));
    r.structure.listItemCount = static_cast<int>(stmt.columnInt64(c + 8));
    r.structure.outgoingLinkCount = static_cast<int>(stmt.columnInt64(c + 9));
    return r;
}

void SessionStore::writeSession(const domain::SessionData& data,
                                const std::vector<domain::Note>& notes,
                                domain::WriteMode mode) {
    const std::string date = data.date.toString();
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Transaction tx(*m_db);

    bool exists = false;
    {
        Statement check(*m_db, "SELECT 1 FROM sessions WHERE date = ?;");
        check.bind(1, date);
        exists = check.step();
    }
    if (exists) {
        if (mode == domain::WriteMode::RejectExisting) {
            throw domain::SessionAlreadyExists(date);
        }
        for (const char* table : {"session_links", "session_embeddings", "embedding_metrics"}) {
            Statement del(*m_db, std::string("DELETE FROM ") + table + " WHERE session_date = ?;");
            del.bind(1, date);
            del.step();
        }
        Statement del(*m_db, "DELETE FROM sessions WHERE date = ?;");
        del.bind(1, date);
        del.step();
        std::cout << "[SessionStore] Replacing session " << date << std::endl;
    }

    {
        Statement ins(*m_db, "INSERT INTO sessions (date, vault_state_hash, note_count, created_at) VALUES (?, ?, ?, ?);");
        ins.bind(1, date);
        ins.bind(2, data.vaultStateHash);
        ins.bind(3, static_cast<std::int64_t>(data.records.size()));
        ins.bind(4, SqliteDatabase::UtcTimestamp());
        ins.step();
    }

    {
        Statement ins(*m_db,
                      "INSERT INTO session_embeddings (session_date, note_id, content_hash, embedding, cluster_id, "
                      "cluster_label, staleness_days, word_count, heading_count, list_item_count, outgoing_link_count) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        for (const auto& [id, r] : data.records) {
            ins.reset();
            ins.bind(1, date);
            ins.bind(2, id);
            ins.bind(3, r.contentHash);
            ins.bind(4, r.embedding);
            ins.bind(5, r.clusterId);
            ins.bind(6, r.clusterLabel);
            ins.bind(7, r.stalenessDays);
            ins.bind(8, r.structure.wordCount);
            ins.bind(9, r.structure.headingCount);
            ins.bind(10, r.structure.listItemCount);
            ins.bind(11, r.structure.outgoingLinkCount);
            ins.step();
        }
    }

    {
        Statement ins(*m_db, "INSERT OR IGNORE INTO session_links (session_date, source_id, target_id) VALUES (?, ?, ?);");
        for (const auto& link : data.links) {
            ins.reset();
            ins.bind(1, date);
            ins.bind(2, link.source);
            ins.bind(3, link.target);
            ins.step();
        }
    }

    {
        Statement ins(*m_db,
                      "INSERT INTO notes (id, title, content, content_hash, created, modified, is_virtual, source_ref) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                      "ON CONFLICT(id) DO UPDATE SET title = excluded.title, content = excluded.content, "
                      "content_hash = excluded.content_hash, created = excluded.created, "
                      "modified = excluded.modified, is_virtual = excluded.is_virtual, source_ref = excluded.source_ref;");
        for (const auto& note : notes) {
            ins.reset();
            ins.bind(1, note.id);
            ins.bind(2, note.title);
            ins.bind(3, note.content);
            ins.bind(4, note.contentHash);
            ins.bind(5, note.created);
            ins.bind(6, note.modified);
            ins.bind(7, note.isVirtual ? 1 : 0);
            ins.bind(8, note.sourceRef);
            ins.step();
        }
    }

    tx.commit();
    std::cout << "[SessionStore] Wrote session " << date << " (" << data.records.size() << " notes, "
              << data.links.size() << " links)" << std::endl;
}

std::optional<domain::SessionData> SessionStore::findSession(const domain::CalendarDate& date) const {
    const std::string key = date.toString();
    std::lock_guard<std::mutex> lock(m_db->mutex());

    domain::SessionData data;
    data.date = date;
    {
        Statement stmt(*m_db, "SELECT vault_state_hash FROM sessions WHERE date = ?;");
        stmt.bind(1, key);
        if (!stmt.step()) return std::nullopt;
        data.vaultStateHash = stmt.columnText(0);
    }
    {
        Statement stmt(*m_db, std::string("SELECT ") + kRecordColumns +
                                  " FROM session_embeddings WHERE session_date = ? ORDER BY note_id;");
        stmt.bind(1, key);
        while (stmt.step()) {
            domain::SessionRecord r = readRecord(stmt, 0);
            std::string id = r.noteId;
            data.records.emplace(std::move(id), std::move(r));
        }
    }
    {
        Statement stmt(*m_db, "SELECT source_id, target_id FROM session_links WHERE session_date = ? "
                              "ORDER BY source_id, target_id;");
        stmt.bind(1, key);
        while (stmt.step()) {
            data.links.push_back({stmt.columnText(0), stmt.columnText(1)});
        }
    }
    return data;
}

domain::SessionData SessionStore::readSession(const domain::CalendarDate& date) const {
    auto data = findSession(date);
    if (!data) throw domain::SessionNotFound(date.toString());
    return std::move(*data);
}

bool SessionStore::hasSession(const domain::CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db, "SELECT 1 FROM sessions WHERE date = ?;");
    stmt.bind(1, date.toString());
    return stmt.step();
}

std::vector<domain::CalendarDate> SessionStore::listDates(const std::string& sql,
                                                          const std::vector<std::string>& params) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db, sql);
    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
    }
    std::vector<domain::CalendarDate> out;
    while (stmt.step()) {
        out.push_back(parseStoredDate(stmt.columnText(0)));
    }
    return out;
}

std::vector<domain::CalendarDate> SessionStore::sessionsBetween(const domain::CalendarDate& start,
                                                                const domain::CalendarDate& end) const {
    return listDates("SELECT date FROM sessions WHERE date >= ? AND date <= ? ORDER BY date;",
                     {start.toString(), end.toString()});
}

std::vector<domain::CalendarDate> SessionStore::allSessions() const {
    return listDates("SELECT date FROM sessions ORDER BY date;", {});
}

std::vector<std::pair<domain::CalendarDate, domain::SessionRecord>>
SessionStore::noteHistory(const std::string& noteId, const domain::CalendarDate& upTo) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db, std::string("SELECT session_date, ") + kRecordColumns +
                              " FROM session_embeddings WHERE note_id = ? AND session_date <= ? ORDER BY session_date;");
    stmt.bind(1, noteId);
    stmt.bind(2, upTo.toString());

    std::vector<std::pair<domain::CalendarDate, domain::SessionRecord>> out;
    while (stmt.step()) {
        out.emplace_back(parseStoredDate(stmt.columnText(0)), readRecord(stmt, 1));
    }
    return out;
}

std::vector<domain::Link> SessionStore::linksFor(const domain::CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db, "SELECT source_id, target_id FROM session_links WHERE session_date = ? "
                          "ORDER BY source_id, target_id;");
    stmt.bind(1, date.toString());
    std::vector<domain::Link> out;
    while (stmt.step()) {
        out.push_back({stmt.columnText(0), stmt.columnText(1)});
    }
    return out;
}

std::vector<domain::Link> SessionStore::removedLinks(const domain::CalendarDate& earlier,
                                                     const domain::CalendarDate& later) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db,
                   "SELECT a.source_id, a.target_id FROM session_links a "
                   "WHERE a.session_date = ? AND NOT EXISTS ("
                   "  SELECT 1 FROM session_links b WHERE b.session_date = ? "
                   "  AND b.source_id = a.source_id AND b.target_id = a.target_id) "
                   "ORDER BY a.source_id, a.target_id;");
    stmt.bind(1, earlier.toString());
    stmt.bind(2, later.toString());
    std::vector<domain::Link> out;
    while (stmt.step()) {
        out.push_back({stmt.columnText(0), stmt.columnText(1)});
    }
    return out;
}

std::map<std::string, domain::Note> SessionStore::loadNotes(const std::vector<std::string>& ids) const {
    std::set<std::string> wanted(ids.begin(), ids.end());
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db, "SELECT id, title, content, content_hash, created, modified, is_virtual, source_ref FROM notes;");
    std::map<std::string, domain::Note> out;
    while (stmt.step()) {
        domain::Note n;
        n.id = stmt.columnText(0);
        if (!wanted.empty() && !wanted.count(n.id)) continue;
        n.title = stmt.columnText(1);
        n.content = stmt.columnText(2);
        n.contentHash = stmt.columnText(3);
        n.created = stmt.columnInt64(4);
        n.modified = stmt.columnInt64(5);
        n.isVirtual = stmt.columnInt64(6) != 0;
        n.sourceRef = stmt.columnText(7);
        std::string id = n.id;
        out.emplace(std::move(id), std::move(n));
    }
    return out;
}

std::optional<domain::EmbeddingMetrics> SessionStore::loadMetrics(const domain::CalendarDate& date) const {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db,
                   "SELECT note_count, mean_similarity, std_similarity, diversity, intrinsic_dimension, "
                   "cluster_count, noise_count, gap_percent, shannon_entropy, silhouette, cluster_labels, computed_at "
                   "FROM embedding_metrics WHERE session_date = ?;");
    stmt.bind(1, date.toString());
    if (!stmt.step()) return std::nullopt;

    domain::EmbeddingMetrics m;
    m.sessionDate = date;
    m.noteCount = static_cast<std::size_t>(stmt.columnInt64(0));
    m.meanSimilarity = stmt.columnDouble(1);
    m.stdSimilarity = stmt.columnDouble(2);
    m.diversity = stmt.columnDouble(3);
    m.intrinsicDimension = stmt.columnDouble(4);
    m.clusterCount = static_cast<std::size_t>(stmt.columnInt64(5));
    m.noiseCount = static_cast<std::size_t>(stmt.columnInt64(6));
    m.gapPercent = stmt.columnDouble(7);
    m.shannonEntropy = stmt.columnDouble(8);
    m.silhouette = stmt.columnDouble(9);
    try {
        json labels = json::parse(stmt.columnText(10));
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            m.clusterLabels[std::stoi(it.key())] = it.value().get<std::string>();
        }
    } catch (const std::exception& e) {
        throw domain::CacheCorruption("cluster labels for " + date.toString() + ": " + e.what());
    }
    m.computedAt = stmt.columnText(11);
    return m;
}

void SessionStore::saveMetrics(const domain::EmbeddingMetrics& m) {
    json labels = json::object();
    for (const auto& [id, label] : m.clusterLabels) {
        labels[std::to_string(id)] = label;
    }

    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db,
                   "INSERT OR REPLACE INTO embedding_metrics (session_date, note_count, mean_similarity, std_similarity, "
                   "diversity, intrinsic_dimension, cluster_count, noise_count, gap_percent, shannon_entropy, "
                   "silhouette, cluster_labels, computed_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.bind(1, m.sessionDate.toString());
    stmt.bind(2, static_cast<std::int64_t>(m.noteCount));
    stmt.bind(3, m.meanSimilarity);
    stmt.bind(4, m.stdSimilarity);
    stmt.bind(5, m.diversity);
    stmt.bind(6, m.intrinsicDimension);
    stmt.bind(7, static_cast<std::int64_t>(m.clusterCount));
    stmt.bind(8, static_cast<std::int64_t>(m.noiseCount));
    stmt.bind(9, m.gapPercent);
    stmt.bind(10, m.shannonEntropy);
    stmt.bind(11, m.silhouette);
    stmt.bind(12, labels.dump());
    stmt.bind(13, m.computedAt.empty() ? SqliteDatabase::UtcTimestamp() : m.computedAt);
    stmt.step();
}

} // namespace notedrift::infrastructure
