/**
 * @file SessionStore.hpp
 * @brief Append-only, per-date persistence of session output.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/Metrics.hpp"
#include "domain/Note.hpp"
#include "domain/Session.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace notedrift::infrastructure {

/**
 * @class SessionStore
 * @brief Reads and writes whole sessions atomically.
 *
 * A session is written in one transaction or not at all. Existing sessions
 * are never merged into: the caller either gets SessionAlreadyExists or asks
 * for WriteMode::Replace.
 */
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<SqliteDatabase> db);

    /**
     * @brief Persists a complete session together with the notes it covers.
     * @throws domain::SessionAlreadyExists when the date exists and mode is RejectExisting.
     */
    void writeSession(const domain::SessionData& data,
                      const std::vector<domain::Note>& notes,
                      domain::WriteMode mode);

    /** @throws domain::SessionNotFound */
    domain::SessionData readSession(const domain::CalendarDate& date) const;

    std::optional<domain::SessionData> findSession(const domain::CalendarDate& date) const;

    bool hasSession(const domain::CalendarDate& date) const;

    /** @brief Dates with data in [start, end], ascending. */
    std::vector<domain::CalendarDate> sessionsBetween(const domain::CalendarDate& start,
                                                      const domain::CalendarDate& end) const;

    std::vector<domain::CalendarDate> allSessions() const;

    /** @brief Every record of one note in sessions up to and including upTo, ascending. */
    std::vector<std::pair<domain::CalendarDate, domain::SessionRecord>>
    noteHistory(const std::string& noteId, const domain::CalendarDate& upTo) const;

    std::vector<domain::Link> linksFor(const domain::CalendarDate& date) const;

    /** @brief Links present at earlier but gone at later. */
    std::vector<domain::Link> removedLinks(const domain::CalendarDate& earlier,
                                           const domain::CalendarDate& later) const;

    /** @brief Latest stored metadata for the given notes, or for all notes when ids is empty. */
    std::map<std::string, domain::Note> loadNotes(const std::vector<std::string>& ids = {}) const;

    std::optional<domain::EmbeddingMetrics> loadMetrics(const domain::CalendarDate& date) const;
    void saveMetrics(const domain::EmbeddingMetrics& metrics);

private:
    std::vector<domain::CalendarDate> listDates(const std::string& sql,
                                                const std::vector<std::string>& params) const;
    static domain::SessionRecord readRecord(const Statement& stmt, int firstColumn);

    std::shared_ptr<SqliteDatabase> m_db;
};

} // namespace notedrift::infrastructure
