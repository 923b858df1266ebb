/**
 * @file Session.hpp
 * @brief Per-date analysis output as persisted by the session store.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/Embedding.hpp"
#include "domain/Note.hpp"

namespace notedrift::domain {

constexpr int kNoiseCluster = -1;

/**
 * @struct SessionRecord
 * @brief One note as seen by one session.
 */
struct SessionRecord {
    std::string noteId;
    std::string contentHash;
    Vector embedding;             ///< Semantic sub-vector followed by the temporal features.
    int clusterId = kNoiseCluster;
    std::string clusterLabel;     ///< Empty for noise.
    double stalenessDays = 0.0;   ///< Days since last modification, at the session date.
    StructuralProfile structure;
};

/**
 * @struct SessionData
 * @brief Complete, immutable output of one session.
 */
struct SessionData {
    CalendarDate date;
    std::string vaultStateHash;
    std::map<std::string, SessionRecord> records; ///< Keyed by note id.
    std::vector<Link> links;
};

/** @brief How writeSession treats an existing session for the same date. */
enum class WriteMode {
    RejectExisting,
    Replace
};

} // namespace notedrift::domain
