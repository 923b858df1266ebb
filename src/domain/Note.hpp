/**
 * @file Note.hpp
 * @brief Immutable note snapshots and the links between them.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace notedrift::domain {

/**
 * @struct Note
 * @brief One note as handed over by the ingestion layer.
 *
 * Virtual notes are carved out of a single container file (e.g. a journal);
 * sourceRef then names that file.
 */
struct Note {
    std::string id;            ///< Stable identity (vault-relative path).
    std::string title;
    std::string content;
    std::string contentHash;   ///< SHA-256 hex of content; filled in when empty.
    std::int64_t created = 0;  ///< UTC epoch seconds.
    std::int64_t modified = 0; ///< UTC epoch seconds.
    bool isVirtual = false;
    std::string sourceRef;
};

/**
 * @struct Link
 * @brief Directed edge from one note to another.
 */
struct Link {
    std::string source;
    std::string target;

    bool operator==(const Link& o) const { return source == o.source && target == o.target; }
    bool operator<(const Link& o) const {
        return source < o.source || (source == o.source && target < o.target);
    }
};

/**
 * @struct CorpusSnapshot
 * @brief Everything the engine receives for one session.
 */
struct CorpusSnapshot {
    std::vector<Note> notes;
    std::vector<Link> links;
};

/**
 * @struct StructuralProfile
 * @brief Coarse shape of a note at a session, tracked as its own trajectory dimension.
 */
struct StructuralProfile {
    int wordCount = 0;
    int headingCount = 0;
    int listItemCount = 0;
    int outgoingLinkCount = 0;
};

} // namespace notedrift::domain
