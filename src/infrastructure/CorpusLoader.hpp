/**
 * @file CorpusLoader.hpp
 * @brief Reads the ingestion layer's JSON hand-off into a CorpusSnapshot.
 *
 * Expected shape:
 * @code
 * { "notes": [ { "id": "ideas/a.md", "title": "A", "content": "...",
 *                "created": "2024-03-01T09:30:00Z", "modified": 1709285400,
 *                "virtual": false, "source": "" } ],
 *   "links": [ { "source": "ideas/a.md", "target": "ideas/b.md" } ] }
 * @endcode
 * Timestamps are epoch seconds or ISO-8601 UTC strings (date or date-time).
 */

#pragma once

#include <cstdint>
#include <string>

#include "domain/Note.hpp"

namespace notedrift::infrastructure {

class CorpusLoader {
public:
    /** @throws std::runtime_error on unreadable files or malformed entries. */
    static domain::CorpusSnapshot LoadFile(const std::string& path);

    static domain::CorpusSnapshot Parse(const std::string& jsonText);

    /** @brief "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM[:SS][Z]" to epoch seconds. */
    static std::int64_t ParseTimestamp(const std::string& text);
};

} // namespace notedrift::infrastructure
