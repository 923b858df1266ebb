/**
 * @file SessionComputer.hpp
 * @brief Turns a corpus snapshot into one stored analysis session.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/ClusterEngine.hpp"
#include "application/TemporalCompositor.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/Deadline.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Note.hpp"
#include "domain/Session.hpp"
#include "infrastructure/SemanticCache.hpp"
#include "infrastructure/SessionStore.hpp"

namespace notedrift::application {

/** @brief A note left out of the session and why. */
struct NoteFailure {
    std::string noteId;
    std::string reason;
};

struct SessionReport {
    domain::CalendarDate date;
    std::size_t notesTotal = 0;
    std::size_t notesEmbedded = 0;
    std::vector<NoteFailure> failures;
    bool degenerateClustering = false;
    std::size_t clusterCount = 0;
    std::size_t noiseCount = 0;
};

/**
 * @class SessionComputer
 * @brief Semantic cache, temporal features, clustering and the atomic write, in that order.
 *
 * Per-note provider failures and clock skew drop the note from the session and
 * are reported. A passed deadline aborts the whole computation before anything
 * is written.
 */
class SessionComputer {
public:
    SessionComputer(std::shared_ptr<infrastructure::SemanticCache> cache,
                    std::shared_ptr<infrastructure::SessionStore> store,
                    const domain::EngineConfig& config);

    /**
     * @brief Computes and stores the session for a date.
     * @throws domain::SessionAlreadyExists when the date is taken and mode is RejectExisting.
     * @throws domain::DeadlineExceeded
     */
    SessionReport computeSession(const domain::CorpusSnapshot& corpus,
                                 const domain::CalendarDate& date,
                                 domain::WriteMode mode = domain::WriteMode::RejectExisting,
                                 const domain::Deadline& deadline = {});

    /** @brief Same computation without the write. */
    domain::SessionData buildSession(const domain::CorpusSnapshot& corpus,
                                     const domain::CalendarDate& date,
                                     SessionReport& report,
                                     const domain::Deadline& deadline = {});

    /** @brief Words, markdown headings and list items of a note body. */
    static domain::StructuralProfile Profile(const std::string& content, int outgoingLinks);

private:
    std::shared_ptr<infrastructure::SemanticCache> m_cache;
    std::shared_ptr<infrastructure::SessionStore> m_store;
    domain::EngineConfig m_config;
    TemporalCompositor m_compositor;
    ClusterEngine m_clusters;
};

} // namespace notedrift::application
