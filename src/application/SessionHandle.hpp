/**
 * @file SessionHandle.hpp
 * @brief Everything one analysis run needs, owned in one place.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/SimilarityCache.hpp"
#include "application/SimilarityGraphService.hpp"
#include "application/TrajectoryAnalyzer.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Note.hpp"
#include "domain/Session.hpp"
#include "infrastructure/SessionStore.hpp"

namespace notedrift::application {

/**
 * @class SessionHandle
 * @brief Run-scoped arena: session data, similarity cache, graph service and trajectories.
 *
 * Detectors and registry functions receive a const reference and may share it
 * across threads. Dropping the handle drops the run's similarity cache.
 */
class SessionHandle {
public:
    /**
     * @brief Loads a stored session and builds the run's services around it.
     * @throws domain::SessionNotFound
     */
    static std::shared_ptr<SessionHandle> Open(std::shared_ptr<infrastructure::SessionStore> store,
                                               const domain::EngineConfig& config,
                                               const domain::CalendarDate& date);

    const domain::CalendarDate& date() const { return m_session->date; }

    /** @brief YYYYMMDD; every random choice of the run derives from it. */
    std::uint32_t seed() const { return m_session->date.toSeed(); }

    const domain::SessionData& session() const { return *m_session; }
    const SimilarityGraphService& graph() const { return *m_graph; }
    const TrajectoryAnalyzer& trajectories() const { return *m_trajectories; }
    const domain::EngineConfig& config() const { return m_config; }
    const infrastructure::SessionStore& store() const { return *m_store; }

    /** @brief Stored note metadata keyed by id, for notes of this session. */
    const std::map<std::string, domain::Note>& notes() const { return m_notes; }

    /** @brief Latest stored session strictly before this one. */
    std::optional<domain::CalendarDate> previousSession() const { return m_previous; }

    /** @brief Cluster id to label for this session, noise excluded. */
    std::map<int, std::string> clusterLabels() const;

    /**
     * @brief Deterministic sample of k ids without replacement, in sampled order.
     *
     * The stream name separates independent consumers so they do not draw the
     * same sequence.
     */
    std::vector<std::string> sample(std::vector<std::string> ids, std::size_t k, const std::string& stream) const;

private:
    SessionHandle(std::shared_ptr<infrastructure::SessionStore> store,
                  const domain::EngineConfig& config,
                  std::shared_ptr<const domain::SessionData> session);

    std::shared_ptr<infrastructure::SessionStore> m_store;
    domain::EngineConfig m_config;
    std::shared_ptr<const domain::SessionData> m_session;
    std::shared_ptr<SimilarityCache> m_cache;
    std::unique_ptr<SimilarityGraphService> m_graph;
    std::unique_ptr<TrajectoryAnalyzer> m_trajectories;
    std::map<std::string, domain::Note> m_notes;
    std::optional<domain::CalendarDate> m_previous;
};

} // namespace notedrift::application
