/**
 * @file SessionHandle.cpp
 * @brief Implementation of SessionHandle.
 */

#include "application/SessionHandle.hpp"

#include <random>
#include <stdexcept>

namespace notedrift::application {

namespace {

// FNV-1a; std::hash is not stable across standard libraries.
std::uint32_t StreamHash(const std::string& text) {
    std::uint32_t h = 2166136261u;
    for (unsigned char c : text) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

} // namespace

SessionHandle::SessionHandle(std::shared_ptr<infrastructure::SessionStore> store,
                             const domain::EngineConfig& config,
                             std::shared_ptr<const domain::SessionData> session)
    : m_store(std::move(store)), m_config(config), m_session(std::move(session)) {
    m_cache = std::make_shared<SimilarityCache>(m_session->date);
    m_graph = std::make_unique<SimilarityGraphService>(m_session, m_cache, m_config.similarity);
    m_trajectories = std::make_unique<TrajectoryAnalyzer>(m_store, m_session->date, m_config.trajectory);

    std::vector<std::string> ids;
    ids.reserve(m_session->records.size());
    for (const auto& [id, record] : m_session->records) ids.push_back(id);
    if (!ids.empty()) m_notes = m_store->loadNotes(ids);

    auto earlier = m_store->sessionsBetween(domain::CalendarDate::fromDays(0),
                                            domain::CalendarDate::fromDays(m_session->date.toDays() - 1));
    if (!earlier.empty()) m_previous = earlier.back();
}

std::shared_ptr<SessionHandle> SessionHandle::Open(std::shared_ptr<infrastructure::SessionStore> store,
                                                   const domain::EngineConfig& config,
                                                   const domain::CalendarDate& date) {
    if (!store) throw std::invalid_argument("SessionHandle requires a session store");
    auto session = std::make_shared<const domain::SessionData>(store->readSession(date));
    return std::shared_ptr<SessionHandle>(new SessionHandle(std::move(store), config, std::move(session)));
}

std::map<int, std::string> SessionHandle::clusterLabels() const {
    std::map<int, std::string> labels;
    for (const auto& [id, record] : m_session->records) {
        if (record.clusterId != domain::kNoiseCluster) labels.emplace(record.clusterId, record.clusterLabel);
    }
    return labels;
}

std::vector<std::string> SessionHandle::sample(std::vector<std::string> ids, std::size_t k,
                                               const std::string& stream) const {
    if (k >= ids.size()) return ids;
    std::mt19937 rng(seed() ^ StreamHash(stream));
    for (std::size_t i = 0; i < k; ++i) {
        std::size_t j = i + static_cast<std::size_t>(rng() % (ids.size() - i));
        std::swap(ids[i], ids[j]);
    }
    ids.resize(k);
    return ids;
}

} // namespace notedrift::application
