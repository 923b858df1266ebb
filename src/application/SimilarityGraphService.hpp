/**
 * @file SimilarityGraphService.hpp
 * @brief Similarity and link-graph queries over one session.
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "application/SimilarityCache.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Session.hpp"

namespace notedrift::application {

/// Returned by ShortestPathLength when no directed path exists.
constexpr int kUnreachable = -1;

enum class SimilarityLevel {
    VeryHigh,
    High,
    Moderate,
    Weak,
    Noise,
    Unrelated
};

/**
 * @class SimilarityGraphService
 * @brief Read-only view of one session shared by every detector of a run.
 *
 * All similarity values, single or batched, go through the run's
 * SimilarityCache. Graph adjacency is built once at construction, so
 * every method is safe to call concurrently.
 */
class SimilarityGraphService {
public:
    /** @throws std::logic_error when the cache belongs to another session date. */
    SimilarityGraphService(std::shared_ptr<const domain::SessionData> session,
                           std::shared_ptr<SimilarityCache> cache,
                           const domain::SimilarityConfig& config);

    const std::vector<std::string>& NoteIds() const { return m_ids; }
    bool HasNote(const std::string& id) const { return m_index.count(id) > 0; }

    /** @brief Cosine similarity clipped to [0, 1]; 0 when either note lacks an embedding. */
    float Similarity(const std::string& a, const std::string& b) const;

    /** @brief result[i][j] == Similarity(rows[i], cols[j]); shares the memo with Similarity. */
    std::vector<std::vector<float>> BatchSimilarity(const std::vector<std::string>& rows,
                                                    const std::vector<std::string>& cols) const;

    /** @brief The k most similar other notes, best first. */
    std::vector<std::pair<std::string, float>> Neighbours(const std::string& id, std::size_t k) const;

    SimilarityLevel Classify(float similarity) const;

    /** @brief Number of other notes at or above threshold. */
    std::size_t CountAbove(const std::string& id, float threshold) const;

    /** @brief Share of a's similarities that are <= Similarity(a, b). */
    double PercentileRank(const std::string& a, const std::string& b) const;

    // Graph

    std::vector<std::string> OutgoingLinks(const std::string& id) const;
    std::vector<std::string> Backlinks(const std::string& id) const;
    bool HasLink(const std::string& from, const std::string& to) const;
    /** @brief Linked in either direction. */
    bool AreLinked(const std::string& a, const std::string& b) const;
    std::vector<std::string> GraphNeighbours(const std::string& id) const;

    /** @brief Distinct notes linked to or from id. */
    int Degree(const std::string& id) const;

    /** @brief Hops along outgoing links, or kUnreachable. Never throws. */
    int ShortestPathLength(const std::string& from, const std::string& to) const;

    /** @brief Node sequence from..to along outgoing links; empty when unreachable. */
    std::vector<std::string> ShortestPath(const std::string& from, const std::string& to) const;

    /** @brief Notes reachable within k outgoing hops, excluding id. */
    std::vector<std::string> KHopNeighbourhood(const std::string& id, int k) const;

    /** @brief Notes with the most distinct incoming links, best first. Notes without backlinks are skipped. */
    std::vector<std::string> Hubs(std::size_t k) const;

    /** @brief Notes with no link in either direction, most recently modified first. 0 returns all. */
    std::vector<std::string> Orphans(std::size_t k = 0) const;

    /** @brief Weakly connected components, largest first. */
    std::vector<std::vector<std::string>> ConnectedComponents() const;

    /** @brief Similar pairs (>= minSimilarity) sitting in different components. */
    std::vector<std::pair<std::string, std::string>> StructuralHoles(float minSimilarity) const;

    /**
     * @brief Most similar pairs with no link in either direction, best first.
     *
     * Scans every note unless similarity.unlinked_pair_candidate_limit is set,
     * in which case only the most recently modified notes are scanned.
     */
    std::vector<std::pair<std::string, std::string>> UnlinkedPairs(std::size_t k) const;

    /** @brief Notes UnlinkedPairs considers with the current configuration. */
    std::vector<std::string> UnlinkedPairCandidates() const;

    const SimilarityCache& Cache() const { return *m_cache; }
    const domain::SessionData& Session() const { return *m_session; }

private:
    float compute(const std::string& a, const std::string& b) const;
    std::vector<std::string> bfsPath(const std::string& from, const std::string& to) const;
    std::vector<std::string> allNodes() const;

    std::shared_ptr<const domain::SessionData> m_session;
    std::shared_ptr<SimilarityCache> m_cache;
    domain::SimilarityConfig m_config;

    std::vector<std::string> m_ids;
    std::unordered_map<std::string, std::size_t> m_index;
    std::vector<domain::Vector> m_unit;

    std::map<std::string, std::set<std::string>> m_outgoing;
    std::map<std::string, std::set<std::string>> m_incoming;

    mutable std::mutex m_neighbourMutex;
    mutable std::map<std::pair<std::string, std::size_t>, std::vector<std::pair<std::string, float>>> m_neighbourMemo;
};

} // namespace notedrift::application
