/**
 * @file MetricsService.hpp
 * @brief Aggregate statistics of one session's embedding space, cached per date.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/SimilarityGraphService.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Metrics.hpp"
#include "infrastructure/SessionStore.hpp"

namespace notedrift::application {

/**
 * @class MetricsService
 * @brief Computes EmbeddingMetrics over the whole corpus unless metrics.sample_limit says otherwise.
 *
 * Results are stored in the session store and reused until the caller forces
 * a recomputation.
 */
class MetricsService {
public:
    MetricsService(std::shared_ptr<infrastructure::SessionStore> store, const domain::MetricsConfig& config);

    /** @brief Cached metrics for the graph's session, computed and stored on first use. */
    domain::EmbeddingMetrics metricsFor(const SimilarityGraphService& graph, bool force = false);

    /** @brief Computes without touching the store. */
    domain::EmbeddingMetrics compute(const SimilarityGraphService& graph) const;

    /** @brief TwoNN maximum-likelihood estimate; 0 when fewer than three usable points. */
    static double TwoNNDimension(const std::vector<domain::Vector>& points);

    /** @brief Mean silhouette over clustered points, Euclidean distance; 0 with fewer than two clusters. */
    static double Silhouette(const std::vector<domain::Vector>& points, const std::vector<int>& labels);

    /** @brief Shannon entropy in bits of a size distribution. */
    static double Entropy(const std::vector<std::size_t>& sizes);

private:
    std::vector<std::string> sampleIds(const SimilarityGraphService& graph) const;

    std::shared_ptr<infrastructure::SessionStore> m_store;
    domain::MetricsConfig m_config;
};

} // namespace notedrift::application
