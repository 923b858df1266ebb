/**
 * @file ClusterEngine.hpp
 * @brief Density-based hierarchical clustering (HDBSCAN) of session embeddings.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/Deadline.hpp"
#include "domain/Embedding.hpp"
#include "domain/EngineConfig.hpp"

namespace notedrift::application {

/**
 * @struct ClusterInput
 * @brief One note to cluster: its full embedding and the text used for labels.
 */
struct ClusterInput {
    std::string noteId;
    domain::Vector embedding;
    std::string labelText; ///< Title followed by a content prefix.
};

struct ClusterInfo {
    int id = 0;
    std::vector<std::string> members;          ///< Sorted note ids.
    std::vector<std::string> terms;            ///< Label terms, most relevant first.
    std::string label;                         ///< "a, b, c"
    std::string formattedLabel;                ///< "Notes about a, b, and c"
    domain::Vector centroid;
    std::vector<std::string> representatives;  ///< Members closest to the centroid.
};

/**
 * @struct ClusterResult
 * @brief Cluster assignments of one session. Ids mean nothing across sessions.
 */
struct ClusterResult {
    std::map<std::string, int> assignments; ///< Note id to cluster id or kNoiseCluster.
    std::map<int, ClusterInfo> clusters;
    bool degenerate = false;                ///< Too few notes; everything is noise.

    /** @brief Cluster id, or kNoiseCluster for noise and unknown notes. */
    int clusterOf(const std::string& noteId) const;

    /** @brief Label of a cluster; empty for noise and unknown ids. */
    std::string labelOf(int clusterId) const;

    std::size_t noiseCount() const;
};

/**
 * @class ClusterEngine
 * @brief HDBSCAN with excess-of-mass cluster selection.
 *
 * Core distances use the min_samples-th nearest neighbour (the point itself
 * counted). The root of the condensed tree is never selected, so a single
 * undifferentiated blob comes back as noise.
 */
class ClusterEngine {
public:
    explicit ClusterEngine(const domain::ClusteringConfig& config);

    /**
     * @brief Clusters and labels the given notes.
     * @throws domain::DeadlineExceeded when the deadline passes mid-way.
     */
    ClusterResult cluster(std::vector<ClusterInput> inputs, const domain::Deadline& deadline = {}) const;

    /** @brief Raw labels per point (0..k-1 or kNoiseCluster), in input order. */
    std::vector<int> hdbscan(const std::vector<domain::Vector>& points, const domain::Deadline& deadline = {}) const;

private:
    domain::ClusteringConfig m_config;
};

} // namespace notedrift::application
