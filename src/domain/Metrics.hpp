/**
 * @file Metrics.hpp
 * @brief Aggregate statistics describing one session's embedding space.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "domain/CalendarDate.hpp"

namespace notedrift::domain {

struct EmbeddingMetrics {
    CalendarDate sessionDate;
    std::size_t noteCount = 0;
    double meanSimilarity = 0.0;
    double stdSimilarity = 0.0;
    double diversity = 0.0;          ///< 1 - mean pairwise similarity.
    double intrinsicDimension = 0.0; ///< TwoNN estimate; 0 when undefined.
    std::size_t clusterCount = 0;
    std::size_t noiseCount = 0;
    double gapPercent = 0.0;         ///< Share of notes left as noise, in percent.
    double shannonEntropy = 0.0;     ///< Over the cluster size distribution, in bits.
    double silhouette = 0.0;
    std::map<int, std::string> clusterLabels;
    std::string computedAt;
};

} // namespace notedrift::domain
