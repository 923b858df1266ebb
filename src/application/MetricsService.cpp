/**
 * @file MetricsService.cpp
 * @brief Implementation of MetricsService.
 */

#include "application/MetricsService.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

#include "infrastructure/SqliteDatabase.hpp"

namespace notedrift::application {

MetricsService::MetricsService(std::shared_ptr<infrastructure::SessionStore> store,
                               const domain::MetricsConfig& config)
    : m_store(std::move(store)), m_config(config) {
    if (!m_store) throw std::invalid_argument("MetricsService requires a session store");
}

domain::EmbeddingMetrics MetricsService::metricsFor(const SimilarityGraphService& graph, bool force) {
    const auto& date = graph.Session().date;
    if (!force) {
        if (auto cached = m_store->loadMetrics(date)) return *cached;
    }
    auto metrics = compute(graph);
    m_store->saveMetrics(metrics);
    std::cout << "[MetricsService] Stored metrics for " << date.toString()
              << " (" << metrics.noteCount << " notes)" << std::endl;
    return metrics;
}

std::vector<std::string> MetricsService::sampleIds(const SimilarityGraphService& graph) const {
    std::vector<std::string> ids = graph.NoteIds();
    if (m_config.sampleLimit == 0 || ids.size() <= m_config.sampleLimit) return ids;

    // Partial Fisher-Yates with the session seed; std distributions are not portable.
    std::mt19937 rng(graph.Session().date.toSeed());
    for (std::size_t i = 0; i < m_config.sampleLimit; ++i) {
        std::size_t j = i + static_cast<std::size_t>(rng() % (ids.size() - i));
        std::swap(ids[i], ids[j]);
    }
    ids.resize(m_config.sampleLimit);
    std::sort(ids.begin(), ids.end());
    return ids;
}

domain::EmbeddingMetrics MetricsService::compute(const SimilarityGraphService& graph) const {
    const auto& session = graph.Session();
    domain::EmbeddingMetrics m;
    m.sessionDate = session.date;
    m.noteCount = session.records.size();
    m.computedAt = infrastructure::SqliteDatabase::UtcTimestamp();

    // Cluster statistics always use every note.
    std::map<int, std::size_t> sizes;
    for (const auto& [id, record] : session.records) {
        if (record.clusterId == domain::kNoiseCluster) {
            ++m.noiseCount;
        } else {
            ++sizes[record.clusterId];
            m.clusterLabels.emplace(record.clusterId, record.clusterLabel);
        }
    }
    m.clusterCount = sizes.size();
    if (m.noteCount > 0) {
        m.gapPercent = 100.0 * static_cast<double>(m.noiseCount) / static_cast<double>(m.noteCount);
    }
    std::vector<std::size_t> sizeList;
    for (const auto& [cid, count] : sizes) sizeList.push_back(count);
    m.shannonEntropy = Entropy(sizeList);

    auto ids = sampleIds(graph);
    if (ids.size() < 2) return m;

    // Pairwise similarity row by row through the run cache.
    double sum = 0.0;
    double sumSq = 0.0;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
        std::vector<std::string> cols(ids.begin() + static_cast<std::ptrdiff_t>(i + 1), ids.end());
        auto row = graph.BatchSimilarity({ids[i]}, cols);
        for (float v : row.front()) {
            sum += v;
            sumSq += static_cast<double>(v) * v;
            ++pairs;
        }
    }
    m.meanSimilarity = sum / static_cast<double>(pairs);
    double variance = sumSq / static_cast<double>(pairs) - m.meanSimilarity * m.meanSimilarity;
    m.stdSimilarity = std::sqrt(std::max(0.0, variance));
    m.diversity = 1.0 - m.meanSimilarity;

    std::vector<domain::Vector> points;
    std::vector<int> labels;
    points.reserve(ids.size());
    for (const auto& id : ids) {
        const auto& record = session.records.at(id);
        points.push_back(record.embedding);
        labels.push_back(record.clusterId);
    }
    m.intrinsicDimension = TwoNNDimension(points);
    m.silhouette = Silhouette(points, labels);
    return m;
}

double MetricsService::TwoNNDimension(const std::vector<domain::Vector>& points) {
    if (points.size() < 3) return 0.0;
    double logSum = 0.0;
    std::size_t used = 0;
    for (std::size_t i = 0; i < points.size(); ++i) {
        double r1 = std::numeric_limits<double>::infinity();
        double r2 = std::numeric_limits<double>::infinity();
        for (std::size_t j = 0; j < points.size(); ++j) {
            if (i == j) continue;
            double d = domain::EuclideanDistance(points[i], points[j]);
            if (d < r1) {
                r2 = r1;
                r1 = d;
            } else if (d < r2) {
                r2 = d;
            }
        }
        // Duplicates give r1 == 0 and carry no information.
        if (r1 <= 0.0 || !std::isfinite(r2)) continue;
        logSum += std::log(r2 / r1);
        ++used;
    }
    if (used < 3 || logSum <= 0.0) return 0.0;
    return static_cast<double>(used) / logSum;
}

double MetricsService::Silhouette(const std::vector<domain::Vector>& points, const std::vector<int>& labels) {
    if (points.size() != labels.size()) return 0.0;

    std::map<int, std::vector<std::size_t>> members;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] != domain::kNoiseCluster) members[labels[i]].push_back(i);
    }
    if (members.size() < 2) return 0.0;

    double total = 0.0;
    std::size_t counted = 0;
    for (const auto& [cid, own] : members) {
        for (std::size_t i : own) {
            ++counted;
            if (own.size() < 2) continue; // singleton clusters score 0

            double a = 0.0;
            for (std::size_t j : own) {
                if (j != i) a += domain::EuclideanDistance(points[i], points[j]);
            }
            a /= static_cast<double>(own.size() - 1);

            double b = std::numeric_limits<double>::infinity();
            for (const auto& [other, theirs] : members) {
                if (other == cid) continue;
                double d = 0.0;
                for (std::size_t j : theirs) d += domain::EuclideanDistance(points[i], points[j]);
                b = std::min(b, d / static_cast<double>(theirs.size()));
            }

            double denom = std::max(a, b);
            if (denom > 0.0) total += (b - a) / denom;
        }
    }
    return counted == 0 ? 0.0 : total / static_cast<double>(counted);
}

double MetricsService::Entropy(const std::vector<std::size_t>& sizes) {
    double n = 0.0;
    for (auto s : sizes) n += static_cast<double>(s);
    if (n <= 0.0) return 0.0;
    double h = 0.0;
    for (auto s : sizes) {
        if (s == 0) continue;
        double p = static_cast<double>(s) / n;
        h -= p * std::log2(p);
    }
    return h;
}

} // namespace notedrift::application
