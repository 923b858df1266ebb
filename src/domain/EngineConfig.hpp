/**
 * @file EngineConfig.hpp
 * @brief Tunables for every engine component. Loaded from settings.json.
 */

#pragma once

#include <cstddef>
#include <string>

namespace notedrift::domain {

struct EmbeddingConfig {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "nomic-embed-text";
    /// Share of the full embedding carried by the semantic sub-vector; temporal gets the rest.
    double semanticWeight = 0.9;
    int providerTimeoutMs = 30000;
    int providerMaxRetries = 2;
    /// Notes created up to this many days after the session date are tolerated.
    int ageSkewToleranceDays = 1;
};

struct ClusteringConfig {
    std::size_t minClusterSize = 5;
    std::size_t minSamples = 3;
    std::size_t labelTerms = 4;
    std::size_t labelCandidates = 8;
    std::size_t labelMaxFeatures = 100;
    double mmrLambda = 0.5;
    std::size_t labelContentChars = 200;
    std::size_t representativeCount = 3;
};

struct SimilarityConfig {
    double veryHigh = 0.80;
    double high = 0.65;
    double moderate = 0.50;
    double weak = 0.35;
    double noise = 0.15;
    double unlinkedPairThreshold = 0.5;
    /// Upper bound on notes scanned by unlinkedPairs; 0 scans the whole corpus.
    std::size_t unlinkedPairCandidateLimit = 0;
};

struct TrajectoryConfig {
    std::size_t velocityWindow = 3;
    double accelerationThreshold = 0.1;
    double convergenceThreshold = 0.15;
    std::size_t convergenceMinSessions = 3;
    double reversalHighSimilarity = 0.8;
    double reversalLowSimilarity = 0.3;
    double reversalAlignment = 0.5;
    /// Notes whose content drifted less than this (1 - cos) have no direction to compare.
    double reversalMinDrift = 1e-3;
    double decoupledBelow = 0.3;
    double opposingBelow = -0.5;
    double stronglyCorrelatedAbove = 0.7;
    double directionEpsilon = 1e-6;
    double cycleSimilarity = 0.7;
    std::size_t minCycles = 2;
    /// Staleness differences are divided by this many days before comparison.
    double stalenessScaleDays = 30.0;
};

struct DetectorConfig {
    int timeoutMs = 5000;
    int maxFailures = 3;
    std::size_t maxSuggestionsPerDetector = 5;
    /// Notes compared pairwise by trajectory_reversal; 0 compares the whole corpus.
    std::size_t reversalSampleLimit = 0;
};

struct MetricsConfig {
    /// Upper bound on notes used for pairwise statistics; 0 uses the whole corpus.
    std::size_t sampleLimit = 0;
};

struct StorageConfig {
    std::string databasePath; ///< Empty resolves to the XDG data home.
};

struct EngineConfig {
    EmbeddingConfig embedding;
    ClusteringConfig clustering;
    SimilarityConfig similarity;
    TrajectoryConfig trajectory;
    DetectorConfig detectors;
    MetricsConfig metrics;
    StorageConfig storage;
};

} // namespace notedrift::domain
