/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/PathUtils.hpp"

namespace notedrift::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void readValue(const json& section, const char* sectionName, const char* key, T& target,
               const std::function<bool(const T&)>& valid = nullptr) {
    if (!section.contains(key)) return;
    try {
        T value = section.at(key).get<T>();
        if (valid && !valid(value)) {
            std::cerr << "[ConfigLoader] Ignoring out-of-range " << sectionName << "." << key << std::endl;
            return;
        }
        target = value;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring " << sectionName << "." << key << ": " << e.what() << std::endl;
    }
}

// Counts go through a signed read so that a negative value is rejected instead of wrapping.
void readCount(const json& section, const char* sectionName, const char* key, std::size_t& target,
               std::size_t minimum = 0) {
    std::int64_t value = static_cast<std::int64_t>(target);
    readValue<std::int64_t>(section, sectionName, key, value,
                            [minimum](const std::int64_t& v) { return v >= 0 && static_cast<std::uint64_t>(v) >= minimum; });
    target = static_cast<std::size_t>(value);
}

const json& sectionOf(const json& root, const char* name) {
    static const json kEmpty = json::object();
    if (root.contains(name) && root[name].is_object()) return root[name];
    return kEmpty;
}

bool unitInterval(const double& v) { return v >= 0.0 && v <= 1.0; }
bool correlation(const double& v) { return v >= -1.0 && v <= 1.0; }
bool positive(const double& v) { return v > 0.0; }
bool positiveInt(const int& v) { return v > 0; }
bool nonNegativeInt(const int& v) { return v >= 0; }

} // namespace

domain::EngineConfig ConfigLoader::Load(const std::string& path) {
    domain::EngineConfig cfg;
    if (!std::filesystem::exists(path)) {
        return cfg;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return cfg;
    }

    const json& emb = sectionOf(j, "embedding");
    readValue<std::string>(emb, "embedding", "host", cfg.embedding.host);
    readValue<int>(emb, "embedding", "port", cfg.embedding.port, positiveInt);
    readValue<std::string>(emb, "embedding", "model", cfg.embedding.model);
    readValue<double>(emb, "embedding", "semantic_weight", cfg.embedding.semanticWeight,
                      [](const double& v) { return v > 0.0 && v < 1.0; });
    readValue<int>(emb, "embedding", "provider_timeout_ms", cfg.embedding.providerTimeoutMs, positiveInt);
    readValue<int>(emb, "embedding", "provider_max_retries", cfg.embedding.providerMaxRetries, nonNegativeInt);
    readValue<int>(emb, "embedding", "age_skew_tolerance_days", cfg.embedding.ageSkewToleranceDays, nonNegativeInt);

    const json& cl = sectionOf(j, "clustering");
    readCount(cl, "clustering", "min_cluster_size", cfg.clustering.minClusterSize, 2);
    readCount(cl, "clustering", "min_samples", cfg.clustering.minSamples, 1);
    readCount(cl, "clustering", "label_terms", cfg.clustering.labelTerms, 1);
    readCount(cl, "clustering", "label_candidates", cfg.clustering.labelCandidates, 1);
    readCount(cl, "clustering", "label_max_features", cfg.clustering.labelMaxFeatures, 1);
    readValue<double>(cl, "clustering", "mmr_lambda", cfg.clustering.mmrLambda, unitInterval);
    readCount(cl, "clustering", "label_content_chars", cfg.clustering.labelContentChars);
    readCount(cl, "clustering", "representative_count", cfg.clustering.representativeCount, 1);

    const json& sim = sectionOf(j, "similarity");
    readValue<double>(sim, "similarity", "very_high", cfg.similarity.veryHigh, unitInterval);
    readValue<double>(sim, "similarity", "high", cfg.similarity.high, unitInterval);
    readValue<double>(sim, "similarity", "moderate", cfg.similarity.moderate, unitInterval);
    readValue<double>(sim, "similarity", "weak", cfg.similarity.weak, unitInterval);
    readValue<double>(sim, "similarity", "noise", cfg.similarity.noise, unitInterval);
    readValue<double>(sim, "similarity", "unlinked_pair_threshold", cfg.similarity.unlinkedPairThreshold, unitInterval);
    readCount(sim, "similarity", "unlinked_pair_candidate_limit", cfg.similarity.unlinkedPairCandidateLimit);

    const json& tr = sectionOf(j, "trajectory");
    readCount(tr, "trajectory", "velocity_window", cfg.trajectory.velocityWindow, 2);
    readValue<double>(tr, "trajectory", "acceleration_threshold", cfg.trajectory.accelerationThreshold);
    readValue<double>(tr, "trajectory", "convergence_threshold", cfg.trajectory.convergenceThreshold, unitInterval);
    readCount(tr, "trajectory", "convergence_min_sessions", cfg.trajectory.convergenceMinSessions, 2);
    readValue<double>(tr, "trajectory", "reversal_high_similarity", cfg.trajectory.reversalHighSimilarity, unitInterval);
    readValue<double>(tr, "trajectory", "reversal_low_similarity", cfg.trajectory.reversalLowSimilarity, unitInterval);
    readValue<double>(tr, "trajectory", "reversal_alignment", cfg.trajectory.reversalAlignment, unitInterval);
    readValue<double>(tr, "trajectory", "reversal_min_drift", cfg.trajectory.reversalMinDrift, unitInterval);
    readValue<double>(tr, "trajectory", "decoupled_below", cfg.trajectory.decoupledBelow, unitInterval);
    readValue<double>(tr, "trajectory", "opposing_below", cfg.trajectory.opposingBelow, correlation);
    readValue<double>(tr, "trajectory", "strongly_correlated_above", cfg.trajectory.stronglyCorrelatedAbove, correlation);
    readValue<double>(tr, "trajectory", "direction_epsilon", cfg.trajectory.directionEpsilon,
                      [](const double& v) { return v >= 0.0; });
    readValue<double>(tr, "trajectory", "cycle_similarity", cfg.trajectory.cycleSimilarity, unitInterval);
    readCount(tr, "trajectory", "min_cycles", cfg.trajectory.minCycles, 1);
    readValue<double>(tr, "trajectory", "staleness_scale_days", cfg.trajectory.stalenessScaleDays, positive);

    const json& det = sectionOf(j, "detectors");
    readValue<int>(det, "detectors", "timeout_ms", cfg.detectors.timeoutMs, positiveInt);
    readValue<int>(det, "detectors", "max_failures", cfg.detectors.maxFailures, positiveInt);
    readCount(det, "detectors", "max_suggestions_per_detector", cfg.detectors.maxSuggestionsPerDetector, 1);
    readCount(det, "detectors", "reversal_sample_limit", cfg.detectors.reversalSampleLimit);

    const json& met = sectionOf(j, "metrics");
    readCount(met, "metrics", "sample_limit", cfg.metrics.sampleLimit);

    const json& st = sectionOf(j, "storage");
    readValue<std::string>(st, "storage", "database_path", cfg.storage.databasePath);

    return cfg;
}

bool ConfigLoader::Save(const std::string& path, const domain::EngineConfig& cfg) {
    json j;
    j["embedding"] = {
        {"host", cfg.embedding.host},
        {"port", cfg.embedding.port},
        {"model", cfg.embedding.model},
        {"semantic_weight", cfg.embedding.semanticWeight},
        {"provider_timeout_ms", cfg.embedding.providerTimeoutMs},
        {"provider_max_retries", cfg.embedding.providerMaxRetries},
        {"age_skew_tolerance_days", cfg.embedding.ageSkewToleranceDays}
    };
    j["clustering"] = {
        {"min_cluster_size", cfg.clustering.minClusterSize},
        {"min_samples", cfg.clustering.minSamples},
        {"label_terms", cfg.clustering.labelTerms},
        {"label_candidates", cfg.clustering.labelCandidates},
        {"label_max_features", cfg.clustering.labelMaxFeatures},
        {"mmr_lambda", cfg.clustering.mmrLambda},
        {"label_content_chars", cfg.clustering.labelContentChars},
        {"representative_count", cfg.clustering.representativeCount}
    };
    j["similarity"] = {
        {"very_high", cfg.similarity.veryHigh},
        {"high", cfg.similarity.high},
        {"moderate", cfg.similarity.moderate},
        {"weak", cfg.similarity.weak},
        {"noise", cfg.similarity.noise},
        {"unlinked_pair_threshold", cfg.similarity.unlinkedPairThreshold},
        {"unlinked_pair_candidate_limit", cfg.similarity.unlinkedPairCandidateLimit}
    };
    j["trajectory"] = {
        {"velocity_window", cfg.trajectory.velocityWindow},
        {"acceleration_threshold", cfg.trajectory.accelerationThreshold},
        {"convergence_threshold", cfg.trajectory.convergenceThreshold},
        {"convergence_min_sessions", cfg.trajectory.convergenceMinSessions},
        {"reversal_high_similarity", cfg.trajectory.reversalHighSimilarity},
        {"reversal_low_similarity", cfg.trajectory.reversalLowSimilarity},
        {"reversal_alignment", cfg.trajectory.reversalAlignment},
        {"reversal_min_drift", cfg.trajectory.reversalMinDrift},
        {"decoupled_below", cfg.trajectory.decoupledBelow},
        {"opposing_below", cfg.trajectory.opposingBelow},
        {"strongly_correlated_above", cfg.trajectory.stronglyCorrelatedAbove},
        {"direction_epsilon", cfg.trajectory.directionEpsilon},
        {"cycle_similarity", cfg.trajectory.cycleSimilarity},
        {"min_cycles", cfg.trajectory.minCycles},
        {"staleness_scale_days", cfg.trajectory.stalenessScaleDays}
    };
    j["detectors"] = {
        {"timeout_ms", cfg.detectors.timeoutMs},
        {"max_failures", cfg.detectors.maxFailures},
        {"max_suggestions_per_detector", cfg.detectors.maxSuggestionsPerDetector},
        {"reversal_sample_limit", cfg.detectors.reversalSampleLimit}
    };
    j["metrics"] = {{"sample_limit", cfg.metrics.sampleLimit}};
    j["storage"] = {{"database_path", cfg.storage.databasePath}};

    try {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        std::ofstream f(path);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << " for writing" << std::endl;
            return false;
        }
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

std::string ConfigLoader::DefaultPath() {
    return (PathUtils::GetConfigHome() / "NoteDrift" / "settings.json").string();
}

} // namespace notedrift::infrastructure
