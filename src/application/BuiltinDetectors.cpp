/**
 * @file BuiltinDetectors.cpp
 * @brief Implementation of the shipped detectors.
 */

#include "application/BuiltinDetectors.hpp"

#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace notedrift::application {

namespace {

std::string TitleOf(const SessionHandle& handle, const std::string& id) {
    auto it = handle.notes().find(id);
    if (it == handle.notes().end() || it->second.title.empty()) return id;
    return it->second.title;
}

std::string Fixed(double value, int precision = 2) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

} // namespace

namespace detectors {

std::vector<domain::Suggestion> DriftVelocityAnomaly(const SessionHandle& handle) {
    const auto& trajectories = handle.trajectories();
    std::vector<domain::Suggestion> out;
    for (const auto& id : handle.graph().NoteIds()) {
        auto acc = trajectories.acceleration(id);
        if (acc.trend == Trend::SpeedingUp) {
            out.push_back({"'" + TitleOf(handle, id) + "' is changing faster than before (" +
                               Fixed(acc.earlyVelocity) + " -> " + Fixed(acc.lateVelocity) + " per session).",
                           {id}, "", acc.acceleration});
        } else if (acc.trend == Trend::SlowingDown) {
            out.push_back({"'" + TitleOf(handle, id) + "' has settled down after a period of change.",
                           {id}, "", -acc.acceleration * 0.5});
        }
        if (trajectories.isCycling(id)) {
            out.push_back({"'" + TitleOf(handle, id) + "' keeps coming back to where it started.", {id}, "", 0.1});
        }
    }
    return out;
}

std::vector<domain::Suggestion> BridgeHunter(const SessionHandle& handle) {
    const auto& graph = handle.graph();
    std::vector<domain::Suggestion> out;
    for (const auto& [a, b] : graph.UnlinkedPairs(handle.config().detectors.maxSuggestionsPerDetector)) {
        float sim = graph.Similarity(a, b);
        out.push_back({"'" + TitleOf(handle, a) + "' and '" + TitleOf(handle, b) +
                           "' are close in meaning (" + Fixed(sim) + ") but not linked.",
                       {a, b}, "", sim});
    }

    if (auto previous = handle.previousSession()) {
        for (const auto& link : handle.trajectories().removedLinks(*previous, handle.date())) {
            if (!graph.HasNote(link.source) || !graph.HasNote(link.target)) continue;
            float sim = graph.Similarity(link.source, link.target);
            if (sim < handle.config().similarity.unlinkedPairThreshold) continue;
            out.push_back({"The link from '" + TitleOf(handle, link.source) + "' to '" +
                               TitleOf(handle, link.target) + "' was removed, yet they are still similar (" +
                               Fixed(sim) + ").",
                           {link.source, link.target}, "", sim});
        }
    }
    return out;
}

std::vector<domain::Suggestion> ClusterMigrationDetector(const SessionHandle& handle) {
    std::vector<domain::Suggestion> out;
    auto previous = handle.previousSession();
    if (!previous) return out;

    for (const auto& move : handle.trajectories().clusterMigrations(*previous, handle.date())) {
        std::string to = move.toLabel.empty() ? "no cluster at all" : "'" + move.toLabel + "'";
        out.push_back({"'" + TitleOf(handle, move.noteId) + "' moved from '" + move.fromLabel + "' to " + to + ".",
                       {move.noteId}, "", move.toLabel.empty() ? 0.5 : 1.0});
    }
    return out;
}

std::vector<domain::Suggestion> TrajectoryReversalDetector(const SessionHandle& handle) {
    const auto& trajectories = handle.trajectories();
    // Pairs are checked exhaustively, over a seeded sample only when a limit is configured.
    const std::size_t limit = handle.config().detectors.reversalSampleLimit;
    auto ids = handle.graph().NoteIds();
    if (limit > 0) {
        ids = handle.sample(ids, limit, "trajectory_reversal");
        std::set<std::string> sorted(ids.begin(), ids.end());
        ids.assign(sorted.begin(), sorted.end());
    }

    std::vector<domain::Suggestion> out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        for (std::size_t j = i + 1; j < ids.size(); ++j) {
            auto rev = trajectories.trajectoryReversal(ids[i], ids[j]);
            const std::string a = TitleOf(handle, ids[i]);
            const std::string b = TitleOf(handle, ids[j]);
            if (rev.kind == ReversalKind::CloseDiverging) {
                out.push_back({"'" + a + "' and '" + b + "' are still close (" + Fixed(rev.currentSimilarity) +
                                   ") but are drifting apart.",
                               {ids[i], ids[j]}, "", std::fabs(rev.alignment)});
            } else if (rev.kind == ReversalKind::DistantConverging) {
                out.push_back({"'" + a + "' and '" + b + "' are far apart (" + Fixed(rev.currentSimilarity) +
                                   ") but are heading the same way.",
                               {ids[i], ids[j]}, "", std::fabs(rev.alignment)});
            }
        }
    }
    return out;
}

} // namespace detectors

void RegisterBuiltinDetectors(DetectorRegistry& registry) {
    registry.add("drift_velocity_anomaly", "Notes whose rate of change shifted", &detectors::DriftVelocityAnomaly);
    registry.add("bridge_hunter", "Similar notes without a link", &detectors::BridgeHunter);
    registry.add("cluster_migration", "Notes that changed topic cluster", &detectors::ClusterMigrationDetector);
    registry.add("trajectory_reversal", "Pairs moving against their current closeness",
                 &detectors::TrajectoryReversalDetector);
}

} // namespace notedrift::application
