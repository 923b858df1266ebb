/**
 * @file TrajectoryAnalyzer.hpp
 * @brief How notes and note pairs move through embedding space across sessions.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "domain/CalendarDate.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Session.hpp"
#include "infrastructure/SessionStore.hpp"

namespace notedrift::application {

/** @brief A note's record in one session. */
struct Snapshot {
    domain::CalendarDate date;
    domain::SessionRecord record;
};

enum class Trend {
    InsufficientData,
    SpeedingUp,
    SlowingDown,
    Steady
};

struct AccelerationResult {
    Trend trend = Trend::InsufficientData;
    double earlyVelocity = 0.0;
    double lateVelocity = 0.0;
    double acceleration = 0.0; ///< lateVelocity - earlyVelocity.
};

enum class PairTrend {
    InsufficientData,
    Converging,
    Diverging,
    Stable
};

enum class ReversalKind {
    InsufficientData,
    None,
    CloseDiverging,    ///< Similar now, drifting in opposite directions.
    DistantConverging  ///< Dissimilar now, drifting the same way.
};

struct ReversalResult {
    ReversalKind kind = ReversalKind::InsufficientData;
    double currentSimilarity = 0.0;
    double alignment = 0.0; ///< Dot product of the two unit drift directions.
};

/** @brief Spaces in which a pair's similarity is tracked over time. */
enum class TrajectoryDimension {
    Semantic,   ///< Cosine similarity of the full embeddings.
    Graph,      ///< 1 / (1 + link distance), 0 when unreachable.
    Structural, ///< Cosine similarity of log-scaled structural profiles.
    Staleness   ///< 1 / (1 + |staleness difference| / scale).
};

enum class Coupling {
    InsufficientData,
    Decoupled,
    Opposing,
    StronglyCorrelated,
    WeaklyCorrelated
};

struct CorrelationResult {
    Coupling coupling = Coupling::InsufficientData;
    double correlation = 0.0;
    std::size_t steps = 0;
};

struct ClusterMigration {
    std::string noteId;
    std::string fromLabel;
    std::string toLabel;
};

/**
 * @class TrajectoryAnalyzer
 * @brief Pure functions over the stored sessions up to one date.
 *
 * Store reads are memoized per instance; the instance belongs to one run.
 */
class TrajectoryAnalyzer {
public:
    TrajectoryAnalyzer(std::shared_ptr<const infrastructure::SessionStore> store,
                       const domain::CalendarDate& upTo,
                       const domain::TrajectoryConfig& config);

    /** @brief Ascending snapshots of one note up to the analysis date. */
    std::vector<Snapshot> snapshots(const std::string& noteId) const;

    /** @brief 1 - cos(first, last). 0 for one session, nullopt for none. */
    std::optional<double> drift(const std::string& noteId) const;

    /** @brief Same, restricted to the given sessions. */
    std::optional<double> drift(const std::string& noteId, const std::vector<domain::CalendarDate>& sessions) const;

    /** @brief 1 - cos of the semantic sub-vectors of the first and last snapshot; nullopt with fewer than two. */
    std::optional<double> semanticDrift(const std::string& noteId) const;

    /** @brief Unit vector from the first to the last semantic sub-vector; empty when content did not move. */
    domain::Vector driftDirection(const std::string& noteId) const;

    /** @brief 1 - cos(start, end) for each sliding window of the given size. */
    std::vector<double> windowedDriftRates(const std::string& noteId, std::size_t window) const;

    /** @brief Mean per-step change (1 - cos of consecutive snapshots) inside each sliding window. */
    std::vector<double> velocity(const std::string& noteId, std::size_t window) const;
    std::vector<double> velocity(const std::string& noteId) const;

    /** @brief Late-window velocity minus early-window velocity. */
    AccelerationResult acceleration(const std::string& noteId) const;

    /** @brief Cosine similarity of a and b at every session holding both. */
    std::vector<std::pair<domain::CalendarDate, double>> similarityTrajectory(const std::string& a,
                                                                              const std::string& b) const;

    /** @brief Early-half versus late-half mean similarity. */
    PairTrend convergence(const std::string& a, const std::string& b) const;

    /**
     * @brief Current closeness against the direction the two notes' content is moving.
     *
     * A note whose semantic drift is below reversal_min_drift has no direction, so the
     * pair is reported as None.
     */
    ReversalResult trajectoryReversal(const std::string& a, const std::string& b) const;

    /** @brief Pair similarity in one dimension at every session holding both notes. */
    std::vector<double> dimensionSeries(const std::string& a, const std::string& b, TrajectoryDimension dim) const;

    /**
     * @brief Whether the pair moves together in two spaces.
     * @throws std::invalid_argument when dimX == dimY.
     */
    CorrelationResult correlatedMovement(const std::string& a, const std::string& b,
                                         TrajectoryDimension dimX, TrajectoryDimension dimY) const;

    /** @brief Returns to its first state at least min_cycles times. */
    bool isCycling(const std::string& noteId) const;

    /** @brief Notes whose cluster label changed between two sessions, ignoring moves out of noise. */
    std::vector<ClusterMigration> clusterMigrations(const domain::CalendarDate& from,
                                                    const domain::CalendarDate& to) const;

    /** @brief Links present at from and gone at to. */
    std::vector<domain::Link> removedLinks(const domain::CalendarDate& from, const domain::CalendarDate& to) const;

    const domain::CalendarDate& upTo() const { return m_upTo; }

    ReversalKind classifyReversal(double currentSimilarity, double alignment) const;
    Coupling classifyCorrelation(double r) const;

    /** @brief +1 / -1 / 0 per consecutive step; |change| <= epsilon counts as 0. */
    static std::vector<double> DirectionSigns(const std::vector<double>& series, double epsilon);

    /** @brief Pearson correlation; nullopt for mismatched lengths, fewer than two points or zero variance. */
    static std::optional<double> Pearson(const std::vector<double>& x, const std::vector<double>& y);

private:
    using Adjacency = std::map<std::string, std::set<std::string>>;

    std::shared_ptr<const Adjacency> linksAt(const domain::CalendarDate& date) const;
    std::vector<std::pair<Snapshot, Snapshot>> sharedSnapshots(const std::string& a, const std::string& b) const;
    double pairValue(const Snapshot& a, const Snapshot& b, TrajectoryDimension dim) const;
    static int hops(const Adjacency& adjacency, const std::string& from, const std::string& to);

    std::shared_ptr<const infrastructure::SessionStore> m_store;
    domain::CalendarDate m_upTo;
    domain::TrajectoryConfig m_config;

    mutable std::mutex m_mutex;
    mutable std::map<std::string, std::vector<Snapshot>> m_snapshots;
    mutable std::map<std::string, std::shared_ptr<const Adjacency>> m_links;
};

} // namespace notedrift::application
