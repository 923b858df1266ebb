/**
 * @file TrajectoryAnalyzer.cpp
 * @brief Implementation of TrajectoryAnalyzer.
 */

#include "application/TrajectoryAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>
#include <stdexcept>

#include "application/TemporalCompositor.hpp"

namespace notedrift::application {

namespace {

double stepChange(const domain::Vector& a, const domain::Vector& b) {
    return 1.0 - domain::Cosine(a, b);
}

double mean(const std::vector<double>& values, std::size_t begin, std::size_t end) {
    if (end <= begin) return 0.0;
    double sum = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(begin),
                                 values.begin() + static_cast<std::ptrdiff_t>(end), 0.0);
    return sum / static_cast<double>(end - begin);
}

domain::Vector structuralVector(const domain::StructuralProfile& p) {
    return {static_cast<float>(std::log1p(p.wordCount)), static_cast<float>(std::log1p(p.headingCount)),
            static_cast<float>(std::log1p(p.listItemCount)), static_cast<float>(std::log1p(p.outgoingLinkCount))};
}

} // namespace

TrajectoryAnalyzer::TrajectoryAnalyzer(std::shared_ptr<const infrastructure::SessionStore> store,
                                       const domain::CalendarDate& upTo,
                                       const domain::TrajectoryConfig& config)
    : m_store(std::move(store)), m_upTo(upTo), m_config(config) {
    if (!m_store) throw std::invalid_argument("TrajectoryAnalyzer requires a session store");
}

std::vector<Snapshot> TrajectoryAnalyzer::snapshots(const std::string& noteId) const {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_snapshots.find(noteId);
        if (it != m_snapshots.end()) return it->second;
    }

    std::vector<Snapshot> loaded;
    for (auto& [date, record] : m_store->noteHistory(noteId, m_upTo)) {
        loaded.push_back({date, std::move(record)});
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshots.emplace(noteId, std::move(loaded)).first->second;
}

std::optional<double> TrajectoryAnalyzer::drift(const std::string& noteId) const {
    auto snaps = snapshots(noteId);
    if (snaps.empty()) return std::nullopt;
    if (snaps.size() < 2) return 0.0;
    return stepChange(snaps.front().record.embedding, snaps.back().record.embedding);
}

std::optional<double> TrajectoryAnalyzer::drift(const std::string& noteId,
                                                const std::vector<domain::CalendarDate>& sessions) const {
    std::set<domain::CalendarDate> wanted(sessions.begin(), sessions.end());
    std::vector<Snapshot> picked;
    for (auto& s : snapshots(noteId)) {
        if (wanted.count(s.date)) picked.push_back(std::move(s));
    }
    if (picked.empty()) return std::nullopt;
    if (picked.size() < 2) return 0.0;
    return stepChange(picked.front().record.embedding, picked.back().record.embedding);
}

std::optional<double> TrajectoryAnalyzer::semanticDrift(const std::string& noteId) const {
    auto snaps = snapshots(noteId);
    if (snaps.size() < 2) return std::nullopt;
    auto first = TemporalCompositor::semanticPart(snaps.front().record.embedding);
    auto last = TemporalCompositor::semanticPart(snaps.back().record.embedding);
    if (first.empty() || first.size() != last.size()) return std::nullopt;
    return stepChange(first, last);
}

domain::Vector TrajectoryAnalyzer::driftDirection(const std::string& noteId) const {
    auto snaps = snapshots(noteId);
    if (snaps.size() < 2) return {};
    // Every note of a session shares the same temporal step, so only content carries direction.
    auto first = TemporalCompositor::semanticPart(snaps.front().record.embedding);
    auto last = TemporalCompositor::semanticPart(snaps.back().record.embedding);
    if (first.empty() || first.size() != last.size()) return {};
    domain::Vector delta(first.size());
    for (std::size_t i = 0; i < first.size(); ++i) delta[i] = last[i] - first[i];
    if (domain::Norm(delta) <= 0.0) return {};
    return domain::Normalized(delta);
}

std::vector<double> TrajectoryAnalyzer::windowedDriftRates(const std::string& noteId, std::size_t window) const {
    auto snaps = snapshots(noteId);
    std::vector<double> rates;
    if (window < 2 || snaps.size() < window) return rates;
    for (std::size_t i = 0; i + window <= snaps.size(); ++i) {
        rates.push_back(stepChange(snaps[i].record.embedding, snaps[i + window - 1].record.embedding));
    }
    return rates;
}

std::vector<double> TrajectoryAnalyzer::velocity(const std::string& noteId, std::size_t window) const {
    auto snaps = snapshots(noteId);
    std::vector<double> out;
    if (window < 2 || snaps.size() < window) return out;

    std::vector<double> steps;
    for (std::size_t i = 0; i + 1 < snaps.size(); ++i) {
        steps.push_back(stepChange(snaps[i].record.embedding, snaps[i + 1].record.embedding));
    }
    // A window of w snapshots spans w - 1 steps.
    const std::size_t span = window - 1;
    for (std::size_t i = 0; i + span <= steps.size(); ++i) {
        out.push_back(mean(steps, i, i + span));
    }
    return out;
}

std::vector<double> TrajectoryAnalyzer::velocity(const std::string& noteId) const {
    return velocity(noteId, m_config.velocityWindow);
}

AccelerationResult TrajectoryAnalyzer::acceleration(const std::string& noteId) const {
    AccelerationResult result;
    auto v = velocity(noteId);
    if (v.size() < 2) return result;

    result.earlyVelocity = v.front();
    result.lateVelocity = v.back();
    result.acceleration = result.lateVelocity - result.earlyVelocity;
    if (result.acceleration > m_config.accelerationThreshold) {
        result.trend = Trend::SpeedingUp;
    } else if (result.acceleration < -m_config.accelerationThreshold) {
        result.trend = Trend::SlowingDown;
    } else {
        result.trend = Trend::Steady;
    }
    return result;
}

std::vector<std::pair<Snapshot, Snapshot>> TrajectoryAnalyzer::sharedSnapshots(const std::string& a,
                                                                               const std::string& b) const {
    auto sa = snapshots(a);
    auto sb = snapshots(b);
    std::vector<std::pair<Snapshot, Snapshot>> out;
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < sa.size() && j < sb.size()) {
        if (sa[i].date == sb[j].date) {
            out.emplace_back(sa[i], sb[j]);
            ++i;
            ++j;
        } else if (sa[i].date < sb[j].date) {
            ++i;
        } else {
            ++j;
        }
    }
    return out;
}

std::vector<std::pair<domain::CalendarDate, double>> TrajectoryAnalyzer::similarityTrajectory(const std::string& a,
                                                                                              const std::string& b) const {
    std::vector<std::pair<domain::CalendarDate, double>> out;
    for (const auto& [x, y] : sharedSnapshots(a, b)) {
        out.emplace_back(x.date, domain::Cosine(x.record.embedding, y.record.embedding));
    }
    return out;
}

PairTrend TrajectoryAnalyzer::convergence(const std::string& a, const std::string& b) const {
    auto trajectory = similarityTrajectory(a, b);
    if (trajectory.size() < m_config.convergenceMinSessions) return PairTrend::InsufficientData;

    std::vector<double> sims;
    for (const auto& entry : trajectory) sims.push_back(entry.second);
    const std::size_t mid = sims.size() / 2;
    double early = mean(sims, 0, mid);
    double late = mean(sims, mid, sims.size());
    if (late - early > m_config.convergenceThreshold) return PairTrend::Converging;
    if (early - late > m_config.convergenceThreshold) return PairTrend::Diverging;
    return PairTrend::Stable;
}

ReversalKind TrajectoryAnalyzer::classifyReversal(double currentSimilarity, double alignment) const {
    if (currentSimilarity >= m_config.reversalHighSimilarity && alignment <= -m_config.reversalAlignment) {
        return ReversalKind::CloseDiverging;
    }
    if (currentSimilarity <= m_config.reversalLowSimilarity && alignment >= m_config.reversalAlignment) {
        return ReversalKind::DistantConverging;
    }
    return ReversalKind::None;
}

ReversalResult TrajectoryAnalyzer::trajectoryReversal(const std::string& a, const std::string& b) const {
    ReversalResult result;
    auto shared = sharedSnapshots(a, b);
    auto driftA = semanticDrift(a);
    auto driftB = semanticDrift(b);
    if (shared.empty() || !driftA || !driftB) return result;

    const auto& latest = shared.back();
    result.currentSimilarity = domain::Cosine(latest.first.record.embedding, latest.second.record.embedding);
    result.kind = ReversalKind::None;
    if (*driftA < m_config.reversalMinDrift || *driftB < m_config.reversalMinDrift) return result;

    auto da = driftDirection(a);
    auto db = driftDirection(b);
    if (da.empty() || db.empty() || da.size() != db.size()) return result;
    result.alignment = domain::Dot(da, db);
    result.kind = classifyReversal(result.currentSimilarity, result.alignment);
    return result;
}

std::shared_ptr<const TrajectoryAnalyzer::Adjacency> TrajectoryAnalyzer::linksAt(const domain::CalendarDate& date) const {
    const std::string key = date.toString();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_links.find(key);
        if (it != m_links.end()) return it->second;
    }
    auto adjacency = std::make_shared<Adjacency>();
    for (const auto& link : m_store->linksFor(date)) {
        (*adjacency)[link.source].insert(link.target);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.emplace(key, std::move(adjacency)).first->second;
}

int TrajectoryAnalyzer::hops(const Adjacency& adjacency, const std::string& from, const std::string& to) {
    if (from == to) return 0;
    std::map<std::string, int> depth{{from, 0}};
    std::deque<std::string> queue{from};
    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        auto it = adjacency.find(current);
        if (it == adjacency.end()) continue;
        for (const auto& next : it->second) {
            if (depth.count(next)) continue;
            depth[next] = depth[current] + 1;
            if (next == to) return depth[next];
            queue.push_back(next);
        }
    }
    return -1;
}

double TrajectoryAnalyzer::pairValue(const Snapshot& a, const Snapshot& b, TrajectoryDimension dim) const {
    switch (dim) {
        case TrajectoryDimension::Semantic:
            return std::clamp(domain::Cosine(a.record.embedding, b.record.embedding), 0.0, 1.0);
        case TrajectoryDimension::Graph: {
            auto adjacency = linksAt(a.date);
            int forward = hops(*adjacency, a.record.noteId, b.record.noteId);
            int backward = hops(*adjacency, b.record.noteId, a.record.noteId);
            int best = forward < 0 ? backward : (backward < 0 ? forward : std::min(forward, backward));
            return best < 0 ? 0.0 : 1.0 / (1.0 + best);
        }
        case TrajectoryDimension::Structural:
            return domain::Cosine(structuralVector(a.record.structure), structuralVector(b.record.structure));
        case TrajectoryDimension::Staleness:
            return 1.0 / (1.0 + std::fabs(a.record.stalenessDays - b.record.stalenessDays) / m_config.stalenessScaleDays);
    }
    return 0.0;
}

std::vector<double> TrajectoryAnalyzer::dimensionSeries(const std::string& a, const std::string& b,
                                                        TrajectoryDimension dim) const {
    std::vector<double> out;
    for (const auto& [x, y] : sharedSnapshots(a, b)) {
        out.push_back(pairValue(x, y, dim));
    }
    return out;
}

std::vector<double> TrajectoryAnalyzer::DirectionSigns(const std::vector<double>& series, double epsilon) {
    std::vector<double> signs;
    for (std::size_t i = 1; i < series.size(); ++i) {
        double delta = series[i] - series[i - 1];
        signs.push_back(delta > epsilon ? 1.0 : (delta < -epsilon ? -1.0 : 0.0));
    }
    return signs;
}

std::optional<double> TrajectoryAnalyzer::Pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;
    const double mx = mean(x, 0, x.size());
    const double my = mean(y, 0, y.size());
    double cov = 0.0;
    double vx = 0.0;
    double vy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        cov += (x[i] - mx) * (y[i] - my);
        vx += (x[i] - mx) * (x[i] - mx);
        vy += (y[i] - my) * (y[i] - my);
    }
    if (vx <= 0.0 || vy <= 0.0) return std::nullopt;
    return cov / std::sqrt(vx * vy);
}

Coupling TrajectoryAnalyzer::classifyCorrelation(double r) const {
    if (std::fabs(r) < m_config.decoupledBelow) return Coupling::Decoupled;
    if (r < m_config.opposingBelow) return Coupling::Opposing;
    if (r > m_config.stronglyCorrelatedAbove) return Coupling::StronglyCorrelated;
    return Coupling::WeaklyCorrelated;
}

CorrelationResult TrajectoryAnalyzer::correlatedMovement(const std::string& a, const std::string& b,
                                                         TrajectoryDimension dimX, TrajectoryDimension dimY) const {
    if (dimX == dimY) {
        throw std::invalid_argument("correlatedMovement needs two distinct dimensions");
    }
    CorrelationResult result;
    auto signsX = DirectionSigns(dimensionSeries(a, b, dimX), m_config.directionEpsilon);
    auto signsY = DirectionSigns(dimensionSeries(a, b, dimY), m_config.directionEpsilon);
    result.steps = signsX.size();

    auto r = Pearson(signsX, signsY);
    if (!r) return result;
    result.correlation = *r;
    result.coupling = classifyCorrelation(*r);
    return result;
}

bool TrajectoryAnalyzer::isCycling(const std::string& noteId) const {
    auto snaps = snapshots(noteId);
    if (snaps.size() < 2 * m_config.minCycles + 1) return false;

    const auto& first = snaps.front().record.embedding;
    bool high = domain::Cosine(first, snaps[1].record.embedding) > m_config.cycleSimilarity;
    std::size_t cycles = 0;
    for (std::size_t i = 2; i < snaps.size(); ++i) {
        bool nowHigh = domain::Cosine(first, snaps[i].record.embedding) > m_config.cycleSimilarity;
        if (nowHigh && !high) ++cycles;
        high = nowHigh;
    }
    return cycles >= m_config.minCycles;
}

std::vector<ClusterMigration> TrajectoryAnalyzer::clusterMigrations(const domain::CalendarDate& from,
                                                                    const domain::CalendarDate& to) const {
    auto before = m_store->readSession(from);
    auto after = m_store->readSession(to);

    std::vector<ClusterMigration> out;
    for (const auto& [id, now] : after.records) {
        auto it = before.records.find(id);
        if (it == before.records.end()) continue;
        const auto& was = it->second;
        if (was.clusterId == domain::kNoiseCluster) continue;
        if (was.clusterLabel == now.clusterLabel) continue;
        out.push_back({id, was.clusterLabel, now.clusterId == domain::kNoiseCluster ? std::string() : now.clusterLabel});
    }
    return out;
}

std::vector<domain::Link> TrajectoryAnalyzer::removedLinks(const domain::CalendarDate& from,
                                                           const domain::CalendarDate& to) const {
    return m_store->removedLinks(from, to);
}

} // namespace notedrift::application
