#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "application/SessionComputer.hpp"
#include "application/TrajectoryAnalyzer.hpp"
#include "infrastructure/SemanticCache.hpp"
#include "TestSupport.hpp"

using namespace notedrift;
using application::TrajectoryAnalyzer;
using application::TrajectoryDimension;

namespace {

domain::CalendarDate D(const char* text) { return *domain::CalendarDate::parse(text); }

struct Entry {
    std::string id;
    domain::Vector embedding;
    double staleness = 0.0;
    int clusterId = domain::kNoiseCluster;
    std::string label;
};

void Write(infrastructure::SessionStore& store, const domain::CalendarDate& date,
           const std::vector<Entry>& entries, const std::vector<domain::Link>& links = {}) {
    domain::SessionData data;
    data.date = date;
    std::vector<domain::Note> notes;
    for (const auto& e : entries) {
        notes.push_back(test::MakeNote(e.id, "content of " + e.id, domain::CalendarDate::parse("2023-01-01")->toEpochSeconds()));
        domain::SessionRecord r;
        r.noteId = e.id;
        r.contentHash = notes.back().contentHash;
        r.embedding = e.embedding;
        r.stalenessDays = e.staleness;
        r.clusterId = e.clusterId;
        r.clusterLabel = e.label;
        data.records.emplace(e.id, r);
    }
    data.links = links;
    store.writeSession(data, notes, domain::WriteMode::RejectExisting);
}

domain::Vector Angle(double rad) { return {static_cast<float>(std::cos(rad)), static_cast<float>(std::sin(rad)), 0.0f}; }

domain::Vector WithCos(double c) { return {static_cast<float>(c), static_cast<float>(std::sqrt(1.0 - c * c)), 0.0f}; }

} // namespace

int main() {
    std::cout << "[Test] Starting TrajectoryAnalyzer Test..." << std::endl;
    test::ScratchDir dir("trajectory");
    auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file("t.db"));
    auto store = std::make_shared<infrastructure::SessionStore>(db);

    const char* dates[] = {"2024-01-01", "2024-02-01", "2024-03-01", "2024-04-01", "2024-05-01"};
    const double angles[] = {0.0, 0.1, 0.2, 1.0, 1.8};
    const double pairCos[] = {0.1, 0.2, 0.8, 0.9, 0.9};
    const double qStale[] = {30.0, 10.0, 0.0, 20.0, 20.0};
    const domain::Vector qVec[] = {{0.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {1.0f, 0.2f, 0.0f},
                                   {0.2f, 1.0f, 0.0f}, {0.2f, 1.0f, 0.0f}};
    const domain::Vector cyc[] = {{1, 0, 0}, {0, 1, 0}, {1, 0.1f, 0}, {0, 0, 1}, {1, 0, 0.1f}};

    for (int s = 0; s < 5; ++s) {
        std::vector<Entry> entries;
        entries.push_back({"still", {0.6f, 0.8f, 0.0f}});
        entries.push_back({"fast", Angle(angles[s])});
        entries.push_back({"r", {1.0f, 0.0f, 0.0f}});
        entries.push_back({"s", WithCos(pairCos[s])});
        entries.push_back({"p", {1.0f, 0.0f, 0.0f}, 0.0});
        entries.push_back({"q", qVec[s], qStale[s]});
        entries.push_back({"cycle", cyc[s]});
        if (s == 3) {
            entries.push_back({"mover", {1, 0, 0}, 0.0, 0, "memory, recall"});
            entries.push_back({"waker", {1, 0, 0}, 0.0, domain::kNoiseCluster, ""});
        } else if (s == 4) {
            entries.push_back({"mover", {1, 0, 0}, 0.0, 1, "sleep, dreams"});
            entries.push_back({"waker", {1, 0, 0}, 0.0, 1, "sleep, dreams"});
        }
        if (s == 0) entries.push_back({"once", {1, 0, 0}});
        std::vector<domain::Link> links;
        if (s == 3) links = {{"r", "s"}, {"s", "p"}};
        if (s == 4) links = {{"s", "p"}};
        Write(*store, D(dates[s]), entries, links);
    }

    domain::TrajectoryConfig cfg;
    TrajectoryAnalyzer analyzer(store, D("2024-12-31"), cfg);

    // Drift.
    assert(analyzer.drift("still").value() < 1e-9);
    assert(analyzer.drift("once").value() == 0.0);
    assert(!analyzer.drift("nobody"));
    assert(std::fabs(analyzer.drift("fast").value() - (1.0 - std::cos(1.8))) < 1e-5);
    assert(analyzer.driftDirection("still").empty());
    std::cout << "[PASS] Unchanged notes have zero drift; single sessions drift 0; unknown notes nullopt." << std::endl;

    // Velocity and acceleration.
    auto v = analyzer.velocity("fast");
    assert(v.size() == 3);
    assert(v.front() < v.back());
    auto acc = analyzer.acceleration("fast");
    assert(acc.trend == application::Trend::SpeedingUp);
    assert(acc.acceleration > cfg.accelerationThreshold);
    assert(analyzer.acceleration("still").trend == application::Trend::Steady);
    assert(analyzer.acceleration("once").trend == application::Trend::InsufficientData);
    assert(analyzer.windowedDriftRates("fast", 3).size() == 3);
    std::cout << "[PASS] Velocity windows and acceleration trend." << std::endl;

    // Restricting the analysis date hides later sessions.
    TrajectoryAnalyzer early(store, D("2024-02-15"), cfg);
    assert(early.snapshots("fast").size() == 2);

    // Convergence of a pair.
    assert(analyzer.convergence("r", "s") == application::PairTrend::Converging);
    assert(analyzer.convergence("s", "r") == application::PairTrend::Converging);
    assert(analyzer.convergence("r", "once") == application::PairTrend::InsufficientData);
    assert(analyzer.similarityTrajectory("r", "s").size() == 5);
    std::cout << "[PASS] Converging pairs detected from their similarity trajectory." << std::endl;

    // Reversal classification.
    assert(analyzer.classifyReversal(0.85, -0.7) == application::ReversalKind::CloseDiverging);
    assert(analyzer.classifyReversal(0.2, 0.9) == application::ReversalKind::DistantConverging);
    assert(analyzer.classifyReversal(0.5, 0.0) == application::ReversalKind::None);
    assert(analyzer.trajectoryReversal("still", "r").kind == application::ReversalKind::InsufficientData);
    std::cout << "[PASS] Close-but-diverging and distant-but-converging pairs classified." << std::endl;

    {
        // Reversals from computed sessions, where every note shares the temporal step.
        test::ScratchDir realDir("trajectory_real");
        auto realDb = std::make_shared<infrastructure::SqliteDatabase>(realDir.file("r.db"));
        auto realStore = std::make_shared<infrastructure::SessionStore>(realDb);
        auto cache = std::make_shared<infrastructure::SemanticCache>(realDb, std::make_shared<test::FakeEmbeddingProvider>());
        domain::EngineConfig engine;
        application::SessionComputer computer(cache, realStore, engine);
        computer.computeSession(test::DriftingCorpus(false), D("2024-01-01"));
        computer.computeSession(test::DriftingCorpus(true), D("2024-03-01"));

        TrajectoryAnalyzer real(realStore, D("2024-03-01"), engine.trajectory);
        auto close = real.trajectoryReversal("near/a.md", "near/b.md");
        assert(close.kind == application::ReversalKind::CloseDiverging);
        assert(close.currentSimilarity >= engine.trajectory.reversalHighSimilarity);
        assert(close.alignment < -0.9);
        auto distant = real.trajectoryReversal("far/c.md", "far/d.md");
        assert(distant.kind == application::ReversalKind::DistantConverging);
        assert(distant.currentSimilarity <= engine.trajectory.reversalLowSimilarity);
        assert(distant.alignment > 0.9);
        assert(real.trajectoryReversal("near/a.md", "far/c.md").kind == application::ReversalKind::None);
        std::cout << "[PASS] Computed sessions yield close-diverging and distant-converging pairs." << std::endl;

        // Notes whose content never changes only move in time, which is no direction at all.
        test::ScratchDir stillDir("trajectory_still");
        auto stillDb = std::make_shared<infrastructure::SqliteDatabase>(stillDir.file("s.db"));
        auto stillStore = std::make_shared<infrastructure::SessionStore>(stillDb);
        auto stillCache = std::make_shared<infrastructure::SemanticCache>(stillDb, std::make_shared<test::FakeEmbeddingProvider>());
        application::SessionComputer stillComputer(stillCache, stillStore, engine);
        for (const char* date : {"2024-01-01", "2024-03-01", "2024-06-01"}) {
            stillComputer.computeSession(test::SampleCorpus(), D(date));
        }
        TrajectoryAnalyzer still(stillStore, D("2024-06-01"), engine.trajectory);
        auto corpus = test::SampleCorpus();
        std::size_t pairs = 0;
        for (std::size_t i = 0; i < corpus.notes.size(); ++i) {
            assert(still.driftDirection(corpus.notes[i].id).empty());
            assert(still.semanticDrift(corpus.notes[i].id).value() < engine.trajectory.reversalMinDrift);
            for (std::size_t j = i + 1; j < corpus.notes.size(); ++j) {
                auto rev = still.trajectoryReversal(corpus.notes[i].id, corpus.notes[j].id);
                assert(rev.kind == application::ReversalKind::None);
                ++pairs;
            }
        }
        assert(pairs == 66);
        std::cout << "[PASS] Pairs with unchanged content are never flagged as reversing." << std::endl;
    }

    // Direction-sign correlation.
    auto r = TrajectoryAnalyzer::Pearson({1, -1, 1, -1, 1, -1}, {1, 1, -1, -1, 1, 1});
    assert(r && std::fabs(*r) < 0.3);
    assert(analyzer.classifyCorrelation(*r) == application::Coupling::Decoupled);
    assert(analyzer.classifyCorrelation(-0.8) == application::Coupling::Opposing);
    assert(analyzer.classifyCorrelation(0.9) == application::Coupling::StronglyCorrelated);
    assert(analyzer.classifyCorrelation(0.5) == application::Coupling::WeaklyCorrelated);
    assert(!TrajectoryAnalyzer::Pearson({1, 1, 1}, {1, -1, 1}));
    assert((TrajectoryAnalyzer::DirectionSigns({0.1, 0.3, 0.3, 0.2}, 1e-6) == std::vector<double>{1, 0, -1}));

    auto moved = analyzer.correlatedMovement("p", "q", TrajectoryDimension::Semantic, TrajectoryDimension::Staleness);
    assert(moved.steps == 4);
    assert(moved.coupling == application::Coupling::StronglyCorrelated);
    auto graphSeries = analyzer.dimensionSeries("r", "p", TrajectoryDimension::Graph);
    assert(graphSeries.size() == 5);
    assert(graphSeries[0] == 0.0);
    assert(std::fabs(graphSeries[3] - 1.0 / 3.0) < 1e-9);
    assert(graphSeries[4] == 0.0);
    bool threw = false;
    try {
        analyzer.correlatedMovement("p", "q", TrajectoryDimension::Graph, TrajectoryDimension::Graph);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Correlated movement across dimensions." << std::endl;

    // Cycles, migrations, removed links.
    assert(analyzer.isCycling("cycle"));
    assert(!analyzer.isCycling("still"));
    auto migrations = analyzer.clusterMigrations(D("2024-04-01"), D("2024-05-01"));
    assert(migrations.size() == 1);
    assert(migrations[0].noteId == "mover");
    assert(migrations[0].fromLabel == "memory, recall" && migrations[0].toLabel == "sleep, dreams");
    auto removed = analyzer.removedLinks(D("2024-04-01"), D("2024-05-01"));
    assert(removed.size() == 1 && removed[0] == (domain::Link{"r", "s"}));
    std::cout << "[PASS] Cycling notes, cluster migrations and removed links." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
