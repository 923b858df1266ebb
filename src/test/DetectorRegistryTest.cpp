#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "application/BuiltinDetectors.hpp"
#include "application/DetectorRegistry.hpp"
#include "application/FunctionRegistry.hpp"
#include "application/SessionComputer.hpp"
#include "TestSupport.hpp"

using namespace notedrift;
using namespace notedrift::application;

namespace {

std::atomic<int> g_throwCalls{0};
std::atomic<bool> g_shouldThrow{true};

std::vector<domain::Suggestion> Flaky(const SessionHandle&) {
    ++g_throwCalls;
    if (g_shouldThrow) throw std::runtime_error("flaky detector failed");
    return {};
}

std::vector<domain::Suggestion> Slow(const SessionHandle&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return {};
}

std::vector<domain::Suggestion> Chatty(const SessionHandle& handle) {
    std::vector<domain::Suggestion> out;
    for (int i = 0; i < 7; ++i) {
        out.push_back({"suggestion " + std::to_string(i), {handle.graph().NoteIds().front()}, "", static_cast<double>(i)});
    }
    return out;
}

std::vector<std::string> NoFunction(const SessionHandle&, const std::vector<std::string>&) { return {}; }

} // namespace

int main() {
    std::cout << "[Test] Starting DetectorRegistry Test..." << std::endl;
    test::ScratchDir dir("detectors");
    domain::EngineConfig cfg;

    auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file("d.db"));
    auto store = std::make_shared<infrastructure::SessionStore>(db);
    auto cache = std::make_shared<infrastructure::SemanticCache>(db, std::make_shared<test::FakeEmbeddingProvider>());
    SessionComputer computer(cache, store, cfg);
    const auto d1 = *domain::CalendarDate::parse("2024-01-01");
    const auto d2 = *domain::CalendarDate::parse("2024-02-01");
    auto corpus = test::SampleCorpus();
    computer.computeSession(corpus, d1);
    corpus.links.pop_back();
    computer.computeSession(corpus, d2);
    std::shared_ptr<const SessionHandle> handle = SessionHandle::Open(store, cfg, d2);
    assert(handle->previousSession() && *handle->previousSession() == d1);

    // Registration.
    DetectorRegistry registry;
    RegisterBuiltinDetectors(registry);
    assert(registry.size() == 4);
    assert((registry.ids() == std::vector<std::string>{"bridge_hunter", "cluster_migration",
                                                       "drift_velocity_anomaly", "trajectory_reversal"}));
    bool threw = false;
    try {
        registry.add("bridge_hunter", "again", &detectors::BridgeHunter);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        registry.add("null", "no function", nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Built-ins registered once; duplicates rejected." << std::endl;

    DetectorExecutor builtins(registry, cfg.detectors);
    for (const auto& run : builtins.runAll(handle)) {
        assert(run.status == DetectorStatus::Success);
        for (const auto& s : run.suggestions) {
            assert(s.detectorId == run.detectorId);
            assert(!s.noteIds.empty());
        }
    }
    std::cout << "[PASS] Built-in detectors run against a real session." << std::endl;

    // Failures, timeouts and disabling.
    DetectorRegistry custom;
    custom.add("flaky", "throws", &Flaky);
    custom.add("slow", "sleeps past the timeout", &Slow);
    custom.add("chatty", "too many suggestions", &Chatty);
    domain::DetectorConfig strict;
    strict.timeoutMs = 100;
    strict.maxFailures = 3;
    strict.maxSuggestionsPerDetector = 5;
    DetectorExecutor executor(custom, strict);

    auto chatty = executor.run("chatty", handle);
    assert(chatty.status == DetectorStatus::Success);
    assert(chatty.suggestions.size() == 5);
    assert(chatty.suggestions.front().score == 6.0);
    assert(chatty.suggestions.front().detectorId == "chatty");

    auto slow = executor.run("slow", handle);
    assert(slow.status == DetectorStatus::Timeout);
    assert(executor.failureCount("slow") == 1);
    assert(executor.drain(std::chrono::milliseconds(0)) == 1);

    for (int i = 0; i < 3; ++i) {
        assert(executor.run("flaky", handle).status == DetectorStatus::Error);
    }
    assert(executor.isDisabled("flaky"));
    assert(executor.run("flaky", handle).status == DetectorStatus::Disabled);
    assert(g_throwCalls == 3);

    executor.enable("flaky");
    g_shouldThrow = false;
    assert(executor.run("flaky", handle).status == DetectorStatus::Success);
    assert(executor.failureCount("flaky") == 0);
    assert(executor.executionLog().size() == 7);
    std::cout << "[PASS] Errors and timeouts counted; detector disabled after repeated failures." << std::endl;

    // Functions.
    FunctionRegistry functions;
    RegisterBuiltinFunctions(functions);
    assert(functions.names().size() == 7);
    auto sample1 = functions.call("sample_notes", *handle, {"4"});
    auto sample2 = functions.call("sample_notes", *SessionHandle::Open(store, cfg, d2), {"4"});
    assert(sample1.size() == 4);
    assert(sample1 == sample2);
    assert(functions.call("hubs", *handle, {"1"}).front() == "mem/1.md");
    assert(functions.call("old_notes", *handle, {"1"}).front() == "gar/0.md");
    assert(functions.call("recent_notes", *handle, {"1"}).front() == "mem/5.md");
    assert(functions.call("neighbours", *handle, {"mem/0.md", "3"}).size() == 3);
    assert(functions.call("orphans", *handle).size() == 5);
    auto labels = functions.call("cluster_labels", *handle);
    assert(labels.size() == handle->clusterLabels().size());

    threw = false;
    try {
        functions.call("nope", *handle);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        functions.call("hubs", *handle, {"many"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        functions.add("hubs", &NoFunction);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Registry functions are deterministic for a session date." << std::endl;

    {
        // trajectory_reversal compares every note pair unless a sample limit is configured.
        test::ScratchDir wideDir("detectors_wide");
        auto wideDb = std::make_shared<infrastructure::SqliteDatabase>(wideDir.file("w.db"));
        auto wideStore = std::make_shared<infrastructure::SessionStore>(wideDb);
        auto wideCache =
            std::make_shared<infrastructure::SemanticCache>(wideDb, std::make_shared<test::FakeEmbeddingProvider>());
        domain::EngineConfig wide;
        assert(wide.detectors.reversalSampleLimit == 0);
        SessionComputer wideComputer(wideCache, wideStore, wide);
        const int kFiller = 120;
        wideComputer.computeSession(test::DriftingCorpus(false, kFiller), d1);
        wideComputer.computeSession(test::DriftingCorpus(true, kFiller), d2);
        auto wideHandle = SessionHandle::Open(wideStore, wide, d2);
        assert(wideHandle->graph().NoteIds().size() == static_cast<std::size_t>(kFiller + 4));

        auto found = detectors::TrajectoryReversalDetector(*wideHandle);
        assert(found.size() == 2);
        bool near = false;
        bool far = false;
        for (const auto& s : found) {
            if (s.noteIds == std::vector<std::string>{"near/a.md", "near/b.md"}) near = true;
            if (s.noteIds == std::vector<std::string>{"far/c.md", "far/d.md"}) far = true;
        }
        assert(near && far);

        wide.detectors.reversalSampleLimit = 2;
        auto narrowHandle = SessionHandle::Open(wideStore, wide, d2);
        assert(detectors::TrajectoryReversalDetector(*narrowHandle).size() <= 1);
        std::cout << "[PASS] Reversal detector covers the whole corpus by default." << std::endl;
    }

    // The timed-out detector finishes before the handle's store goes away.
    assert(executor.drain(std::chrono::milliseconds(2000)) == 0);
    assert(executor.drain(std::chrono::milliseconds(0)) == 0);
    std::cout << "[PASS] Timed-out detectors are drained before shutdown." << std::endl;
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
