#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "application/FunctionRegistry.hpp"
#include "application/SessionComputer.hpp"
#include "application/SessionHandle.hpp"
#include "infrastructure/SemanticCache.hpp"
#include "infrastructure/SessionStore.hpp"
#include "infrastructure/SqliteDatabase.hpp"
#include "TestSupport.hpp"

using namespace notedrift;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;
    test::ScratchDir dir("concurrency");
    domain::EngineConfig cfg;

    auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file("c.db"));
    auto store = std::make_shared<infrastructure::SessionStore>(db);
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    provider->setDelay(std::chrono::milliseconds(5));
    auto cache = std::make_shared<infrastructure::SemanticCache>(db, provider);

    // Many threads embedding overlapping texts share the cache and the connection.
    const int kThreads = 16;
    const int kTexts = 20;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kTexts; ++i) {
                int which = (i + t) % kTexts;
                std::string text = "shared text number " + std::to_string(which);
                try {
                    cache->getOrCompute(infrastructure::ContentHasher::Sha256Hex(text), text);
                } catch (const std::exception& e) {
                    std::cout << "[FAIL] " << e.what() << std::endl;
                    ++failures;
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(failures == 0);
    assert(cache->size() == static_cast<std::size_t>(kTexts));
    assert(provider->calls() == kTexts);
    std::cout << "[PASS] " << kThreads << " threads, " << kTexts << " texts, one provider call per text." << std::endl;

    provider->setDelay(std::chrono::milliseconds(0));
    application::SessionComputer computer(cache, store, cfg);
    const auto date = *domain::CalendarDate::parse("2024-04-01");
    computer.computeSession(test::SampleCorpus(), date);

    auto reference = application::SessionHandle::Open(store, cfg, date);
    auto shared = application::SessionHandle::Open(store, cfg, date);
    const auto ids = reference->graph().NoteIds();

    std::vector<std::vector<float>> expected;
    for (const auto& a : ids) {
        std::vector<float> row;
        for (const auto& b : ids) row.push_back(reference->graph().Similarity(a, b));
        expected.push_back(row);
    }
    application::FunctionRegistry functions;
    application::RegisterBuiltinFunctions(functions);
    const auto expectedSample = functions.call("sample_notes", *reference, {"5"});

    // Readers hammer one handle through single, batch and registry paths.
    threads.clear();
    std::atomic<int> mismatches{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (std::size_t i = 0; i < ids.size(); ++i) {
                std::size_t row = (i + static_cast<std::size_t>(t)) % ids.size();
                if (t % 2 == 0) {
                    auto batch = shared->graph().BatchSimilarity({ids[row]}, ids);
                    if (batch.front() != expected[row]) ++mismatches;
                } else {
                    for (std::size_t j = 0; j < ids.size(); ++j) {
                        if (shared->graph().Similarity(ids[row], ids[j]) != expected[row][j]) ++mismatches;
                    }
                }
                shared->trajectories().drift(ids[row]);
                shared->graph().Neighbours(ids[row], 3);
            }
            if (functions.call("sample_notes", *shared, {"5"}) != expectedSample) ++mismatches;
        });
    }
    for (auto& t : threads) t.join();
    assert(mismatches == 0);
    assert(shared->graph().Cache().size() == ids.size() * (ids.size() + 1) / 2);
    std::cout << "[PASS] Concurrent readers see the same values as a single thread." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
