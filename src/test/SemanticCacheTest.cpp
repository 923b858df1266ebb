#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "domain/Errors.hpp"
#include "infrastructure/SemanticCache.hpp"
#include "infrastructure/SqliteDatabase.hpp"
#include "TestSupport.hpp"

using namespace notedrift;

namespace {

infrastructure::SemanticCacheOptions FastOptions() {
    infrastructure::SemanticCacheOptions o;
    o.providerTimeout = std::chrono::milliseconds(1000);
    o.maxRetries = 1;
    o.retryBackoff = std::chrono::milliseconds(1);
    return o;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SemanticCache Test..." << std::endl;
    test::ScratchDir dir("semantic_cache");
    const std::string dbPath = dir.file("cache.db");
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();

    const std::string text = "memory palaces and spaced repetition";
    const std::string hash = infrastructure::ContentHasher::Sha256Hex(text);

    {
        auto db = std::make_shared<infrastructure::SqliteDatabase>(dbPath);
        infrastructure::SemanticCache cache(db, provider, FastOptions());

        auto first = cache.getOrCompute(hash, text);
        assert(provider->calls() == 1);
        assert(std::fabs(domain::Norm(first) - 1.0) < 1e-5);
        assert(cache.dimension() == test::FakeEmbeddingProvider::kDimension);

        auto second = cache.getOrCompute(hash, text);
        assert(provider->calls() == 1);
        assert(first == second);
        std::cout << "[PASS] Hit returns the stored vector without calling the provider." << std::endl;

        // Failure leaves nothing behind.
        const std::string bad = "this text is refused";
        provider->failOn(bad);
        const std::string badHash = infrastructure::ContentHasher::Sha256Hex(bad);
        bool threw = false;
        try {
            cache.getOrCompute(badHash, bad);
        } catch (const domain::EmbeddingUnavailable&) {
            threw = true;
        }
        assert(threw);
        assert(!cache.find(badHash));
        assert(cache.size() == 1);
        std::cout << "[PASS] Provider failure raises EmbeddingUnavailable and stores nothing." << std::endl;

        threw = false;
        try {
            cache.getOrCompute(infrastructure::ContentHasher::Sha256Hex(""), "");
        } catch (const domain::EmbeddingUnavailable&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Empty input is rejected." << std::endl;
    }

    // Entries survive a reopen; no provider traffic on the second open.
    {
        provider->resetCalls();
        auto db = std::make_shared<infrastructure::SqliteDatabase>(dbPath);
        infrastructure::SemanticCache cache(db, provider, FastOptions());
        assert(cache.size() == 1);
        cache.getOrCompute(hash, text);
        assert(provider->calls() == 0);
        std::cout << "[PASS] Entries persist across reopen." << std::endl;
    }

    // Concurrent misses on one hash coalesce into one provider call.
    {
        provider->resetCalls();
        provider->setDelay(std::chrono::milliseconds(50));
        auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file("concurrent.db"));
        infrastructure::SemanticCache cache(db, provider, FastOptions());

        const std::string shared = "a note every thread wants at once";
        const std::string sharedHash = infrastructure::ContentHasher::Sha256Hex(shared);
        std::vector<std::thread> threads;
        std::vector<domain::Vector> results(16);
        for (std::size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i]() { results[i] = cache.getOrCompute(sharedHash, shared); });
        }
        for (auto& t : threads) t.join();

        assert(provider->calls() == 1);
        assert(cache.size() == 1);
        for (const auto& r : results) assert(r == results.front());
        provider->setDelay(std::chrono::milliseconds(0));
        std::cout << "[PASS] Concurrent misses share one provider call and one entry." << std::endl;
    }

    // A deadline already passed stops before the provider is called.
    {
        provider->resetCalls();
        auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file("deadline.db"));
        infrastructure::SemanticCache cache(db, provider, FastOptions());
        bool threw = false;
        try {
            cache.getOrCompute("h", "late text", domain::Deadline::after(std::chrono::milliseconds(-1)));
        } catch (const domain::DeadlineExceeded&) {
            threw = true;
        }
        assert(threw);
        assert(provider->calls() == 0);
        assert(cache.size() == 0);
        std::cout << "[PASS] Expired deadline raises DeadlineExceeded." << std::endl;
    }

    // Schema mismatches are fatal.
    {
        {
            infrastructure::SqliteDatabase db(dir.file("future.db"));
            db.exec("PRAGMA user_version = 42;");
        }
        bool threw = false;
        try {
            infrastructure::SqliteDatabase db(dir.file("future.db"));
        } catch (const domain::CacheCorruption&) {
            threw = true;
        }
        assert(threw);

        {
            infrastructure::SqliteDatabase db(dbPath);
            db.exec("UPDATE semantic_cache SET dimension = dimension + 1;");
        }
        threw = false;
        try {
            auto db = std::make_shared<infrastructure::SqliteDatabase>(dbPath);
            infrastructure::SemanticCache cache(db, provider, FastOptions());
        } catch (const domain::CacheCorruption&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Schema and entry mismatches raise CacheCorruption." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
