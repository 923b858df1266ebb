#include <cassert>
#include <iostream>

#include "application/SessionComputer.hpp"
#include "domain/Errors.hpp"
#include "TestSupport.hpp"

using namespace notedrift;
using application::SessionComputer;

namespace {

domain::CalendarDate D(const char* text) { return *domain::CalendarDate::parse(text); }

domain::CorpusSnapshot Corpus() {
    domain::CorpusSnapshot corpus;
    const std::int64_t base = D("2023-09-01").toEpochSeconds();
    const char* memory[] = {"memory palace recall", "recall memory loci method", "palace memory tricks",
                            "spaced recall memory cards", "memory palace journey", "loci recall palace"};
    const char* garden[] = {"garden soil compost", "compost heap garden worms", "soil garden raised beds",
                            "garden compost tea", "raised garden soil mix", "worms soil compost garden"};
    for (int i = 0; i < 6; ++i) {
        corpus.notes.push_back(test::MakeNote("mem/" + std::to_string(i) + ".md", memory[i], base + i * 86400));
        corpus.notes.push_back(test::MakeNote("gar/" + std::to_string(i) + ".md", garden[i], base + i * 3600));
    }
    corpus.links = {{"mem/0.md", "mem/1.md"}, {"gar/0.md", "gar/2.md"}, {"mem/0.md", "missing.md"}};
    return corpus;
}

bool SameSession(const domain::SessionData& a, const domain::SessionData& b) {
    if (a.records.size() != b.records.size() || a.vaultStateHash != b.vaultStateHash) return false;
    if (a.links.size() != b.links.size()) return false;
    for (const auto& [id, ra] : a.records) {
        auto it = b.records.find(id);
        if (it == b.records.end()) return false;
        const auto& rb = it->second;
        if (ra.embedding != rb.embedding || ra.clusterId != rb.clusterId || ra.clusterLabel != rb.clusterLabel ||
            ra.contentHash != rb.contentHash || ra.stalenessDays != rb.stalenessDays) {
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SessionComputer Test..." << std::endl;
    test::ScratchDir dir("session_computer");
    domain::EngineConfig cfg;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    infrastructure::SemanticCacheOptions fast;
    fast.maxRetries = 0;

    auto openComputer = [&](const std::string& file, std::shared_ptr<infrastructure::SessionStore>& storeOut) {
        auto db = std::make_shared<infrastructure::SqliteDatabase>(dir.file(file));
        storeOut = std::make_shared<infrastructure::SessionStore>(db);
        auto cache = std::make_shared<infrastructure::SemanticCache>(db, provider, fast);
        return std::make_unique<SessionComputer>(cache, storeOut, cfg);
    };

    const auto d1 = D("2024-01-15");
    const auto d2 = D("2024-03-15");

    std::shared_ptr<infrastructure::SessionStore> store;
    auto computer = openComputer("main.db", store);
    auto report = computer->computeSession(Corpus(), d1);
    assert(report.notesTotal == 12);
    assert(report.notesEmbedded == 12);
    assert(report.failures.empty());
    assert(!report.degenerateClustering);
    assert(provider->calls() == 12);
    auto first = store->readSession(d1);
    assert(first.links.size() == 2);
    assert(first.records.at("mem/0.md").structure.outgoingLinkCount == 1);
    std::cout << "[PASS] Session computed, clustered and stored (" << report.clusterCount << " clusters)." << std::endl;

    // Same notes, same date, fresh database: identical output.
    std::shared_ptr<infrastructure::SessionStore> otherStore;
    auto other = openComputer("other.db", otherStore);
    other->computeSession(Corpus(), d1);
    assert(SameSession(first, otherStore->readSession(d1)));
    std::cout << "[PASS] Output is deterministic for the same notes and date." << std::endl;

    // A later session reuses every semantic vector.
    provider->resetCalls();
    computer->computeSession(Corpus(), d2);
    assert(provider->calls() == 0);
    auto second = store->readSession(d2);
    const std::size_t semanticWidth = test::FakeEmbeddingProvider::kDimension;
    for (const auto& [id, r1] : first.records) {
        const auto& r2 = second.records.at(id);
        for (std::size_t i = 0; i < semanticWidth; ++i) assert(r1.embedding[i] == r2.embedding[i]);
        assert(r2.embedding[semanticWidth] > r1.embedding[semanticWidth]); // older at the later session
    }
    std::cout << "[PASS] Second session makes zero provider calls and keeps the semantic part." << std::endl;

    // Replaying a past date reproduces it bit for bit.
    computer->computeSession(Corpus(), d1, domain::WriteMode::Replace);
    assert(SameSession(first, store->readSession(d1)));
    bool threw = false;
    try {
        computer->computeSession(Corpus(), d1);
    } catch (const domain::SessionAlreadyExists&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Replay with Replace is bit-identical; plain rewrite is rejected." << std::endl;

    // Per-note failures are reported and leave the rest intact.
    auto broken = Corpus();
    broken.notes.push_back(test::MakeNote("bad.md", "the provider rejects this", D("2023-10-01").toEpochSeconds()));
    broken.notes.push_back(test::MakeNote("future.md", "written next month", D("2024-06-20").toEpochSeconds()));
    provider->failOn("the provider rejects this");
    auto r3 = computer->computeSession(broken, D("2024-05-01"));
    assert(r3.notesTotal == 14);
    assert(r3.notesEmbedded == 12);
    assert(r3.failures.size() == 2);
    auto third = store->readSession(D("2024-05-01"));
    assert(!third.records.count("bad.md"));
    assert(!third.records.count("future.md"));
    std::cout << "[PASS] Provider failures and clock skew drop single notes with a report." << std::endl;

    // An expired deadline writes nothing.
    threw = false;
    try {
        computer->computeSession(Corpus(), D("2024-07-01"), domain::WriteMode::RejectExisting,
                                 domain::Deadline::after(std::chrono::milliseconds(-1)));
    } catch (const domain::DeadlineExceeded&) {
        threw = true;
    }
    assert(threw);
    assert(!store->hasSession(D("2024-07-01")));
    std::cout << "[PASS] Deadline aborts the session without a partial write." << std::endl;

    // Too few notes: degenerate clustering, still stored.
    domain::CorpusSnapshot small;
    small.notes = {Corpus().notes[0], Corpus().notes[1]};
    auto r4 = computer->computeSession(small, D("2024-08-01"));
    assert(r4.degenerateClustering);
    assert(r4.noiseCount == 2);
    assert(store->readSession(D("2024-08-01")).records.at(small.notes[0].id).clusterId == domain::kNoiseCluster);
    std::cout << "[PASS] Degenerate clustering flagged; all notes noise." << std::endl;

    auto profile = SessionComputer::Profile("# Title\n\n- first\n* second\n1. third\nplain words", 2);
    assert(profile.headingCount == 1);
    assert(profile.listItemCount == 3);
    assert(profile.outgoingLinkCount == 2);
    assert(profile.wordCount == 10);
    std::cout << "[PASS] Structural profile counts headings and list items." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
