#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>

#include "application/ClusterEngine.hpp"
#include "application/ClusterLabeler.hpp"
#include "domain/Errors.hpp"
#include "domain/Session.hpp"

using namespace notedrift;
using application::ClusterEngine;
using application::ClusterInput;
using application::ClusterLabeler;

namespace {

std::vector<ClusterInput> TwoBlobs() {
    std::vector<ClusterInput> inputs;
    const char* memory[] = {"memory palace recall", "memory recall loci", "palace memory tricks",
                            "spaced recall memory", "memory palace method"};
    const char* garden[] = {"garden soil compost", "compost heap garden", "soil garden beds",
                            "garden compost worms", "raised garden soil"};
    for (int i = 0; i < 10; ++i) {
        float x = 0.01f * static_cast<float>(i);
        inputs.push_back({"m" + std::to_string(i), {x, 0.0f}, memory[i % 5]});
        inputs.push_back({"g" + std::to_string(i), {10.0f + x, 10.0f}, garden[i % 5]});
    }
    return inputs;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClusterEngine Test..." << std::endl;
    domain::ClusteringConfig cfg;
    ClusterEngine engine(cfg);

    // Fewer notes than the minimum cluster size: all noise, flagged.
    auto tiny = engine.cluster({{"a", {0.0f, 0.0f}, "x"}, {"b", {0.1f, 0.0f}, "y"}});
    assert(tiny.degenerate);
    assert(tiny.clusters.empty());
    assert(tiny.noiseCount() == 2);
    assert(tiny.clusterOf("a") == domain::kNoiseCluster);
    std::cout << "[PASS] Two notes with min cluster size 5 are all noise." << std::endl;

    auto result = engine.cluster(TwoBlobs());
    assert(!result.degenerate);
    assert(result.clusters.size() == 2);
    assert(result.noiseCount() == 0);
    const int memoryCluster = result.clusterOf("m0");
    const int gardenCluster = result.clusterOf("g0");
    assert(memoryCluster != gardenCluster);
    for (int i = 0; i < 10; ++i) {
        assert(result.clusterOf("m" + std::to_string(i)) == memoryCluster);
        assert(result.clusterOf("g" + std::to_string(i)) == gardenCluster);
    }
    std::cout << "[PASS] Two separated blobs give two clusters." << std::endl;

    const auto& mem = result.clusters.at(memoryCluster);
    assert(mem.members.size() == 10);
    assert(!mem.terms.empty() && mem.terms.size() <= cfg.labelTerms);
    assert(mem.label.find("memory") != std::string::npos);
    assert(mem.formattedLabel.rfind("Notes about ", 0) == 0);
    assert(result.clusters.at(gardenCluster).label.find("garden") != std::string::npos);
    assert(mem.representatives.size() == cfg.representativeCount);
    assert(mem.centroid.size() == 2);
    std::cout << "[PASS] Clusters carry c-TF-IDF labels, centroids and representatives." << std::endl;

    // Same input in another order gives the same result.
    auto shuffled = TwoBlobs();
    std::reverse(shuffled.begin(), shuffled.end());
    auto again = engine.cluster(shuffled);
    assert(again.assignments == result.assignments);
    assert(again.labelOf(memoryCluster) == result.labelOf(memoryCluster));
    std::cout << "[PASS] Clustering is independent of input order." << std::endl;

    // A single undifferentiated blob never selects the root.
    std::vector<ClusterInput> blob;
    for (int i = 0; i < 8; ++i) blob.push_back({"p" + std::to_string(i), {0.01f * i, 0.0f}, "same words"});
    auto single = engine.cluster(blob);
    assert(single.clusters.empty());
    assert(single.noiseCount() == 8);
    std::cout << "[PASS] The root of the condensed tree is never a cluster." << std::endl;

    bool threw = false;
    try {
        engine.cluster(TwoBlobs(), domain::Deadline::after(std::chrono::milliseconds(-1)));
    } catch (const domain::DeadlineExceeded&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Clustering honours the deadline." << std::endl;

    // Label helpers.
    assert(ClusterLabeler::JoinTerms(3, {}) == "Cluster 3");
    assert(ClusterLabeler::FormatLabel(0, {"a", "b", "c"}) == "Notes about a, b, and c");
    assert(ClusterLabeler::FormatLabel(0, {"a", "b"}) == "Notes about a and b");
    auto picked = ClusterLabeler::SelectDiverse({"memory", "memory palace", "sleep"}, {1.0, 0.95, 0.5}, 0.5, 2);
    assert((picked == std::vector<std::string>{"memory", "sleep"}));
    auto tokens = ClusterLabeler::Tokenize("The Memory of a palace");
    assert((tokens == std::vector<std::string>{"memory", "palace"}));
    std::cout << "[PASS] MMR prefers diverse terms; labels format as expected." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
