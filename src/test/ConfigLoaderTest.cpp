#include <cassert>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "TestSupport.hpp"

using namespace notedrift;
using infrastructure::ConfigLoader;

namespace {

void WriteFile(const std::string& path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    test::ScratchDir dir("config");

    auto defaults = ConfigLoader::Load(dir.file("absent.json"));
    assert(defaults.embedding.model == "nomic-embed-text");
    assert(defaults.embedding.semanticWeight == 0.9);
    assert(defaults.clustering.minClusterSize == 5);
    assert(defaults.metrics.sampleLimit == 0);
    assert(defaults.similarity.unlinkedPairCandidateLimit == 0);
    std::cout << "[PASS] Missing file yields defaults." << std::endl;

    WriteFile(dir.file("partial.json"), R"({
        "embedding": { "model": "mxbai-embed-large", "semantic_weight": 1.5, "port": 8080 },
        "clustering": { "min_cluster_size": 8, "min_samples": "three" },
        "trajectory": { "velocity_window": 4, "reversal_alignment": 0.6 },
        "detectors": { "max_failures": 0 },
        "metrics": { "sample_limit": 250 }
    })");
    auto cfg = ConfigLoader::Load(dir.file("partial.json"));
    assert(cfg.embedding.model == "mxbai-embed-large");
    assert(cfg.embedding.port == 8080);
    assert(cfg.embedding.semanticWeight == 0.9);
    assert(cfg.clustering.minClusterSize == 8);
    assert(cfg.clustering.minSamples == 3);
    assert(cfg.trajectory.velocityWindow == 4);
    assert(cfg.trajectory.reversalAlignment == 0.6);
    assert(cfg.detectors.maxFailures == 3);
    assert(cfg.metrics.sampleLimit == 250);
    std::cout << "[PASS] Overrides applied; invalid values keep their defaults." << std::endl;

    WriteFile(dir.file("negative.json"), R"({
        "clustering": { "min_cluster_size": -1, "min_samples": -3 },
        "trajectory": { "reversal_min_drift": 0.01 },
        "detectors": { "reversal_sample_limit": -40 },
        "metrics": { "sample_limit": -5 }
    })");
    auto negative = ConfigLoader::Load(dir.file("negative.json"));
    assert(negative.clustering.minClusterSize == 5);
    assert(negative.clustering.minSamples == 3);
    assert(negative.detectors.reversalSampleLimit == 0);
    assert(negative.metrics.sampleLimit == 0);
    assert(negative.trajectory.reversalMinDrift == 0.01);
    std::cout << "[PASS] Negative counts are rejected instead of wrapping around." << std::endl;

    WriteFile(dir.file("broken.json"), "{ not json");
    auto broken = ConfigLoader::Load(dir.file("broken.json"));
    assert(broken.clustering.minClusterSize == 5);
    std::cout << "[PASS] Unparseable file yields defaults." << std::endl;

    cfg.storage.databasePath = "/tmp/elsewhere.db";
    cfg.detectors.reversalSampleLimit = 60;
    assert(ConfigLoader::Save(dir.file("nested/settings.json"), cfg));
    auto reread = ConfigLoader::Load(dir.file("nested/settings.json"));
    assert(reread.embedding.model == "mxbai-embed-large");
    assert(reread.trajectory.velocityWindow == 4);
    assert(reread.storage.databasePath == "/tmp/elsewhere.db");
    assert(reread.detectors.reversalSampleLimit == 60);
    std::cout << "[PASS] Saved settings load back." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
