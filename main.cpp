#include <chrono>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/BuiltinDetectors.hpp"
#include "application/DetectorRegistry.hpp"
#include "application/FunctionRegistry.hpp"
#include "application/MetricsService.hpp"
#include "application/SessionComputer.hpp"
#include "application/SessionHandle.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CorpusLoader.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SemanticCache.hpp"
#include "infrastructure/SessionStore.hpp"
#include "infrastructure/SqliteDatabase.hpp"

using namespace notedrift;

namespace {

struct Options {
    std::string corpusPath;
    std::optional<domain::CalendarDate> date;
    std::string dbPath;
    std::string configPath;
    bool replace = false;
    long long deadlineMs = 0;
    bool runDetectors = true;
};

void PrintUsage() {
    std::cerr << "Usage: notedrift <corpus.json> [--date YYYY-MM-DD] [--db PATH] [--config PATH]\n"
              << "                 [--replace] [--deadline-ms N] [--no-detectors]" << std::endl;
}

bool ParseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--date") {
            if (!next(value)) return false;
            opts.date = domain::CalendarDate::parse(value);
            if (!opts.date) {
                std::cerr << "Invalid date: " << value << std::endl;
                return false;
            }
        } else if (arg == "--db") {
            if (!next(opts.dbPath)) return false;
        } else if (arg == "--config") {
            if (!next(opts.configPath)) return false;
        } else if (arg == "--replace") {
            opts.replace = true;
        } else if (arg == "--deadline-ms") {
            if (!next(value)) return false;
            try {
                opts.deadlineMs = std::stoll(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid deadline: " << value << std::endl;
                return false;
            }
        } else if (arg == "--no-detectors") {
            opts.runDetectors = false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (opts.corpusPath.empty()) {
            opts.corpusPath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return !opts.corpusPath.empty();
}

void PrintReport(const application::SessionReport& report) {
    std::cout << "\n=== Session " << report.date.toString() << " ===\n"
              << "Notes embedded: " << report.notesEmbedded << "/" << report.notesTotal << "\n"
              << "Clusters: " << report.clusterCount << ", noise: " << report.noiseCount << "\n";
    if (report.degenerateClustering) {
        std::cout << "Clustering was degenerate: too few notes, everything is noise.\n";
    }
    if (!report.failures.empty()) {
        std::cout << "Failed notes (" << report.failures.size() << "):\n";
        for (const auto& f : report.failures) {
            std::cout << "  - " << f.noteId << ": " << f.reason << "\n";
        }
    }
}

void PrintMetrics(const domain::EmbeddingMetrics& m) {
    std::cout << std::fixed << std::setprecision(3)
              << "Mean similarity: " << m.meanSimilarity << " (std " << m.stdSimilarity << ")\n"
              << "Diversity: " << m.diversity << ", intrinsic dimension: " << m.intrinsicDimension << "\n"
              << "Gap: " << m.gapPercent << "%, entropy: " << m.shannonEntropy << " bits, silhouette: "
              << m.silhouette << "\n";
    for (const auto& [id, label] : m.clusterLabels) {
        std::cout << "  [" << id << "] " << label << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage();
        return 2;
    }

    try {
        const std::string configPath = opts.configPath.empty() ? infrastructure::ConfigLoader::DefaultPath()
                                                               : opts.configPath;
        domain::EngineConfig config = infrastructure::ConfigLoader::Load(configPath);

        std::string dbPath = opts.dbPath;
        if (dbPath.empty()) dbPath = config.storage.databasePath;
        if (dbPath.empty()) dbPath = infrastructure::PathUtils::GetDefaultDatabasePath().string();

        const domain::CalendarDate date =
            opts.date ? *opts.date : domain::CalendarDate::fromEpochSeconds(static_cast<std::int64_t>(std::time(nullptr)));

        auto db = std::make_shared<infrastructure::SqliteDatabase>(dbPath);
        auto store = std::make_shared<infrastructure::SessionStore>(db);

        auto provider = std::make_shared<infrastructure::OllamaEmbeddingProvider>(
            config.embedding.host, config.embedding.port, config.embedding.model);
        if (!provider->isModelAvailable()) {
            std::cerr << "[Main] Continuing; cached embeddings are still used." << std::endl;
        }

        infrastructure::SemanticCacheOptions cacheOptions;
        cacheOptions.providerTimeout = std::chrono::milliseconds(config.embedding.providerTimeoutMs);
        cacheOptions.maxRetries = config.embedding.providerMaxRetries;
        auto cache = std::make_shared<infrastructure::SemanticCache>(db, provider, cacheOptions);

        domain::CorpusSnapshot corpus = infrastructure::CorpusLoader::LoadFile(opts.corpusPath);
        std::cout << "[Main] Loaded " << corpus.notes.size() << " notes and " << corpus.links.size()
                  << " links from " << opts.corpusPath << std::endl;

        domain::Deadline deadline = opts.deadlineMs > 0
            ? domain::Deadline::after(std::chrono::milliseconds(opts.deadlineMs))
            : domain::Deadline::none();

        application::SessionComputer computer(cache, store, config);
        auto report = computer.computeSession(corpus, date,
                                              opts.replace ? domain::WriteMode::Replace
                                                           : domain::WriteMode::RejectExisting,
                                              deadline);
        PrintReport(report);

        auto handle = application::SessionHandle::Open(store, config, date);

        application::MetricsService metrics(store, config.metrics);
        PrintMetrics(metrics.metricsFor(handle->graph(), opts.replace));

        application::FunctionRegistry functions;
        application::RegisterBuiltinFunctions(functions);
        std::cout << "Hubs:";
        for (const auto& id : functions.call("hubs", *handle)) std::cout << " " << id;
        std::cout << "\nOrphans:";
        for (const auto& id : functions.call("orphans", *handle)) std::cout << " " << id;
        std::cout << std::endl;

        if (opts.runDetectors) {
            application::DetectorRegistry registry;
            application::RegisterBuiltinDetectors(registry);
            application::DetectorExecutor executor(registry, config.detectors);

            std::cout << "\n=== Suggestions ===\n";
            for (const auto& run : executor.runAll(handle)) {
                if (run.status != application::DetectorStatus::Success) {
                    std::cout << "[" << run.detectorId << "] " << application::ToString(run.status);
                    if (!run.errorMessage.empty()) std::cout << ": " << run.errorMessage;
                    std::cout << "\n";
                    continue;
                }
                for (const auto& s : run.suggestions) {
                    std::cout << "[" << run.detectorId << "] " << s.text << "\n";
                }
            }
            std::cout << std::flush;

            // Timed-out detectors still hold the session; give them one more timeout to finish.
            std::size_t running = executor.drain(std::chrono::milliseconds(config.detectors.timeoutMs));
            if (running > 0) {
                std::cerr << "[Main] Exiting with " << running << " detector(s) still running" << std::endl;
            }
        }
    } catch (const domain::CacheCorruption& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
        return 3;
    } catch (const domain::SessionAlreadyExists& e) {
        std::cerr << "[Main] " << e.what() << " (use --replace to recompute)" << std::endl;
        return 1;
    } catch (const domain::DeadlineExceeded& e) {
        std::cerr << "[Main] " << e.what() << "; nothing was written." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
