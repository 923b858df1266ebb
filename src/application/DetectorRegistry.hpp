/**
 * @file DetectorRegistry.hpp
 * @brief Detectors keyed by stable id, and the executor that runs them.
 */

#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/SessionHandle.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/Suggestion.hpp"

namespace notedrift::application {

using DetectorFn = std::vector<domain::Suggestion> (*)(const SessionHandle&);

struct DetectorInfo {
    std::string id;
    std::string description;
    DetectorFn fn = nullptr;
};

/**
 * @class DetectorRegistry
 * @brief Filled by explicit registration calls at startup; read-only afterwards.
 */
class DetectorRegistry {
public:
    /** @throws std::invalid_argument for an empty id, a null function or a duplicate id. */
    void add(const std::string& id, const std::string& description, DetectorFn fn);

    const DetectorInfo* find(const std::string& id) const;

    /** @brief Registered ids in lexical order. */
    std::vector<std::string> ids() const;

    std::size_t size() const { return m_detectors.size(); }

private:
    std::map<std::string, DetectorInfo> m_detectors;
};

enum class DetectorStatus {
    Success,
    Timeout,
    Error,
    Disabled
};

/**
 * @struct DetectorRun
 * @brief One entry of the execution log.
 */
struct DetectorRun {
    std::string detectorId;
    DetectorStatus status = DetectorStatus::Success;
    std::vector<domain::Suggestion> suggestions;
    std::string errorMessage;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @class DetectorExecutor
 * @brief Runs detectors with a per-detector timeout and disables repeat offenders.
 *
 * A timeout or an exception counts as a failure; a success resets the count.
 * After detectors.max_failures consecutive failures the detector is skipped
 * until enable() is called. A timed-out detector keeps running in the
 * background and holds the session handle until it returns; drain() waits for
 * those before shutdown.
 */
class DetectorExecutor {
public:
    DetectorExecutor(const DetectorRegistry& registry, const domain::DetectorConfig& config);

    DetectorRun run(const std::string& id, const std::shared_ptr<const SessionHandle>& handle);

    /** @brief Every registered detector in id order. */
    std::vector<DetectorRun> runAll(const std::shared_ptr<const SessionHandle>& handle);

    bool isDisabled(const std::string& id) const;
    int failureCount(const std::string& id) const;
    void enable(const std::string& id);

    std::vector<DetectorRun> executionLog() const;

    /**
     * @brief Waits up to @p limit for timed-out detectors to finish.
     * @return How many are still running.
     */
    std::size_t drain(std::chrono::milliseconds limit);

private:
    void record(const DetectorRun& run);

    const DetectorRegistry& m_registry;
    domain::DetectorConfig m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, int> m_failures;
    std::map<std::string, bool> m_disabled;
    std::vector<DetectorRun> m_log;

    using Result = std::vector<domain::Suggestion>;
    struct Pending {
        std::shared_ptr<std::promise<Result>> promise; ///< Kept alive until its thread exits.
        std::future<Result> future;
    };

    std::mutex m_pendingMutex;
    std::vector<Pending> m_pending;
};

const char* ToString(DetectorStatus status);

} // namespace notedrift::application
