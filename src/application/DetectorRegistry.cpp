/**
 * @file DetectorRegistry.cpp
 * @brief Implementation of DetectorRegistry and DetectorExecutor.
 */

#include "application/DetectorRegistry.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace notedrift::application {

void DetectorRegistry::add(const std::string& id, const std::string& description, DetectorFn fn) {
    if (id.empty()) throw std::invalid_argument("Detector id must not be empty");
    if (!fn) throw std::invalid_argument("Detector '" + id + "' has no function");
    if (!m_detectors.emplace(id, DetectorInfo{id, description, fn}).second) {
        throw std::invalid_argument("Detector '" + id + "' is already registered");
    }
}

const DetectorInfo* DetectorRegistry::find(const std::string& id) const {
    auto it = m_detectors.find(id);
    return it == m_detectors.end() ? nullptr : &it->second;
}

std::vector<std::string> DetectorRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(m_detectors.size());
    for (const auto& [id, info] : m_detectors) out.push_back(id);
    return out;
}

const char* ToString(DetectorStatus status) {
    switch (status) {
        case DetectorStatus::Success: return "success";
        case DetectorStatus::Timeout: return "timeout";
        case DetectorStatus::Error: return "error";
        case DetectorStatus::Disabled: return "disabled";
    }
    return "unknown";
}

DetectorExecutor::DetectorExecutor(const DetectorRegistry& registry, const domain::DetectorConfig& config)
    : m_registry(registry), m_config(config) {}

DetectorRun DetectorExecutor::run(const std::string& id, const std::shared_ptr<const SessionHandle>& handle) {
    const DetectorInfo* info = m_registry.find(id);
    if (!info) throw std::invalid_argument("Unknown detector '" + id + "'");
    if (!handle) throw std::invalid_argument("Detector '" + id + "' needs a session handle");

    DetectorRun result;
    result.detectorId = id;
    if (isDisabled(id)) {
        result.status = DetectorStatus::Disabled;
        record(result);
        return result;
    }

    auto promise = std::make_shared<std::promise<std::vector<domain::Suggestion>>>();
    auto future = promise->get_future();
    auto start = std::chrono::steady_clock::now();

    DetectorFn fn = info->fn;
    // Readiness is published at thread exit, after the captured handle is released.
    std::thread([fn, handle, promise]() {
        try {
            promise->set_value_at_thread_exit(fn(*handle));
        } catch (...) {
            promise->set_exception_at_thread_exit(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(m_config.timeoutMs)) != std::future_status::ready) {
        result.status = DetectorStatus::Timeout;
        result.errorMessage = "timed out after " + std::to_string(m_config.timeoutMs) + " ms";
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        m_pending.push_back({promise, std::move(future)});
    } else {
        try {
            result.suggestions = future.get();
            for (auto& s : result.suggestions) s.detectorId = id;
            std::stable_sort(result.suggestions.begin(), result.suggestions.end(),
                             [](const domain::Suggestion& a, const domain::Suggestion& b) { return a.score > b.score; });
            if (result.suggestions.size() > m_config.maxSuggestionsPerDetector) {
                result.suggestions.resize(m_config.maxSuggestionsPerDetector);
            }
        } catch (const std::exception& e) {
            result.status = DetectorStatus::Error;
            result.errorMessage = e.what();
        }
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    record(result);
    return result;
}

std::vector<DetectorRun> DetectorExecutor::runAll(const std::shared_ptr<const SessionHandle>& handle) {
    std::vector<DetectorRun> runs;
    for (const auto& id : m_registry.ids()) {
        runs.push_back(run(id, handle));
    }
    return runs;
}

void DetectorExecutor::record(const DetectorRun& run) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_log.push_back(run);
    if (run.status == DetectorStatus::Success) {
        m_failures[run.detectorId] = 0;
        return;
    }
    if (run.status == DetectorStatus::Disabled) return;

    int failures = ++m_failures[run.detectorId];
    std::cerr << "[DetectorExecutor] " << run.detectorId << " " << ToString(run.status) << ": "
              << run.errorMessage << " (" << failures << "/" << m_config.maxFailures << ")" << std::endl;
    if (failures >= m_config.maxFailures && !m_disabled[run.detectorId]) {
        m_disabled[run.detectorId] = true;
        std::cerr << "[DetectorExecutor] Disabled " << run.detectorId << std::endl;
    }
}

bool DetectorExecutor::isDisabled(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_disabled.find(id);
    return it != m_disabled.end() && it->second;
}

int DetectorExecutor::failureCount(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_failures.find(id);
    return it == m_failures.end() ? 0 : it->second;
}

void DetectorExecutor::enable(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_disabled[id] = false;
    m_failures[id] = 0;
}

std::size_t DetectorExecutor::drain(std::chrono::milliseconds limit) {
    std::vector<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        pending.swap(m_pending);
    }

    const auto until = std::chrono::steady_clock::now() + limit;
    std::vector<Pending> running;
    for (auto& p : pending) {
        if (p.future.wait_until(until) != std::future_status::ready) running.push_back(std::move(p));
    }

    std::lock_guard<std::mutex> lock(m_pendingMutex);
    const std::size_t left = running.size();
    for (auto& p : running) m_pending.push_back(std::move(p));
    return left;
}

std::vector<DetectorRun> DetectorExecutor::executionLog() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_log;
}

} // namespace notedrift::application
