/**
 * @file Deadline.hpp
 * @brief Optional wall-clock budget threaded through long-running calls.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "domain/Errors.hpp"

namespace notedrift::domain {

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /** @brief No deadline. */
    Deadline() = default;

    static Deadline after(std::chrono::milliseconds budget) {
        Deadline d;
        d.m_at = Clock::now() + budget;
        return d;
    }

    static Deadline none() { return Deadline(); }

    bool isSet() const { return m_at.has_value(); }

    bool expired() const { return m_at && Clock::now() >= *m_at; }

    /** @brief Time left, or nullopt when unbounded. Never negative. */
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!m_at) return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*m_at - Clock::now());
        if (left.count() < 0) return std::chrono::milliseconds(0);
        return left;
    }

    /** @brief Caps a per-call timeout by the time left. */
    std::chrono::milliseconds clamp(std::chrono::milliseconds timeout) const {
        auto left = remaining();
        if (left && *left < timeout) return *left;
        return timeout;
    }

    /** @brief Throws DeadlineExceeded when expired. */
    void check(const std::string& stage) const {
        if (expired()) throw DeadlineExceeded(stage);
    }

    std::optional<Clock::time_point> at() const { return m_at; }

private:
    std::optional<Clock::time_point> m_at;
};

} // namespace notedrift::domain
