/**
 * @file Errors.hpp
 * @brief Exceptions raised by the engine.
 *
 * Unreachable graph pairs and degenerate clusterings are not exceptions; they
 * are reported through sentinel values and result flags.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace notedrift::domain {

/** @brief The embedding provider failed, timed out or returned garbage. */
class EmbeddingUnavailable : public std::runtime_error {
public:
    explicit EmbeddingUnavailable(const std::string& msg)
        : std::runtime_error("Embedding unavailable: " + msg) {}
};

/** @brief A required session read found no data for the date. */
class SessionNotFound : public std::runtime_error {
public:
    explicit SessionNotFound(const std::string& date)
        : std::runtime_error("Session not found: " + date), m_date(date) {}
    const std::string& date() const { return m_date; }

private:
    std::string m_date;
};

/** @brief A session for the date exists and the caller did not ask to replace it. */
class SessionAlreadyExists : public std::runtime_error {
public:
    explicit SessionAlreadyExists(const std::string& date)
        : std::runtime_error("Session already exists: " + date) {}
};

/** @brief Persisted data does not match the expected schema. Fatal. */
class CacheCorruption : public std::runtime_error {
public:
    explicit CacheCorruption(const std::string& msg)
        : std::runtime_error("Cache corruption: " + msg) {}
};

/** @brief A note was created after the session date by more than the tolerated skew. */
class ClockSkewError : public std::runtime_error {
public:
    explicit ClockSkewError(const std::string& msg)
        : std::runtime_error("Clock skew: " + msg) {}
};

/** @brief The caller's deadline passed before the work finished. */
class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& stage)
        : std::runtime_error("Deadline exceeded during " + stage) {}
};

} // namespace notedrift::domain
