/**
 * @file SimilarityCache.hpp
 * @brief Run-scoped memo of pairwise similarities.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "domain/CalendarDate.hpp"

namespace notedrift::application {

/**
 * @class SimilarityCache
 * @brief Pairwise similarity memo bound to exactly one session date.
 *
 * Keys are order-independent: (a, b) and (b, a) share one entry. The cache
 * lives as long as one analysis run and is never reused for another date.
 */
class SimilarityCache {
public:
    using Entry = std::tuple<std::string, std::string, float>;

    explicit SimilarityCache(const domain::CalendarDate& sessionDate);

    const domain::CalendarDate& sessionDate() const { return m_sessionDate; }

    std::optional<float> find(const std::string& a, const std::string& b) const;

    /** @brief Stores a value; a concurrent duplicate keeps the first write. */
    void insert(const std::string& a, const std::string& b, float value);

    /** @brief Stores many values under a single lock. */
    void insertMany(const std::vector<Entry>& entries);

    std::size_t size() const;
    std::size_t hits() const { return m_hits.load(); }
    std::size_t misses() const { return m_misses.load(); }

private:
    static std::string key(const std::string& a, const std::string& b);

    domain::CalendarDate m_sessionDate;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, float> m_values;
    mutable std::atomic<std::size_t> m_hits{0};
    mutable std::atomic<std::size_t> m_misses{0};
};

} // namespace notedrift::application
