#include "application/SimilarityCache.hpp"

#include <mutex>

namespace notedrift::application {

SimilarityCache::SimilarityCache(const domain::CalendarDate& sessionDate) : m_sessionDate(sessionDate) {}

std::string SimilarityCache::key(const std::string& a, const std::string& b) {
    const std::string& lo = a < b ? a : b;
    const std::string& hi = a < b ? b : a;
    std::string k;
    k.reserve(lo.size() + hi.size() + 1);
    k += lo;
    k += '\0';
    k += hi;
    return k;
}

std::optional<float> SimilarityCache::find(const std::string& a, const std::string& b) const {
    std::string k = key(a, b);
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_values.find(k);
    if (it == m_values.end()) {
        ++m_misses;
        return std::nullopt;
    }
    ++m_hits;
    return it->second;
}

void SimilarityCache::insert(const std::string& a, const std::string& b, float value) {
    std::string k = key(a, b);
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_values.emplace(std::move(k), value);
}

void SimilarityCache::insertMany(const std::vector<Entry>& entries) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& [a, b, value] : entries) {
        m_values.emplace(key(a, b), value);
    }
}

std::size_t SimilarityCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_values.size();
}

} // namespace notedrift::application
