/**
 * @file SemanticCache.cpp
 * @brief Implementation of SemanticCache.
 */

#include "infrastructure/SemanticCache.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "domain/Errors.hpp"

namespace notedrift::infrastructure {

SemanticCache::SemanticCache(std::shared_ptr<SqliteDatabase> db,
                             std::shared_ptr<domain::EmbeddingProvider> provider,
                             SemanticCacheOptions options)
    : m_db(std::move(db)), m_provider(std::move(provider)), m_options(options) {
    if (!m_db || !m_provider) {
        throw std::invalid_argument("SemanticCache requires a database and a provider");
    }
    m_model = m_provider->modelName();
    load();
}

void SemanticCache::load() {
    std::lock_guard<std::mutex> dbLock(m_db->mutex());
    Statement stmt(*m_db, "SELECT content_hash, dimension, vector FROM semantic_cache WHERE model = ?;");
    stmt.bind(1, m_model);

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    while (stmt.step()) {
        std::string hash = stmt.columnText(0);
        auto dim = static_cast<std::size_t>(stmt.columnInt64(1));
        domain::Vector vec = stmt.columnVector(2);
        if (vec.size() != dim) {
            throw domain::CacheCorruption("entry " + hash + " declares " + std::to_string(dim) +
                                          " dimensions but holds " + std::to_string(vec.size()));
        }
        if (m_dimension == 0) {
            m_dimension = dim;
        } else if (dim != m_dimension) {
            throw domain::CacheCorruption("mixed vector widths for model " + m_model);
        }
        m_entries.emplace(std::move(hash), std::move(vec));
    }
    if (!m_entries.empty()) {
        std::cout << "[SemanticCache] Loaded " << m_entries.size() << " embeddings for " << m_model << std::endl;
    }
}

std::optional<domain::Vector> SemanticCache::find(const std::string& contentHash) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(contentHash);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

std::size_t SemanticCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t SemanticCache::dimension() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_dimension;
}

domain::Vector SemanticCache::getOrCompute(const std::string& contentHash,
                                           const std::string& text,
                                           const domain::Deadline& deadline) {
    if (auto hit = find(contentHash)) return *hit;

    std::promise<domain::Vector> promise;
    std::shared_future<domain::Vector> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        // Re-check under the in-flight lock: a leader may have published meanwhile.
        if (auto hit = find(contentHash)) return *hit;
        auto it = m_inflight.find(contentHash);
        if (it != m_inflight.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            m_inflight.emplace(contentHash, pending);
            leader = true;
        }
    }

    if (!leader) {
        if (auto at = deadline.at()) {
            if (pending.wait_until(*at) == std::future_status::timeout) {
                throw domain::DeadlineExceeded("embedding");
            }
        }
        return pending.get();
    }

    try {
        domain::Vector vec = domain::Normalized(computeWithRetry(text, deadline));
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            if (m_dimension != 0 && vec.size() != m_dimension) {
                throw domain::EmbeddingUnavailable("provider returned " + std::to_string(vec.size()) +
                                                   " dimensions, cache holds " + std::to_string(m_dimension));
            }
        }
        persist(contentHash, vec);
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            if (m_dimension == 0) m_dimension = vec.size();
            m_entries.emplace(contentHash, vec);
        }
        promise.set_value(vec);
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        m_inflight.erase(contentHash);
        return vec;
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        m_inflight.erase(contentHash);
        throw;
    }
}

domain::Vector SemanticCache::computeWithRetry(const std::string& text, const domain::Deadline& deadline) {
    if (text.empty()) {
        throw domain::EmbeddingUnavailable("empty input");
    }

    std::string lastError = "no attempt made";
    const int attempts = 1 + std::max(0, m_options.maxRetries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        deadline.check("embedding");
        try {
            domain::Vector vec = m_provider->embed(text, deadline.clamp(m_options.providerTimeout));
            if (vec.empty()) {
                throw domain::EmbeddingUnavailable("empty vector");
            }
            for (float f : vec) {
                if (!std::isfinite(f)) throw domain::EmbeddingUnavailable("non-finite component");
            }
            if (domain::Norm(vec) <= 0.0) {
                throw domain::EmbeddingUnavailable("zero vector");
            }
            return vec;
        } catch (const domain::EmbeddingUnavailable& e) {
            lastError = e.what();
            std::cerr << "[SemanticCache] Attempt " << attempt << "/" << attempts << " failed: " << lastError << std::endl;
        }
        if (attempt < attempts) {
            auto pause = deadline.clamp(m_options.retryBackoff * attempt);
            std::this_thread::sleep_for(pause);
        }
    }
    throw domain::EmbeddingUnavailable(std::to_string(attempts) + " attempts failed; last: " + lastError);
}

void SemanticCache::persist(const std::string& contentHash, const domain::Vector& vec) {
    std::lock_guard<std::mutex> lock(m_db->mutex());
    Statement stmt(*m_db,
                   "INSERT OR IGNORE INTO semantic_cache (model, content_hash, dimension, vector, created_at) "
                   "VALUES (?, ?, ?, ?, ?);");
    stmt.bind(1, m_model);
    stmt.bind(2, contentHash);
    stmt.bind(3, static_cast<std::int64_t>(vec.size()));
    stmt.bind(4, vec);
    stmt.bind(5, SqliteDatabase::UtcTimestamp());
    stmt.step();
}

} // namespace notedrift::infrastructure
