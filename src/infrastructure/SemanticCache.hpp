/**
 * @file SemanticCache.hpp
 * @brief Content-addressed store of semantic embeddings.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "domain/Deadline.hpp"
#include "domain/Embedding.hpp"
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace notedrift::infrastructure {

struct SemanticCacheOptions {
    std::chrono::milliseconds providerTimeout{30000};
    int maxRetries = 2;
    std::chrono::milliseconds retryBackoff{200};
};

/**
 * @class SemanticCache
 * @brief Maps (model, content hash) to an L2-normalized semantic vector.
 *
 * Entries depend on content only, so nothing here ever expires. Hits never
 * reach the provider. Concurrent misses on the same hash share one provider
 * call; a failed call leaves no entry behind.
 */
class SemanticCache {
public:
    SemanticCache(std::shared_ptr<SqliteDatabase> db,
                  std::shared_ptr<domain::EmbeddingProvider> provider,
                  SemanticCacheOptions options = {});

    /**
     * @brief Returns the cached vector or computes, persists and returns it.
     * @throws domain::EmbeddingUnavailable when the provider keeps failing.
     * @throws domain::DeadlineExceeded when the deadline passes first.
     */
    domain::Vector getOrCompute(const std::string& contentHash,
                                const std::string& text,
                                const domain::Deadline& deadline = {});

    /** @brief Lookup without ever calling the provider. */
    std::optional<domain::Vector> find(const std::string& contentHash) const;

    std::size_t size() const;

    /** @brief Width of stored vectors, 0 while empty. */
    std::size_t dimension() const;

    const std::string& model() const { return m_model; }

private:
    void load();
    domain::Vector computeWithRetry(const std::string& text, const domain::Deadline& deadline);
    void persist(const std::string& contentHash, const domain::Vector& vec);

    std::shared_ptr<SqliteDatabase> m_db;
    std::shared_ptr<domain::EmbeddingProvider> m_provider;
    SemanticCacheOptions m_options;
    std::string m_model;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, domain::Vector> m_entries;
    std::size_t m_dimension = 0;

    std::mutex m_inflightMutex;
    std::unordered_map<std::string, std::shared_future<domain::Vector>> m_inflight;
};

} // namespace notedrift::infrastructure
