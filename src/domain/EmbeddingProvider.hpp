/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for the external text embedding model.
 */

#pragma once

#include <chrono>
#include <string>

#include "domain/Embedding.hpp"

namespace notedrift::domain {

/**
 * @class EmbeddingProvider
 * @brief Abstract black box turning text into a fixed-width vector.
 *
 * Implementations throw EmbeddingUnavailable when the model is unreachable,
 * the call exceeds the timeout, or the input/response is malformed. They must
 * never return a partial vector.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embeds a single text.
     * @param text Note content; must not be empty.
     * @param timeout Upper bound for this single call.
     */
    virtual Vector embed(const std::string& text, std::chrono::milliseconds timeout) = 0;

    /** @brief Model identity; cached vectors are only valid for the same model. */
    virtual std::string modelName() const = 0;
};

} // namespace notedrift::domain
