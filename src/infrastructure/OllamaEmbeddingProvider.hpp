/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by a local Ollama server.
 */

#pragma once

#include <string>

#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace notedrift::infrastructure {

/**
 * @class OllamaEmbeddingProvider
 * @brief Implements EmbeddingProvider using the Ollama REST API.
 */
class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model);

    /** @see domain::EmbeddingProvider::embed */
    domain::Vector embed(const std::string& text, std::chrono::milliseconds timeout) override;

    std::string modelName() const override { return m_model; }

    /** @brief True when the server lists the configured model. Logs otherwise. */
    bool isModelAvailable();

private:
    std::string m_host;
    int m_port;
    std::string m_model;
};

} // namespace notedrift::infrastructure
