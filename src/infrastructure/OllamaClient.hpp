/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace notedrift::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/embeddings.
     * @return The embedding, or nullopt on transport, HTTP or parse failure
     *         (the reason is kept in lastError()).
     */
    std::optional<std::vector<float>> getEmbedding(const std::string& model,
                                                   const std::string& text,
                                                   std::chrono::milliseconds timeout);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    const std::string& lastError() const { return m_lastError; }

private:
    std::string m_host;
    int m_port;
    std::string m_lastError;
};

} // namespace notedrift::infrastructure
