#include "infrastructure/OllamaEmbeddingProvider.hpp"

#include <algorithm>
#include <iostream>

#include "domain/Errors.hpp"

namespace notedrift::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model)
    : m_host(host), m_port(port), m_model(model) {}

domain::Vector OllamaEmbeddingProvider::embed(const std::string& text, std::chrono::milliseconds timeout) {
    if (text.empty()) {
        throw domain::EmbeddingUnavailable("empty input");
    }
    if (timeout.count() <= 0) {
        throw domain::EmbeddingUnavailable("no time left for provider call");
    }

    // A client per call keeps concurrent callers independent.
    OllamaClient client(m_host, m_port);
    auto vec = client.getEmbedding(m_model, text, timeout);
    if (!vec) {
        throw domain::EmbeddingUnavailable(client.lastError());
    }
    return *vec;
}

bool OllamaEmbeddingProvider::isModelAvailable() {
    OllamaClient client(m_host, m_port);
    auto models = client.getAvailableModels();
    auto matches = [this](const std::string& name) {
        return name == m_model || name == m_model + ":latest";
    };
    if (std::any_of(models.begin(), models.end(), matches)) {
        return true;
    }
    std::cerr << "[OllamaEmbeddingProvider] Model " << m_model << " not listed by " << m_host << ":" << m_port
              << std::endl;
    return false;
}

} // namespace notedrift::infrastructure
