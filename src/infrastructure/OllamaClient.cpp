#include "infrastructure/OllamaClient.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace notedrift::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::vector<float>> OllamaClient::getEmbedding(const std::string& model,
                                                             const std::string& text,
                                                             std::chrono::milliseconds timeout) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (!res) {
        m_lastError = "connection failed (" + httplib::to_string(res.error()) + ")";
        std::cerr << "[OllamaClient] " << m_lastError << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        m_lastError = "HTTP " + std::to_string(res->status) + ": " + res->body;
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("embedding") && body["embedding"].is_array()) {
            return body["embedding"].get<std::vector<float>>();
        }
        m_lastError = "response without embedding array";
    } catch (const std::exception& e) {
        m_lastError = std::string("JSON parse error: ") + e.what();
        std::cerr << "[OllamaClient] " << m_lastError << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Tags JSON Parse Error: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace notedrift::infrastructure
