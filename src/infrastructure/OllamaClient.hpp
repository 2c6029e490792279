/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace amlgate::infrastructure {

/**
 * @class OllamaClient
 * @brief Stateless wrapper; every call opens its own connection, so one instance may be shared
 * across threads. Failures throw domain::ExternalUnavailableError.
 */
class OllamaClient {
public:
    struct ChatOptions {
        double temperature = 0.0;
        int maxTokens = 1500;
        std::chrono::milliseconds timeout{3000};
    };

    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/chat and returns the assistant content. */
    std::string chat(const std::string& model,
                     const nlohmann::json& messages,
                     const ChatOptions& options);

    /** @brief Sends a POST request to /api/embeddings. */
    std::vector<float> getEmbedding(const std::string& model,
                                    const std::string& text,
                                    std::chrono::milliseconds timeout);

    /** @brief Fetches available models from /api/tags. Empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels();

    const std::string& getHost() const { return m_host; }
    int getPort() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace amlgate::infrastructure
