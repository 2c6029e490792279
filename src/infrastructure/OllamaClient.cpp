#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <algorithm>
#include <iostream>

namespace amlgate::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kDeterministicSeed = 42;
constexpr std::chrono::milliseconds kConnectTimeout{1000};

void ApplyTimeouts(httplib::Client& cli, std::chrono::milliseconds timeout) {
    auto connect = std::min(timeout, kConnectTimeout);
    cli.set_connection_timeout(connect.count() / 1000, (connect.count() % 1000) * 1000);
    cli.set_read_timeout(timeout.count() / 1000, (timeout.count() % 1000) * 1000);
    cli.set_write_timeout(timeout.count() / 1000, (timeout.count() % 1000) * 1000);
}

std::string DescribeFailure(const httplib::Result& res) {
    if (res) {
        return "HTTP Error " + std::to_string(res->status) + ": " + res->body;
    }
    return "Connection failed: " + httplib::to_string(res.error());
}
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::string OllamaClient::chat(const std::string& model,
                               const nlohmann::json& messages,
                               const ChatOptions& options) {
    httplib::Client cli(m_host, m_port);
    ApplyTimeouts(cli, options.timeout);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", options.temperature},
            {"num_predict", options.maxTokens},
            {"seed", kDeterministicSeed}
        }}
    };

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        std::string reason = DescribeFailure(res);
        std::cerr << "[OllamaClient] Chat " << reason << std::endl;
        throw domain::ExternalUnavailableError("Reasoning service unavailable: " + reason);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            return body["message"]["content"].get<std::string>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    throw domain::ExternalUnavailableError("Reasoning service returned an unexpected envelope");
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model,
                                              const std::string& text,
                                              std::chrono::milliseconds timeout) {
    httplib::Client cli(m_host, m_port);
    ApplyTimeouts(cli, timeout);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        std::string reason = DescribeFailure(res);
        std::cerr << "[OllamaClient] Embedding " << reason << std::endl;
        throw domain::ExternalUnavailableError("Embedding service unavailable: " + reason);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("embedding") && body["embedding"].is_array()) {
            return body["embedding"].get<std::vector<float>>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
    }
    throw domain::ExternalUnavailableError("Embedding service returned an unexpected envelope");
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
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "[OllamaClient] Failed to list models. " << DescribeFailure(res) << std::endl;
    }
    return models;
}

} // namespace amlgate::infrastructure
