/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace amlgate::infrastructure {

namespace {

using json = nlohmann::json;

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && j[key].is_number()) {
        long long value = j[key].get<long long>();
        if (value < 0) {
            throw domain::InvariantViolationError(std::string("timeouts_ms.") + key + " must not be negative");
        }
        out = std::chrono::milliseconds(value);
    }
}

void RequirePositive(std::chrono::milliseconds value, const char* key) {
    if (value.count() <= 0) {
        throw domain::InvariantViolationError(std::string("timeouts_ms.") + key + " must be positive");
    }
}

template <typename T>
void ReadValue(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found. Using defaults." << std::endl;
        return config;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;

        if (j.contains("thresholds")) {
            const auto& t = j["thresholds"];
            ReadValue(t, "statistical_gate", config.thresholds.statisticalGate);
            ReadValue(t, "narrative_gate", config.thresholds.narrativeGate);
            ReadValue(t, "expert_confidence_block", config.thresholds.expertConfidenceBlock);
            ReadValue(t, "expert_confidence_review", config.thresholds.expertConfidenceReview);
        }
        if (j.contains("ollama")) {
            const auto& o = j["ollama"];
            ReadValue(o, "host", config.ollama.host);
            ReadValue(o, "port", config.ollama.port);
            ReadValue(o, "model", config.ollama.model);
            ReadValue(o, "embedding_model", config.ollama.embeddingModel);
        }
        if (j.contains("timeouts_ms")) {
            const auto& t = j["timeouts_ms"];
            ReadMillis(t, "statistical", config.timeouts.statistical);
            ReadMillis(t, "narrative", config.timeouts.narrative);
            ReadMillis(t, "reasoning", config.timeouts.reasoning);
            ReadMillis(t, "search", config.timeouts.search);
            ReadMillis(t, "case", config.timeouts.perCase);
        }
        if (j.contains("reasoning")) {
            ReadValue(j["reasoning"], "max_tokens", config.reasoning.maxTokens);
            ReadValue(j["reasoning"], "temperature", config.reasoning.temperature);
        }
        if (j.contains("knowledge")) {
            ReadValue(j["knowledge"], "index_path", config.knowledge.indexPath);
            long long maxChars = static_cast<long long>(config.knowledge.maxCharsPerResult);
            ReadValue(j["knowledge"], "max_chars_per_result", maxChars);
            if (maxChars <= 0) {
                throw domain::InvariantViolationError("knowledge.max_chars_per_result must be positive");
            }
            config.knowledge.maxCharsPerResult = static_cast<size_t>(maxChars);
        }
        if (j.contains("report")) {
            ReadValue(j["report"], "filing_institution", config.filingInstitution);
        }
        if (j.contains("batch")) {
            ReadValue(j["batch"], "workers", config.batchWorkers);
        }
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << ". Using defaults." << std::endl;
        return AppConfig{};
    }

    config.thresholds.validate();
    RequirePositive(config.timeouts.statistical, "statistical");
    RequirePositive(config.timeouts.narrative, "narrative");
    RequirePositive(config.timeouts.reasoning, "reasoning");
    RequirePositive(config.timeouts.search, "search");
    if (config.batchWorkers < 1) config.batchWorkers = 1;
    return config;
}

} // namespace amlgate::infrastructure
