/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Loaded once at process start; the resulting AppConfig is passed into constructors
 * instead of being read from globals.
 */

#pragma once

#include <chrono>
#include <string>
#include "domain/Thresholds.hpp"

namespace amlgate::infrastructure {

/**
 * @struct AppConfig
 * @brief Immutable process-wide configuration. Every field has a usable default.
 */
struct AppConfig {
    domain::Thresholds thresholds;

    struct Ollama {
        std::string host = "localhost";
        int port = 11434;
        std::string model = "qwen2.5:7b";
        std::string embeddingModel = "nomic-embed-text";
    } ollama;

    /** @brief Per-layer latency budgets. */
    struct Timeouts {
        std::chrono::milliseconds statistical{10};
        std::chrono::milliseconds narrative{200};
        std::chrono::milliseconds reasoning{3000};
        std::chrono::milliseconds search{2000};
        std::chrono::milliseconds perCase{0}; ///< Deadline for one screened case; 0 disables it.
    } timeouts;

    struct Reasoning {
        int maxTokens = 1500;
        double temperature = 0.0;
    } reasoning;

    struct Knowledge {
        std::string indexPath = "regulatory_index.json";
        size_t maxCharsPerResult = 1500;
    } knowledge;

    std::string filingInstitution = "AmlGate";
    int batchWorkers = 4;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. Missing file or keys keep defaults; a malformed file is
     * reported on stderr and defaults are used.
     * @throws domain::InvariantViolationError when a threshold is out of range, a timeout is
     * negative or zero (except timeouts_ms.case, which may be 0), or max_chars_per_result is not positive.
     */
    static AppConfig Load(const std::string& path);
};

} // namespace amlgate::infrastructure
