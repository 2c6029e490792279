/**
 * @file ReasoningService.hpp
 * @brief Interface for the language-model reasoning service.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace amlgate::domain {

/**
 * @struct ReasoningRequest
 * @brief A single-turn chat request.
 */
struct ReasoningRequest {
    std::string userMessage;
    std::string systemPrompt;
    std::string model; ///< Empty selects the service's current model.
    int maxTokens = 4096;
    double temperature = 0.0;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @class ReasoningService
 * @brief Abstract interface for services that answer a prompt with free text.
 */
class ReasoningService {
public:
    virtual ~ReasoningService() = default;

    /**
     * @brief Sends one user message under a system role.
     * @return The assistant's text.
     * @throws ExternalUnavailableError on transport failure or timeout.
     */
    virtual std::string chat(const ReasoningRequest& request) = 0;

    /** @brief Name of the model used when a request leaves it empty. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace amlgate::domain
