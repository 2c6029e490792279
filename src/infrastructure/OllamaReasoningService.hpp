/**
 * @file OllamaReasoningService.hpp
 * @brief Reasoning service backed by a local Ollama server.
 */

#pragma once
#include "domain/ReasoningService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace amlgate::infrastructure {

/**
 * @class OllamaReasoningService
 * @brief Implements ReasoningService using the Ollama /api/chat endpoint.
 */
class OllamaReasoningService : public domain::ReasoningService {
public:
    /**
     * @param client Shared HTTP client.
     * @param model Preferred model name.
     * @param defaultTimeout Read timeout when a request carries none.
     */
    OllamaReasoningService(std::shared_ptr<OllamaClient> client,
                           std::string model,
                           std::chrono::milliseconds defaultTimeout);

    /** @brief Checks the preferred model is installed and falls back to the best available one. */
    void initialize();

    /** @see domain::ReasoningService::chat */
    std::string chat(const domain::ReasoningRequest& request) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model; ///< Target model name.
    std::chrono::milliseconds m_defaultTimeout;
};

} // namespace amlgate::infrastructure
