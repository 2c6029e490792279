/**
 * @file OllamaReasoningService.cpp
 * @brief Implementation of the OllamaReasoningService class.
 */
#include "infrastructure/OllamaReasoningService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace amlgate::infrastructure {

OllamaReasoningService::OllamaReasoningService(std::shared_ptr<OllamaClient> client,
                                               std::string model,
                                               std::chrono::milliseconds defaultTimeout)
    : m_client(std::move(client)), m_model(std::move(model)), m_defaultTimeout(defaultTimeout) {}

void OllamaReasoningService::initialize() {
    auto availableModels = m_client->getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaReasoningService] No models listed. Is Ollama running? Keeping: " << m_model << std::endl;
        return;
    }

    for (const auto& model : availableModels) {
        if (model == m_model || model.rfind(m_model + ":", 0) == 0) {
            std::cout << "[OllamaReasoningService] Using configured model: " << model << std::endl;
            m_model = model;
            return;
        }
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "qwen2.5",
        "llama3",
        "mistral",
        "gemma"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                std::cout << "[OllamaReasoningService] " << m_model << " not installed. Auto-selected: " << model << std::endl;
                m_model = model;
                return;
            }
        }
    }

    m_model = availableModels[0];
    std::cout << "[OllamaReasoningService] Fallback model: " << m_model << std::endl;
}

std::string OllamaReasoningService::chat(const domain::ReasoningRequest& request) {
    json messages = json::array();
    if (!request.systemPrompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.systemPrompt}});
    }
    messages.push_back({{"role", "user"}, {"content", request.userMessage}});

    OllamaClient::ChatOptions options;
    options.temperature = request.temperature;
    options.maxTokens = request.maxTokens;
    options.timeout = request.timeout.value_or(m_defaultTimeout);

    const std::string& model = request.model.empty() ? m_model : request.model;
    std::cout << "[OllamaReasoningService] Sending request to " << model
              << " PromptSize=" << (request.systemPrompt.size() + request.userMessage.size()) << " bytes"
              << " Timeout=" << options.timeout.count() << "ms" << std::endl;

    std::string content = m_client->chat(model, messages, options);
    std::cout << "[OllamaReasoningService] Response received (" << content.size() << " bytes)" << std::endl;
    return content;
}

} // namespace amlgate::infrastructure
