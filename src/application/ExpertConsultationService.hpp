/**
 * @file ExpertConsultationService.hpp
 * @brief Question answering and search over the regulatory knowledge base.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/KnowledgeBase.hpp"
#include "domain/ReasoningService.hpp"

namespace amlgate::application {

/**
 * @class ExpertConsultationService
 * @brief Answers compliance questions grounded on retrieved regulatory text.
 */
class ExpertConsultationService {
public:
    ExpertConsultationService(std::shared_ptr<domain::KnowledgeBase> knowledge,
                              std::shared_ptr<domain::ReasoningService> reasoning,
                              size_t maxCharsPerResult,
                              std::chrono::milliseconds timeout);

    /**
     * @brief Answers a question from the eight most relevant documents.
     * @param question Free-text question.
     * @param sourceFilter Restrict retrieval to one source ("FATF", "EU"...).
     * @throws domain::ExternalUnavailableError if search or reasoning fails.
     */
    std::string ask(const std::string& question, const std::optional<std::string>& sourceFilter = std::nullopt);

    /** @brief Ranked hits with text previews capped at 500 characters. */
    std::vector<domain::SearchHit> search(const std::string& query, int limit = 5);

private:
    std::shared_ptr<domain::KnowledgeBase> m_knowledge;
    std::shared_ptr<domain::ReasoningService> m_reasoning;
    size_t m_maxChars;
    std::chrono::milliseconds m_timeout;
};

} // namespace amlgate::application
