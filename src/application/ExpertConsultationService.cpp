/**
 * @file ExpertConsultationService.cpp
 * @brief Implementation of the ExpertConsultationService.
 */

#include "application/ExpertConsultationService.hpp"

#include <iostream>

#include "application/ContextAssembler.hpp"
#include "domain/TextFormat.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace amlgate::application {

namespace {
constexpr int kAskLimit = 8;
constexpr int kAskMaxTokens = 2000;
constexpr size_t kPreviewChars = 500;
}

ExpertConsultationService::ExpertConsultationService(std::shared_ptr<domain::KnowledgeBase> knowledge,
                                                     std::shared_ptr<domain::ReasoningService> reasoning,
                                                     size_t maxCharsPerResult,
                                                     std::chrono::milliseconds timeout)
    : m_knowledge(std::move(knowledge)),
      m_reasoning(std::move(reasoning)),
      m_maxChars(maxCharsPerResult),
      m_timeout(timeout) {}

std::string ExpertConsultationService::ask(const std::string& question,
                                           const std::optional<std::string>& sourceFilter) {
    auto hits = m_knowledge->search(question, kAskLimit, sourceFilter);
    std::cout << "[ExpertConsultation] Found " << hits.size() << " relevant documents" << std::endl;

    domain::ReasoningRequest request;
    request.systemPrompt = infrastructure::PromptCatalog::GetConsultationSystemPrompt();
    request.userMessage = infrastructure::PromptCatalog::BuildConsultationPrompt(
        ContextAssembler::FormatHits(hits, m_maxChars), question);
    request.maxTokens = kAskMaxTokens;
    request.temperature = 0.0;
    request.timeout = m_timeout;
    return m_reasoning->chat(request);
}

std::vector<domain::SearchHit> ExpertConsultationService::search(const std::string& query, int limit) {
    auto hits = m_knowledge->search(query, limit);
    for (auto& hit : hits) {
        hit.text = domain::TruncateUtf8(hit.text, kPreviewChars);
    }
    return hits;
}

} // namespace amlgate::application
