/**
 * @file VerdictAdjudicator.cpp
 * @brief Implementation of the VerdictAdjudicator service.
 */

#include "application/VerdictAdjudicator.hpp"

#include <iostream>
#include <sstream>
#include <variant>

#include "application/VerdictDecoder.hpp"
#include "domain/services/RiskFactorSynthesizer.hpp"
#include "domain/services/TypologyDetector.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace amlgate::application {

namespace {
const char* kCitationRelevance = "Cited by adjudicator";
}

VerdictAdjudicator::VerdictAdjudicator(std::shared_ptr<domain::KnowledgeBase> knowledge,
                                       std::shared_ptr<domain::ReasoningService> reasoning,
                                       domain::Thresholds thresholds,
                                       domain::services::ReportDrafter drafter,
                                       AdjudicatorSettings settings)
    : m_reasoning(std::move(reasoning)),
      m_contextAssembler(std::move(knowledge), settings.maxCharsPerResult, settings.searchTimeout),
      m_thresholds(thresholds),
      m_drafter(std::move(drafter)),
      m_settings(settings) {
    m_thresholds.validate();
}

domain::Verdict VerdictAdjudicator::adjudicate(const domain::AdjudicationInput& input,
                                               const domain::Deadline& deadline) const {
    auto start = std::chrono::steady_clock::now();

    auto matches = domain::services::TypologyDetector::DetectAll(input);
    std::optional<domain::TypologyMatch> primary;
    if (!matches.empty()) primary = matches.front();

    auto riskFactors = domain::services::RiskFactorSynthesizer::Synthesize(input, primary);

    auto context = m_contextAssembler.assemble(input, primary, deadline);

    domain::ReasoningRequest request;
    request.systemPrompt = infrastructure::PromptCatalog::GetAdjudicationSystemPrompt();
    request.userMessage = infrastructure::PromptCatalog::BuildAdjudicationPrompt(input, primary, context.render());
    request.maxTokens = m_settings.maxTokens;
    request.temperature = m_settings.temperature;

    std::string raw = domain::CallWithin(deadline, m_settings.reasoningTimeout, "adjudication reasoning",
                                         [&](std::chrono::milliseconds timeout) {
                                             request.timeout = timeout;
                                             return m_reasoning->chat(request);
                                         });
    deadline.check("adjudication reasoning");

    ParsedVerdict parsed;
    bool malformed = false;
    auto decoded = VerdictDecoder::Decode(raw);
    if (auto* bad = std::get_if<MalformedVerdict>(&decoded)) {
        std::cerr << "[VerdictAdjudicator] Malformed reasoning response (" << raw.size()
                  << " bytes): " << bad->error << ". Falling back to REVIEW." << std::endl;
        parsed.decision = domain::Decision::Review;
        parsed.confidence = 0.5;
        parsed.reasoning = bad->rawText;
        malformed = true;
    } else {
        parsed = std::get<ParsedVerdict>(std::move(decoded));
    }

    domain::Decision decision = ApplyConfidenceFloors(parsed.decision, parsed.confidence, m_thresholds);
    if (decision != parsed.decision) {
        std::cout << "[VerdictAdjudicator] " << domain::ToString(parsed.decision) << " at confidence "
                  << parsed.confidence << " demoted to REVIEW" << std::endl;
    }

    domain::Verdict verdict(decision, parsed.confidence, parsed.reasoning);
    if (primary) {
        verdict.typology = primary->getName();
        verdict.typologyConfidence = primary->getConfidence();
    }
    verdict.riskScore = input.getStatisticalScore();
    verdict.citations = BuildCitations(parsed.regulatoryCitations);
    verdict.malformedResponse = malformed;

    if (decision == domain::Decision::Block || decision == domain::Decision::Review) {
        verdict.reportDraft = m_drafter.draft(input, primary, riskFactors, parsed.reasoning);
    }
    verdict.riskFactors = std::move(riskFactors);

    verdict.modelUsed = m_reasoning->getCurrentModel();
    verdict.processingTimeMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return verdict;
}

domain::Decision VerdictAdjudicator::ApplyConfidenceFloors(domain::Decision decision,
                                                           double confidence,
                                                           const domain::Thresholds& thresholds) {
    if (decision == domain::Decision::Block && confidence < thresholds.expertConfidenceBlock) {
        return domain::Decision::Review;
    }
    if (decision == domain::Decision::Approve && confidence < thresholds.expertConfidenceReview) {
        return domain::Decision::Review;
    }
    return decision;
}

std::vector<domain::RegulatoryReference> VerdictAdjudicator::BuildCitations(const std::vector<std::string>& cited) {
    std::vector<domain::RegulatoryReference> citations;
    citations.reserve(cited.size());
    for (const auto& ref : cited) {
        std::istringstream words(ref);
        std::string source;
        if (!(words >> source)) source = "Unknown";
        citations.push_back({source, ref, kCitationRelevance});
    }
    return citations;
}

} // namespace amlgate::application
