/**
 * @file VerdictAdjudicator.hpp
 * @brief Final adjudication of escalated transactions.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "application/ContextAssembler.hpp"
#include "domain/Adjudication.hpp"
#include "domain/Deadline.hpp"
#include "domain/KnowledgeBase.hpp"
#include "domain/ReasoningService.hpp"
#include "domain/Thresholds.hpp"
#include "domain/services/ReportDrafter.hpp"

namespace amlgate::application {

/** @brief Parameters of the reasoning call made for each adjudication. */
struct AdjudicatorSettings {
    int maxTokens = 1500;
    double temperature = 0.0;
    std::chrono::milliseconds reasoningTimeout{3000};
    std::chrono::milliseconds searchTimeout{2000};
    size_t maxCharsPerResult = 1500;
};

/**
 * @class VerdictAdjudicator
 * @brief Combines typology detection, regulatory context and a reasoning call into a Verdict.
 *
 * Holds only shared collaborators and read-only settings, so one instance can serve
 * concurrent adjudications.
 */
class VerdictAdjudicator {
public:
    VerdictAdjudicator(std::shared_ptr<domain::KnowledgeBase> knowledge,
                       std::shared_ptr<domain::ReasoningService> reasoning,
                       domain::Thresholds thresholds,
                       domain::services::ReportDrafter drafter,
                       AdjudicatorSettings settings = AdjudicatorSettings());

    /**
     * @brief Adjudicates one escalated case.
     * @throws domain::ExternalUnavailableError if search or reasoning fails.
     * @throws domain::DeadlineExceededError if the deadline expires first.
     */
    domain::Verdict adjudicate(const domain::AdjudicationInput& input,
                               const domain::Deadline& deadline = domain::Deadline()) const;

    /** @brief Demotes weak BLOCK and APPROVE decisions to REVIEW. */
    static domain::Decision ApplyConfidenceFloors(domain::Decision decision,
                                                  double confidence,
                                                  const domain::Thresholds& thresholds);

    /** @brief One reference per cited string; the first word is taken as the source. */
    static std::vector<domain::RegulatoryReference> BuildCitations(const std::vector<std::string>& cited);

private:
    std::shared_ptr<domain::ReasoningService> m_reasoning;
    ContextAssembler m_contextAssembler;
    domain::Thresholds m_thresholds;
    domain::services::ReportDrafter m_drafter;
    AdjudicatorSettings m_settings;
};

} // namespace amlgate::application
