/**
 * @file PromptCatalog.hpp
 * @brief Central storage for system roles and prompt templates sent to the reasoning service.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Adjudication.hpp"
#include "domain/Typology.hpp"

namespace amlgate::infrastructure {

class PromptCatalog {
public:
    /** @brief System role for adjudication; demands a single JSON object. */
    static std::string GetAdjudicationSystemPrompt();

    /** @brief System role for free-form expert consultation. */
    static std::string GetConsultationSystemPrompt();

    /** @brief Structured prompt describing one escalated case. */
    static std::string BuildAdjudicationPrompt(const domain::AdjudicationInput& input,
                                               const std::optional<domain::TypologyMatch>& typology,
                                               const std::string& regulatoryContext);

    /** @brief Question prompt grounded on retrieved regulatory context. */
    static std::string BuildConsultationPrompt(const std::string& regulatoryContext, const std::string& question);
};

} // namespace amlgate::infrastructure
