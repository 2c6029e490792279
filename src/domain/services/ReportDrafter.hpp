/**
 * @file ReportDrafter.hpp
 * @brief Assembles suspicious activity report drafts for compliance review.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Adjudication.hpp"
#include "domain/Typology.hpp"

namespace amlgate::domain::services {

/**
 * @class ReportDrafter
 * @brief Deterministic template assembly of a ReportDraft. Holds only read-only configuration.
 */
class ReportDrafter {
public:
    explicit ReportDrafter(std::string filingInstitution = "AmlGate");

    /**
     * @brief Drafts a report for an escalated case.
     * @param input The adjudicated case.
     * @param primaryTypology Highest-confidence typology, if any.
     * @param riskFactors Factors produced by the RiskFactorSynthesizer.
     * @param reasoning Reasoning text, embedded verbatim.
     */
    ReportDraft draft(const AdjudicationInput& input,
                      const std::optional<TypologyMatch>& primaryTypology,
                      const std::vector<RiskFactor>& riskFactors,
                      const std::string& reasoning) const;

    /** @brief FATF Recommendation 20 plus typology-specific citations. */
    static std::vector<RegulatoryReference> GetRegulatoryReferences(const std::string& activityType);

    /** @brief First matching rule wins: strong typology, critical factor, >=3 factors, else monitoring. */
    static RecommendedAction RecommendAction(const std::optional<TypologyMatch>& primaryTypology,
                                             const std::vector<RiskFactor>& riskFactors);

private:
    std::string buildSummary(const AdjudicationInput& input,
                             const std::optional<TypologyMatch>& primaryTypology,
                             const std::vector<RiskFactor>& riskFactors) const;

    std::string buildDetailedDescription(const AdjudicationInput& input,
                                         const std::optional<TypologyMatch>& primaryTypology,
                                         const std::vector<RiskFactor>& riskFactors,
                                         const std::string& reasoning) const;

    std::string m_filingInstitution;
};

} // namespace amlgate::domain::services
