/**
 * @file RiskFactorSynthesizer.hpp
 * @brief Turns raw scores and the primary typology into severity-tagged risk factors.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/Adjudication.hpp"
#include "domain/Typology.hpp"

namespace amlgate::domain::services {

class RiskFactorSynthesizer {
public:
    /**
     * @brief Deterministic in (statistical score, narrative score, typology, amount).
     * @param input Escalated case.
     * @param primaryTypology Highest-confidence typology match, if any.
     * @return Factors in rule order; empty for an all-clean input.
     */
    static std::vector<RiskFactor> Synthesize(const AdjudicationInput& input,
                                              const std::optional<TypologyMatch>& primaryTypology);
};

} // namespace amlgate::domain::services
