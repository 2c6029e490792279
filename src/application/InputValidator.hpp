/**
 * @file InputValidator.hpp
 * @brief Boundary checks applied before and during a pipeline run.
 */

#pragma once

#include "domain/GateEngines.hpp"
#include "domain/Transaction.hpp"

namespace amlgate::application {

/**
 * @class InputValidator
 * @brief Rejects out-of-range values with domain::InvariantViolationError so they never reach a decision.
 */
class InputValidator {
public:
    /** @brief Non-negative, finite amounts. */
    static void ValidateTransaction(const domain::Transaction& transaction);

    /**
     * @brief Non-negative counts, totals and rates; the average must equal
     * total_sent / total_transactions whenever there are transactions.
     */
    static void ValidateHistory(const domain::AccountHistory& history);

    /** @brief Statistical score within [0, 10]. */
    static void ValidateAssessment(const domain::StatisticalAssessment& assessment);

    /** @brief Narrative score within [0, 1]. */
    static void ValidateAssessment(const domain::NarrativeAssessment& assessment);
};

} // namespace amlgate::application
