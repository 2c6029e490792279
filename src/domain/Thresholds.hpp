/**
 * @file Thresholds.hpp
 * @brief Process-wide decision thresholds for the screening pipeline.
 */

#pragma once

#include "domain/Errors.hpp"

namespace amlgate::domain {

/**
 * @struct Thresholds
 * @brief Gate and confidence-floor thresholds. Loaded once, read-only afterwards.
 */
struct Thresholds {
    double statisticalGate = 3.0;        ///< Statistical score above this escalates to the narrative gate.
    double narrativeGate = 0.7;          ///< Coherence below this escalates to adjudication.
    double expertConfidenceBlock = 0.8;  ///< Minimum confidence to keep a BLOCK.
    double expertConfidenceReview = 0.5; ///< Minimum confidence to keep an APPROVE.

    /** @brief Throws InvariantViolationError when a threshold is outside its score range. */
    void validate() const {
        if (statisticalGate < 0.0 || statisticalGate > 10.0) {
            throw InvariantViolationError("statistical_gate must be within [0, 10]");
        }
        if (narrativeGate < 0.0 || narrativeGate > 1.0) {
            throw InvariantViolationError("narrative_gate must be within [0, 1]");
        }
        if (expertConfidenceBlock < 0.0 || expertConfidenceBlock > 1.0) {
            throw InvariantViolationError("expert_confidence_block must be within [0, 1]");
        }
        if (expertConfidenceReview < 0.0 || expertConfidenceReview > 1.0) {
            throw InvariantViolationError("expert_confidence_review must be within [0, 1]");
        }
    }
};

} // namespace amlgate::domain
