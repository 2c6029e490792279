/**
 * @file PrecomputedGates.hpp
 * @brief Gate implementations backed by scores computed by an upstream scorer.
 */

#pragma once

#include <map>
#include <string>

#include "domain/GateEngines.hpp"

namespace amlgate::infrastructure {

/** @brief Read-only scores keyed by transaction id. */
using ScoreTable = std::map<std::string, double>;

/**
 * @class PrecomputedStatisticalGate
 * @brief Passes when the score is at or below the statistical threshold. Unknown ids score 0.
 */
class PrecomputedStatisticalGate : public domain::StatisticalGate {
public:
    PrecomputedStatisticalGate(ScoreTable scores, double threshold);

    domain::StatisticalAssessment analyze(const domain::Transaction& transaction,
                                          const domain::AccountHistory& history) override;

private:
    ScoreTable m_scores;
    double m_threshold;
};

/**
 * @class PrecomputedNarrativeGate
 * @brief Passes when coherence is at or above the narrative threshold. Unknown ids score 1.
 */
class PrecomputedNarrativeGate : public domain::NarrativeGate {
public:
    PrecomputedNarrativeGate(ScoreTable scores, double threshold);

    domain::NarrativeAssessment analyze(const domain::Transaction& transaction,
                                        const domain::AccountHistory& history) override;

private:
    ScoreTable m_scores;
    double m_threshold;
};

} // namespace amlgate::infrastructure
