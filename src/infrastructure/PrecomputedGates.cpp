/**
 * @file PrecomputedGates.cpp
 * @brief Implementation of the score-table gates.
 */

#include "infrastructure/PrecomputedGates.hpp"

#include "domain/TextFormat.hpp"

#include <optional>

namespace amlgate::infrastructure {

namespace {

std::optional<double> Lookup(const ScoreTable& scores, const domain::Transaction& transaction) {
    if (!transaction.id) return std::nullopt;
    auto it = scores.find(*transaction.id);
    if (it == scores.end()) return std::nullopt;
    return it->second;
}

} // namespace

PrecomputedStatisticalGate::PrecomputedStatisticalGate(ScoreTable scores, double threshold)
    : m_scores(std::move(scores)), m_threshold(threshold) {}

domain::StatisticalAssessment PrecomputedStatisticalGate::analyze(const domain::Transaction& transaction,
                                                                  const domain::AccountHistory& history) {
    auto score = Lookup(m_scores, transaction);

    domain::StatisticalAssessment assessment;
    assessment.score = score.value_or(0.0);
    assessment.passed = assessment.score <= m_threshold;
    assessment.clusterId = history.clusterId.value_or(0);
    assessment.details["source"] = score ? "precomputed" : "default";
    assessment.details["threshold"] = domain::FormatFixed(m_threshold, 2);
    return assessment;
}

PrecomputedNarrativeGate::PrecomputedNarrativeGate(ScoreTable scores, double threshold)
    : m_scores(std::move(scores)), m_threshold(threshold) {}

domain::NarrativeAssessment PrecomputedNarrativeGate::analyze(const domain::Transaction& transaction,
                                                              const domain::AccountHistory&) {
    auto score = Lookup(m_scores, transaction);

    domain::NarrativeAssessment assessment;
    assessment.score = score.value_or(1.0);
    assessment.passed = assessment.score >= m_threshold;
    assessment.details["source"] = score ? "precomputed" : "default";
    assessment.details["threshold"] = domain::FormatFixed(m_threshold, 2);
    return assessment;
}

} // namespace amlgate::infrastructure
