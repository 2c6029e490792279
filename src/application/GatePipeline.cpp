/**
 * @file GatePipeline.cpp
 * @brief Implementation of the GatePipeline orchestrator.
 */

#include "application/GatePipeline.hpp"

#include <iostream>
#include <stdexcept>

#include "application/InputValidator.hpp"
#include "domain/TextFormat.hpp"

namespace amlgate::application {

namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace

GatePipeline::GatePipeline(std::shared_ptr<domain::StatisticalGate> statisticalGate,
                           std::shared_ptr<domain::NarrativeGate> narrativeGate,
                           std::shared_ptr<VerdictAdjudicator> adjudicator,
                           GateBudgets budgets)
    : m_statisticalGate(std::move(statisticalGate)),
      m_narrativeGate(std::move(narrativeGate)),
      m_adjudicator(std::move(adjudicator)),
      m_budgets(budgets) {
    if (!m_statisticalGate || !m_narrativeGate || !m_adjudicator) {
        throw std::invalid_argument("GatePipeline requires both gates and an adjudicator");
    }
}

domain::PipelineResult GatePipeline::process(const domain::Transaction& transaction,
                                             const domain::AccountHistory& history,
                                             const domain::Deadline& deadline) const {
    InputValidator::ValidateTransaction(transaction);
    InputValidator::ValidateHistory(history);

    auto start = Clock::now();
    domain::PipelineResult result;
    result.transactionId = transaction.id;
    const std::string label = transaction.id.value_or("<no id>");

    // Statistical gate
    deadline.check("statistical gate");
    result.layersInvoked.push_back(domain::Layer::Statistical);
    auto statStart = Clock::now();
    auto stat = m_statisticalGate->analyze(transaction, history);
    double statMs = ElapsedMs(statStart);
    InputValidator::ValidateAssessment(stat);
    CheckBudget("statistical", statMs, m_budgets.statistical);

    result.statisticalResult.layer = domain::Layer::Statistical;
    result.statisticalResult.score = stat.score;
    result.statisticalResult.passed = stat.passed;
    result.statisticalResult.processingTimeMs = statMs;
    result.statisticalResult.details = stat.details;
    result.statisticalResult.details["cluster_id"] = std::to_string(stat.clusterId);
    result.statisticalResult.details["z_score"] = domain::FormatFixed(stat.zScore, 2);

    if (stat.passed) {
        result.finalDecision = domain::Decision::Approve;
        result.finalConfidence = domain::ClampConfidence(1.0 - stat.score / 10.0);
        result.totalProcessingTimeMs = ElapsedMs(start);
        return result;
    }

    // Narrative gate
    deadline.check("narrative gate");
    result.layersInvoked.push_back(domain::Layer::Narrative);
    auto narrStart = Clock::now();
    auto narr = m_narrativeGate->analyze(transaction, history);
    double narrMs = ElapsedMs(narrStart);
    InputValidator::ValidateAssessment(narr);
    CheckBudget("narrative", narrMs, m_budgets.narrative);

    domain::LayerResult narrative;
    narrative.layer = domain::Layer::Narrative;
    narrative.score = narr.score;
    narrative.passed = narr.passed;
    narrative.processingTimeMs = narrMs;
    narrative.details = narr.details;
    result.narrativeResult = narrative;

    if (narr.passed) {
        result.finalDecision = domain::Decision::Approve;
        result.finalConfidence = domain::ClampConfidence(narr.score);
        result.totalProcessingTimeMs = ElapsedMs(start);
        return result;
    }

    // Adjudication
    auto trigger = ComputeTrigger(stat.passed, narr.passed);
    std::cout << "[GatePipeline] " << label << " escalated to adjudication (triggered by "
              << domain::ToString(trigger) << ")" << std::endl;

    result.layersInvoked.push_back(domain::Layer::Expert);
    domain::AdjudicationInput input(transaction, stat.score, narr.score, history, trigger);
    auto verdict = m_adjudicator->adjudicate(input, deadline);

    result.finalDecision = verdict.decision;
    result.finalConfidence = verdict.confidence;
    result.expertResult = std::move(verdict);
    result.totalProcessingTimeMs = ElapsedMs(start);
    return result;
}

domain::TriggerReason GatePipeline::ComputeTrigger(bool statisticalPassed, bool narrativePassed) {
    if (!statisticalPassed && !narrativePassed) return domain::TriggerReason::Both;
    if (!statisticalPassed) return domain::TriggerReason::Statistical;
    return domain::TriggerReason::Narrative;
}

void GatePipeline::CheckBudget(const char* gate, double elapsedMs, std::chrono::milliseconds budget) {
    if (elapsedMs > static_cast<double>(budget.count())) {
        std::cerr << "[GatePipeline] Warning: " << gate << " gate took " << domain::FormatFixed(elapsedMs, 1)
                  << " ms (budget " << budget.count() << " ms)" << std::endl;
    }
}

} // namespace amlgate::application
