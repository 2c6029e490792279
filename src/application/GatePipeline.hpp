/**
 * @file GatePipeline.hpp
 * @brief Staged screening: statistical gate, narrative gate, then adjudication.
 */

#pragma once

#include <chrono>
#include <memory>

#include "application/VerdictAdjudicator.hpp"
#include "domain/Deadline.hpp"
#include "domain/GateEngines.hpp"
#include "domain/PipelineResult.hpp"

namespace amlgate::application {

/** @brief Latency budget per gate. Exceeding one is logged, not fatal. */
struct GateBudgets {
    std::chrono::milliseconds statistical{10};
    std::chrono::milliseconds narrative{200};
};

/**
 * @class GatePipeline
 * @brief Runs each stage only when the previous one flagged the transaction.
 *
 * INIT -> STAT_GATE -> {APPROVE | NARRATIVE_GATE} -> {APPROVE | ADJUDICATE}.
 * Collaborator failures propagate; the pipeline never approves on error.
 */
class GatePipeline {
public:
    GatePipeline(std::shared_ptr<domain::StatisticalGate> statisticalGate,
                 std::shared_ptr<domain::NarrativeGate> narrativeGate,
                 std::shared_ptr<VerdictAdjudicator> adjudicator,
                 GateBudgets budgets = GateBudgets());

    /**
     * @brief Screens one transaction.
     * @throws domain::InvariantViolationError on invalid input or out-of-range gate scores.
     * @throws domain::ExternalUnavailableError when a collaborator fails.
     * @throws domain::DeadlineExceededError when the deadline expires.
     */
    domain::PipelineResult process(const domain::Transaction& transaction,
                                   const domain::AccountHistory& history,
                                   const domain::Deadline& deadline = domain::Deadline()) const;

    /** @brief Which gate(s) escalated, given each gate's outcome. */
    static domain::TriggerReason ComputeTrigger(bool statisticalPassed, bool narrativePassed);

private:
    static void CheckBudget(const char* gate, double elapsedMs, std::chrono::milliseconds budget);

    std::shared_ptr<domain::StatisticalGate> m_statisticalGate;
    std::shared_ptr<domain::NarrativeGate> m_narrativeGate;
    std::shared_ptr<VerdictAdjudicator> m_adjudicator;
    GateBudgets m_budgets;
};

} // namespace amlgate::application
