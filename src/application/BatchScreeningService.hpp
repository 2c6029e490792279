/**
 * @file BatchScreeningService.hpp
 * @brief Parallel screening of many independent cases.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/GatePipeline.hpp"
#include "domain/Deadline.hpp"
#include "domain/EvaluationMetrics.hpp"
#include "domain/PipelineResult.hpp"
#include "domain/Transaction.hpp"

namespace amlgate::application {

/** @brief Either a pipeline result or the operational error that prevented one. */
struct ScreeningOutcome {
    std::optional<domain::PipelineResult> result;
    std::string error;

    bool succeeded() const { return result.has_value(); }
};

/** @brief Outcomes in input order plus metrics over the labelled ones. */
struct BatchReport {
    std::vector<ScreeningOutcome> outcomes;
    domain::EvaluationMetrics metrics;
    int errorCount = 0;
};

/**
 * @class BatchScreeningService
 * @brief Fans cases out over a fixed number of worker threads sharing one pipeline.
 */
class BatchScreeningService {
public:
    /**
     * @param pipeline Shared, read-only pipeline.
     * @param workers Number of worker threads (at least 1).
     * @param perCaseBudget Deadline applied to each case, if any.
     */
    BatchScreeningService(std::shared_ptr<GatePipeline> pipeline,
                          int workers,
                          std::optional<std::chrono::milliseconds> perCaseBudget = std::nullopt);

    /**
     * @brief Screens every case. A failing case becomes an error outcome; the others still run.
     * @param token Cancelling it makes every remaining case fail with a deadline error.
     */
    BatchReport run(const std::vector<domain::ScreeningCase>& cases,
                    const domain::CancellationToken& token = domain::CancellationToken()) const;

private:
    std::shared_ptr<GatePipeline> m_pipeline;
    int m_workers;
    std::optional<std::chrono::milliseconds> m_perCaseBudget;
};

} // namespace amlgate::application
