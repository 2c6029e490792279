/**
 * @file BatchScreeningService.cpp
 * @brief Implementation of the BatchScreeningService.
 */

#include "application/BatchScreeningService.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <stdexcept>

namespace amlgate::application {

BatchScreeningService::BatchScreeningService(std::shared_ptr<GatePipeline> pipeline,
                                             int workers,
                                             std::optional<std::chrono::milliseconds> perCaseBudget)
    : m_pipeline(std::move(pipeline)), m_workers(std::max(1, workers)), m_perCaseBudget(perCaseBudget) {
    if (!m_pipeline) {
        throw std::invalid_argument("BatchScreeningService requires a pipeline");
    }
}

BatchReport BatchScreeningService::run(const std::vector<domain::ScreeningCase>& cases,
                                       const domain::CancellationToken& token) const {
    BatchReport report;
    report.outcomes.resize(cases.size());

    // Each slot is written by exactly one worker.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < cases.size(); i = next++) {
            const auto& item = cases[i];
            domain::Deadline deadline = m_perCaseBudget
                ? domain::Deadline::After(*m_perCaseBudget, token)
                : domain::Deadline(std::nullopt, token);
            try {
                report.outcomes[i].result = m_pipeline->process(item.transaction, item.history, deadline);
            } catch (const std::exception& e) {
                report.outcomes[i].error = e.what();
                std::cerr << "[BatchScreening] Case " << i << " ("
                          << item.transaction.id.value_or("<no id>") << ") failed: " << e.what() << std::endl;
            }
        }
    };

    size_t threadCount = std::min(static_cast<size_t>(m_workers), std::max<size_t>(cases.size(), 1));
    std::vector<std::future<void>> futures;
    futures.reserve(threadCount);
    for (size_t t = 0; t < threadCount; ++t) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : futures) {
        f.get();
    }

    for (size_t i = 0; i < cases.size(); ++i) {
        const auto& outcome = report.outcomes[i];
        if (!outcome.succeeded()) {
            report.errorCount++;
            continue;
        }
        if (cases[i].transaction.isLaundering) {
            report.metrics.record(outcome.result->finalDecision, *cases[i].transaction.isLaundering);
        }
    }

    std::cout << "[BatchScreening] Screened " << cases.size() << " cases with " << threadCount
              << " workers (" << report.errorCount << " errors)" << std::endl;
    return report;
}

} // namespace amlgate::application
