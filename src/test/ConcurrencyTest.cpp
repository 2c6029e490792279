#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/BatchScreeningService.hpp"
#include "infrastructure/PrecomputedGates.hpp"
#include "TestFixtures.hpp"

using namespace amlgate;

// Mock reasoning service that simulates network delay and answers by amount
class SlowReasoningService : public domain::ReasoningService {
public:
    std::string chat(const domain::ReasoningRequest& request) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        inFlight++;
        int now = inFlight.load();
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        inFlight--;
        calls++;

        if (request.userMessage.find("$9,800.00") != std::string::npos) {
            return "{\"decision\": \"BLOCK\", \"confidence\": 0.95}";
        }
        return "{\"decision\": \"APPROVE\", \"confidence\": 0.9}";
    }

    std::string getCurrentModel() const override { return "slow-mock"; }

    std::atomic<int> calls{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
};

int main() {
    std::cout << "[Test] Starting Batch Screening Concurrency Test..." << std::endl;

    const int NUM_CASES = 60;
    std::vector<domain::ScreeningCase> cases;
    infrastructure::ScoreTable statScores;
    infrastructure::ScoreTable narrScores;

    // Every third case is laundering: it escalates and is blocked.
    // Every fifth case is invalid and must fail on its own.
    for (int i = 0; i < NUM_CASES; ++i) {
        std::string id = "TX-" + std::to_string(i);
        bool laundering = i % 3 == 0;
        auto tx = test::MakeTransaction(laundering ? 9800.0 : 120.0, "ACH", id);
        tx.isLaundering = laundering;
        auto history = test::MakeHistory(50, 100000.0, 20000.0, 4.0, 10);
        if (i % 5 == 1) history.stats.uniqueCounterparties = -3;

        statScores[id] = laundering ? 7.5 : (i % 2 == 0 ? 1.0 : 4.0);
        narrScores[id] = laundering ? 0.2 : 0.9;
        cases.push_back({tx, history});
    }

    auto reasoning = std::make_shared<SlowReasoningService>();
    auto adjudicator = std::make_shared<application::VerdictAdjudicator>(
        std::make_shared<test::InMemoryKnowledgeBase>(), reasoning, domain::Thresholds(),
        domain::services::ReportDrafter());
    auto pipeline = std::make_shared<application::GatePipeline>(
        std::make_shared<infrastructure::PrecomputedStatisticalGate>(statScores, 3.0),
        std::make_shared<infrastructure::PrecomputedNarrativeGate>(narrScores, 0.7),
        adjudicator);

    application::BatchScreeningService batch(pipeline, 8);

    auto startTime = std::chrono::steady_clock::now();
    auto report = batch.run(cases);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    std::cout << "[Test] Batch finished in " << elapsed.count() << " ms" << std::endl;

    // Validation
    assert(report.outcomes.size() == cases.size());

    int expectedErrors = 0;
    int expectedEscalations = 0;
    for (int i = 0; i < NUM_CASES; ++i) {
        const auto& outcome = report.outcomes[i];
        if (i % 5 == 1) {
            expectedErrors++;
            assert(!outcome.succeeded() && "Invalid case must fail.");
            assert(outcome.error.find("unique_counterparties") != std::string::npos);
            continue;
        }
        assert(outcome.succeeded());
        assert(*outcome.result->transactionId == "TX-" + std::to_string(i) && "Outcomes keep input order.");
        if (i % 3 == 0) {
            expectedEscalations++;
            assert(outcome.result->finalDecision == domain::Decision::Block);
            assert(outcome.result->layersInvoked.size() == 3);
        } else {
            assert(outcome.result->finalDecision == domain::Decision::Approve);
            assert(!outcome.result->expertResult);
        }
    }
    std::cout << "[PASS] Outcomes in input order with isolated failures." << std::endl;

    assert(report.errorCount == expectedErrors);
    assert(reasoning->calls == expectedEscalations);
    assert(report.metrics.total() == NUM_CASES - expectedErrors);
    assert(report.metrics.falsePositives == 0 && report.metrics.falseNegatives == 0);
    assert(report.metrics.precision() == 1.0 && report.metrics.recall() == 1.0);
    std::cout << "[PASS] Metrics match labels." << std::endl;

    if (reasoning->maxInFlight > 1) {
        std::cout << "[PASS] Adjudications overlapped (max in flight " << reasoning->maxInFlight << ")." << std::endl;
    } else {
        std::cout << "[WARN] No overlap observed; scheduler may have serialised the workers." << std::endl;
    }

    // Cancellation fails every remaining case instead of hanging
    domain::CancellationToken token;
    token.cancel();
    auto cancelled = batch.run(cases, token);
    assert(cancelled.errorCount == NUM_CASES);
    std::cout << "[PASS] Cancelled batch reports every case as an error." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
