#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "application/ExpertConsultationService.hpp"
#include "application/VerdictAdjudicator.hpp"
#include "domain/TextFormat.hpp"
#include "TestFixtures.hpp"

using namespace amlgate::domain;
using namespace amlgate::application;
using namespace amlgate::test;

namespace {

std::vector<SearchHit> RegulatoryHits() {
    return {
        {"Structuring is the breaking up of currency transactions to evade reporting.", {"FATF", "typologies.pdf"}, 0.91},
        {"Institutions must file a SAR within 30 days of detection.", {"FinCEN", "sar_guidance.pdf"}, 0.84},
    };
}

struct Harness {
    std::shared_ptr<MockReasoningService> reasoning;
    std::shared_ptr<InMemoryKnowledgeBase> knowledge;
    std::unique_ptr<VerdictAdjudicator> adjudicator;
};

Harness Make(const std::string& response,
             std::vector<SearchHit> hits = RegulatoryHits(),
             AdjudicatorSettings settings = AdjudicatorSettings()) {
    Harness h;
    h.reasoning = std::make_shared<MockReasoningService>(response);
    h.knowledge = std::make_shared<InMemoryKnowledgeBase>(std::move(hits));
    h.adjudicator = std::make_unique<VerdictAdjudicator>(h.knowledge, h.reasoning, Thresholds(),
                                                          services::ReportDrafter("Test Bank"), settings);
    return h;
}

std::string Repeat(const std::string& piece, int times) {
    std::string out;
    for (int i = 0; i < times; ++i) out += piece;
    return out;
}

/** @brief True when nlohmann/json accepts the text as a UTF-8 string value. */
bool SerialisesAsJson(const std::string& text) {
    try {
        nlohmann::json({{"content", text}}).dump();
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

AdjudicationInput StructuringCase() {
    return MakeInput(9800.0, 7.5, 0.25, MakeHistory(50, 100000.0, 20000.0, 4.0, 10));
}

} // namespace

int main() {
    std::cout << "[Test] Starting VerdictAdjudicator Test..." << std::endl;

    // Confident BLOCK keeps its decision and drafts a report
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.9, \"reasoning\": \"Classic structuring.\","
                      " \"regulatory_citations\": [\"FATF Recommendation 20\", \"\"]}");
        auto verdict = h.adjudicator->adjudicate(StructuringCase());

        assert(verdict.decision == Decision::Block);
        assert(verdict.confidence == 0.9);
        assert(verdict.typology && *verdict.typology == "Structuring");
        assert(verdict.typologyConfidence && *verdict.typologyConfidence == 1.0);
        assert(verdict.riskScore == 7.5);
        assert(verdict.riskFactors.size() == 4);
        assert(verdict.reportDraft && "BLOCK must carry a report draft.");
        assert(verdict.reportDraft->activityType == "Structuring");
        assert(verdict.reportDraft->detailedDescription.find("Classic structuring.") != std::string::npos);
        assert(verdict.citations.size() == 2);
        assert(verdict.citations[0].source == "FATF");
        assert(verdict.citations[0].reference == "FATF Recommendation 20");
        assert(verdict.citations[1].source == "Unknown");
        assert(!verdict.malformedResponse);
        assert(verdict.modelUsed == "mock-model");
        assert(verdict.processingTimeMs >= 0.0);
        std::cout << "[PASS] Confident BLOCK." << std::endl;

        // Typology, threshold and SAR guidance were all requested
        auto queries = h.knowledge->getQueries();
        assert(queries.size() == 5);
        assert(queries[0] == "Structuring money laundering typology red flags");
        assert(queries[3] == "structuring reporting threshold $10000");
        assert(queries[4] == "suspicious activity report filing requirements");

        auto requests = h.reasoning->getRequests();
        assert(requests.size() == 1);
        assert(requests[0].maxTokens == 1500);
        assert(requests[0].temperature == 0.0);
        assert(requests[0].timeout && requests[0].timeout->count() == 3000);
        assert(requests[0].userMessage.find("TYPOLOGY GUIDANCE (Structuring)") != std::string::npos);
        assert(requests[0].userMessage.find("SOURCE 1: [FATF] typologies.pdf") != std::string::npos);
        assert(requests[0].userMessage.find("Typical indicators: amounts_near_threshold") != std::string::npos);
        std::cout << "[PASS] Context and request shape." << std::endl;
    }

    // Weak BLOCK is demoted to REVIEW, still with a report
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.6, \"reasoning\": \"Possibly structuring.\"}");
        auto verdict = h.adjudicator->adjudicate(StructuringCase());
        assert(verdict.decision == Decision::Review);
        assert(verdict.confidence == 0.6);
        assert(verdict.reportDraft);
        std::cout << "[PASS] Weak BLOCK demoted." << std::endl;
    }

    // Weak APPROVE is demoted to REVIEW
    {
        auto h = Make("{\"decision\": \"APPROVE\", \"confidence\": 0.3}");
        auto verdict = h.adjudicator->adjudicate(StructuringCase());
        assert(verdict.decision == Decision::Review);
        assert(verdict.reportDraft);
        std::cout << "[PASS] Weak APPROVE demoted." << std::endl;
    }

    // Confident APPROVE has no report
    {
        auto h = Make("{\"decision\": \"APPROVE\", \"confidence\": 0.85, \"reasoning\": \"Payroll run.\"}");
        auto verdict = h.adjudicator->adjudicate(MakeInput(500.0, 4.0, 0.6, MakeHistory(10, 5000.0, 5000.0, 0.5, 3)));
        assert(verdict.decision == Decision::Approve);
        assert(!verdict.reportDraft && "APPROVE must not carry a report draft.");
        assert(!verdict.typology);
        assert(h.knowledge->getQueries().size() == 1 && "Only SAR guidance without typology or threshold.");
        std::cout << "[PASS] Confident APPROVE." << std::endl;
    }

    // Floor laws at the boundaries
    {
        Thresholds t;
        assert(VerdictAdjudicator::ApplyConfidenceFloors(Decision::Block, 0.8, t) == Decision::Block);
        assert(VerdictAdjudicator::ApplyConfidenceFloors(Decision::Block, 0.79, t) == Decision::Review);
        assert(VerdictAdjudicator::ApplyConfidenceFloors(Decision::Approve, 0.5, t) == Decision::Approve);
        assert(VerdictAdjudicator::ApplyConfidenceFloors(Decision::Approve, 0.49, t) == Decision::Review);
        assert(VerdictAdjudicator::ApplyConfidenceFloors(Decision::Review, 0.1, t) == Decision::Review);
        std::cout << "[PASS] Confidence floors." << std::endl;
    }

    // Malformed response falls back to REVIEW with the raw text
    {
        std::string raw = "I am not able to answer in JSON today.";
        auto h = Make(raw);
        auto verdict = h.adjudicator->adjudicate(StructuringCase());
        assert(verdict.decision == Decision::Review);
        assert(verdict.confidence == 0.5);
        assert(verdict.reasoning == raw);
        assert(verdict.malformedResponse);
        assert(verdict.citations.empty());
        assert(verdict.reportDraft);
        std::cout << "[PASS] Malformed response falls back to REVIEW." << std::endl;
    }

    // Reasoning outage propagates
    {
        auto h = Make("{}");
        h.reasoning->setUnavailable(true);
        bool threw = false;
        try {
            h.adjudicator->adjudicate(StructuringCase());
        } catch (const ExternalUnavailableError&) {
            threw = true;
        }
        assert(threw && "Reasoning failures must not be masked.");

        // An outage well inside the deadline is not reported as a timeout
        bool reportedAsDeadline = false;
        bool reportedAsOutage = false;
        try {
            h.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(60000)));
        } catch (const DeadlineExceededError&) {
            reportedAsDeadline = true;
        } catch (const ExternalUnavailableError&) {
            reportedAsOutage = true;
        }
        assert(reportedAsOutage && !reportedAsDeadline);
        std::cout << "[PASS] Reasoning outage propagates." << std::endl;
    }

    // Cancelled deadline aborts before any reasoning call
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        CancellationToken token;
        token.cancel();
        bool threw = false;
        try {
            h.adjudicator->adjudicate(StructuringCase(), Deadline(std::nullopt, token));
        } catch (const DeadlineExceededError& e) {
            threw = true;
            assert(!e.getStage().empty());
        }
        assert(threw);
        assert(h.reasoning->getRequests().empty());
        std::cout << "[PASS] Cancellation aborts adjudication." << std::endl;
    }

    // The remaining time bounds the reasoning timeout
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        h.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(60000)));
        auto requests = h.reasoning->getRequests();
        assert(requests.size() == 1);
        assert(requests[0].timeout && requests[0].timeout->count() == 3000);

        auto tight = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        tight.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(1500)));
        auto tightRequests = tight.reasoning->getRequests();
        assert(tightRequests.size() == 1);
        assert(tightRequests[0].timeout && tightRequests[0].timeout->count() <= 1500);
        std::cout << "[PASS] Deadline bounds reasoning timeout." << std::endl;
    }

    // A reasoning call that stalls past the deadline surfaces as DeadlineExceededError
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        h.reasoning->setStalled(true);
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            h.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(150)));
        } catch (const DeadlineExceededError& e) {
            threw = true;
            assert(e.getStage().find("adjudication reasoning") != std::string::npos);
        }
        assert(threw && "A timed-out reasoning call must be reported as a deadline expiry.");
        assert(ElapsedMs(start) < 2000 && "The stalled call must be cut at the deadline, not at 3 s.");

        auto requests = h.reasoning->getRequests();
        assert(requests.size() == 1);
        assert(requests[0].timeout && requests[0].timeout->count() <= 150);
        std::cout << "[PASS] Stalled reasoning call ends at the deadline." << std::endl;
    }

    // Without a deadline, the same stall stays an outage
    {
        AdjudicatorSettings settings;
        settings.reasoningTimeout = std::chrono::milliseconds(50);
        auto h = Make("{}", RegulatoryHits(), settings);
        h.reasoning->setStalled(true);
        bool outage = false;
        try {
            h.adjudicator->adjudicate(StructuringCase());
        } catch (const DeadlineExceededError&) {
            assert(false && "No deadline was set.");
        } catch (const ExternalUnavailableError&) {
            outage = true;
        }
        assert(outage);
        std::cout << "[PASS] Unbounded stall reported as outage." << std::endl;
    }

    // Knowledge-base searches carry the bounded timeout and stop at the deadline
    {
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        h.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(60000)));
        auto timeouts = h.knowledge->getTimeouts();
        assert(timeouts.size() == 5);
        for (const auto& timeout : timeouts) {
            assert(timeout && timeout->count() == 2000);
        }

        auto stalled = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}");
        stalled.knowledge->setStalled(true);
        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            stalled.adjudicator->adjudicate(StructuringCase(), Deadline::After(std::chrono::milliseconds(100)));
        } catch (const DeadlineExceededError&) {
            threw = true;
        }
        assert(threw);
        assert(ElapsedMs(start) < 1500 && "Searches must not outlive the deadline.");
        assert(stalled.knowledge->getQueries().size() == 1);
        assert(stalled.knowledge->getTimeouts()[0]->count() <= 100);
        assert(stalled.reasoning->getRequests().empty());
        std::cout << "[PASS] Stalled search ends at the deadline." << std::endl;
    }

    // No time left means no call at all
    {
        Deadline spent = Deadline::After(std::chrono::milliseconds(0));
        bool threw = false;
        try {
            spent.bound(std::chrono::milliseconds(3000), "reasoning");
        } catch (const DeadlineExceededError& e) {
            threw = true;
            assert(e.getStage() == "reasoning");
        }
        assert(threw);
        assert(Deadline().bound(std::chrono::milliseconds(3000)).count() == 3000);
        std::cout << "[PASS] Spent deadline refuses to bound a call." << std::endl;
    }

    // Truncation counts code points and never splits one
    {
        assert(TruncateUtf8("abc", 5) == "abc");
        assert(TruncateUtf8("abcdef", 3) == "abc");
        assert(TruncateUtf8("\xC3\xA9\xE2\x82\xAC\xC2\xA7", 2) == "\xC3\xA9\xE2\x82\xAC"); // e-acute, euro, section
        assert(TruncateUtf8("\xC3\xA9", 0).empty());

        const std::string eAcute = "\xC3\xA9";
        std::vector<SearchHit> hits = {{"a" + Repeat(eAcute, 2000), {"EU", "amld6.pdf"}, 0.9}};
        auto h = Make("{\"decision\": \"BLOCK\", \"confidence\": 0.95}", hits);
        h.adjudicator->adjudicate(StructuringCase());
        const auto message = h.reasoning->getRequests()[0].userMessage;
        assert(SerialisesAsJson(message) && "Context must stay valid UTF-8.");
        assert(message.find("a" + Repeat(eAcute, 1499) + "\n---") != std::string::npos);
        assert(message.find(Repeat(eAcute, 1500)) == std::string::npos);

        ExpertConsultationService consultation(h.knowledge, h.reasoning, 1500, std::chrono::milliseconds(3000));
        auto previews = consultation.search("customer due diligence");
        assert(previews.size() == 1);
        assert(previews[0].text == "a" + Repeat(eAcute, 499));
        assert(SerialisesAsJson(previews[0].text));
        std::cout << "[PASS] Multi-byte regulatory text truncated on character boundaries." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
