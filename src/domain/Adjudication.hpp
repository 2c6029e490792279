/**
 * @file Adjudication.hpp
 * @brief Value objects exchanged between the gate pipeline and the verdict adjudicator.
 */

#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"
#include "domain/Transaction.hpp"

namespace amlgate::domain {

/** @brief Which gate(s) escalated the transaction. */
enum class TriggerReason { Statistical, Narrative, Both };

enum class Decision { Block, Approve, Review };

enum class Severity { Low, Medium, High, Critical };

enum class RecommendedAction { FileSar, EnhancedMonitoring, EscalateToCompliance };

inline std::string ToString(TriggerReason reason) {
    switch (reason) {
        case TriggerReason::Statistical: return "statistical";
        case TriggerReason::Narrative: return "narrative";
        case TriggerReason::Both: return "both";
    }
    return "both";
}

inline std::string ToString(Decision decision) {
    switch (decision) {
        case Decision::Block: return "BLOCK";
        case Decision::Approve: return "APPROVE";
        case Decision::Review: return "REVIEW";
    }
    return "REVIEW";
}

inline std::string ToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

inline std::string ToString(RecommendedAction action) {
    switch (action) {
        case RecommendedAction::FileSar: return "file_sar";
        case RecommendedAction::EnhancedMonitoring: return "enhanced_monitoring";
        case RecommendedAction::EscalateToCompliance: return "escalate_to_compliance";
    }
    return "enhanced_monitoring";
}

/** @brief Parses "BLOCK" / "APPROVE" / "REVIEW" (exact, upper case). */
inline std::optional<Decision> DecisionFromString(const std::string& value) {
    if (value == "BLOCK") return Decision::Block;
    if (value == "APPROVE") return Decision::Approve;
    if (value == "REVIEW") return Decision::Review;
    return std::nullopt;
}

/** @brief Clamps a confidence value into [0, 1]. */
inline double ClampConfidence(double value) {
    return std::clamp(value, 0.0, 1.0);
}

/**
 * @class AdjudicationInput
 * @brief Everything the verdict adjudicator needs about one escalated transaction.
 *
 * Built exactly once per escalation by the gate pipeline. Scores are validated here.
 */
class AdjudicationInput {
public:
    AdjudicationInput(Transaction transaction,
                      double statisticalScore,
                      double narrativeScore,
                      AccountHistory history,
                      TriggerReason triggeredBy)
        : m_transaction(std::move(transaction)),
          m_statisticalScore(statisticalScore),
          m_narrativeScore(narrativeScore),
          m_history(std::move(history)),
          m_triggeredBy(triggeredBy) {
        if (!(statisticalScore >= 0.0 && statisticalScore <= 10.0)) {
            throw InvariantViolationError("AdjudicationInput: statistical score must be within [0, 10]");
        }
        if (!(narrativeScore >= 0.0 && narrativeScore <= 1.0)) {
            throw InvariantViolationError("AdjudicationInput: narrative score must be within [0, 1]");
        }
    }

    const Transaction& getTransaction() const { return m_transaction; }
    double getStatisticalScore() const { return m_statisticalScore; }
    double getNarrativeScore() const { return m_narrativeScore; }
    const AccountHistory& getHistory() const { return m_history; }
    const AccountStats& getStats() const { return m_history.stats; }
    TriggerReason getTriggeredBy() const { return m_triggeredBy; }

private:
    Transaction m_transaction;
    double m_statisticalScore;
    double m_narrativeScore;
    AccountHistory m_history;
    TriggerReason m_triggeredBy;
};

/** @brief A single severity-tagged risk factor. */
struct RiskFactor {
    std::string factor;
    Severity severity = Severity::Low;
    std::string description;
    std::vector<std::string> evidence;
};

/** @brief Citation of a regulatory document or requirement. */
struct RegulatoryReference {
    std::string source;    ///< "FATF", "EU AMLD6", "FinCEN"...
    std::string reference; ///< "Recommendation 20", "Article 3(4)"...
    std::string relevance;
};

/**
 * @struct ReportDraft
 * @brief Draft suspicious activity report prepared for compliance review.
 */
struct ReportDraft {
    std::string subjectAccount;
    std::string filingInstitution;
    std::string activityType;
    std::pair<Timestamp, Timestamp> activityDateRange;
    double totalAmountInvolved = 0.0;
    std::string summary;
    std::string detailedDescription;
    std::vector<std::string> transactionIds;
    std::vector<std::string> redFlags;
    std::vector<RegulatoryReference> regulatoryReferences;
    RecommendedAction recommendedAction = RecommendedAction::EnhancedMonitoring;
};

/**
 * @struct Verdict
 * @brief Terminal artifact of one adjudicated transaction.
 */
struct Verdict {
    Verdict(Decision decisionIn, double confidenceIn, std::string reasoningIn)
        : decision(decisionIn),
          confidence(ClampConfidence(confidenceIn)),
          reasoning(std::move(reasoningIn)) {}

    Decision decision;
    double confidence;
    std::optional<std::string> typology;
    std::optional<double> typologyConfidence;
    std::vector<RiskFactor> riskFactors;
    double riskScore = 0.0; ///< 0..10
    std::vector<RegulatoryReference> citations;
    std::optional<ReportDraft> reportDraft; ///< Present iff decision is BLOCK or REVIEW.
    std::string reasoning;
    bool malformedResponse = false; ///< Reasoning output could not be decoded; decision fell back to REVIEW.
    double processingTimeMs = 0.0;
    std::string modelUsed;
};

} // namespace amlgate::domain
