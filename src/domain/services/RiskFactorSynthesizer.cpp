/**
 * @file RiskFactorSynthesizer.cpp
 * @brief Severity rules for the risk factor synthesizer.
 */

#include "domain/services/RiskFactorSynthesizer.hpp"

#include "domain/TextFormat.hpp"

namespace amlgate::domain::services {

std::vector<RiskFactor> RiskFactorSynthesizer::Synthesize(const AdjudicationInput& input,
                                                          const std::optional<TypologyMatch>& primaryTypology) {
    std::vector<RiskFactor> factors;
    const double statScore = input.getStatisticalScore();
    const double narrScore = input.getNarrativeScore();

    if (statScore > 7.0) {
        factors.push_back({
            "Extreme Statistical Anomaly",
            Severity::Critical,
            "Transaction has statistical anomaly score of " + FormatFixed(statScore, 1) + " (threshold: 3.0)",
            {"Z-score: " + FormatFixed(statScore, 2)}
        });
    } else if (statScore > 5.0) {
        factors.push_back({
            "High Statistical Anomaly",
            Severity::High,
            "Transaction deviates significantly from peer group baseline",
            {"Z-score: " + FormatFixed(statScore, 2)}
        });
    }

    if (narrScore < 0.3) {
        factors.push_back({
            "Severe Narrative Break",
            Severity::Critical,
            "Transaction is highly inconsistent with customer's behavioral history",
            {"Coherence score: " + FormatFixed(narrScore, 2)}
        });
    } else if (narrScore < 0.5) {
        factors.push_back({
            "Narrative Inconsistency",
            Severity::High,
            "Transaction does not fit customer's typical pattern",
            {"Coherence score: " + FormatFixed(narrScore, 2)}
        });
    }

    if (primaryTypology) {
        factors.push_back({
            primaryTypology->getName() + " Pattern Detected",
            primaryTypology->getConfidence() > 0.7 ? Severity::Critical : Severity::High,
            primaryTypology->getDescription(),
            primaryTypology->getSignalsMatched()
        });
    }

    const double amount = input.getTransaction().amountSent();
    if (amount >= 9000.0 && amount < 10000.0) {
        factors.push_back({
            "Near-Threshold Amount",
            Severity::Medium,
            "Transaction amount is just below $10,000 reporting threshold",
            {"Amount: " + FormatMoney(amount)}
        });
    }

    return factors;
}

} // namespace amlgate::domain::services
