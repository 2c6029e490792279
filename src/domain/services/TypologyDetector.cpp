/**
 * @file TypologyDetector.cpp
 * @brief Weight tables and evaluation for the typology detectors.
 */

#include "domain/services/TypologyDetector.hpp"

#include <algorithm>
#include <cmath>

namespace amlgate::domain::services {

namespace {

double Amount(const AdjudicationInput& in) { return in.getTransaction().amountSent(); }

bool RatioWithin(const AdjudicationInput& in, double low, double high) {
    auto ratio = in.getStats().sentReceivedRatio();
    return ratio && *ratio >= low && *ratio <= high;
}

using Rules = TypologyDetector::DetectorRules;

const Rules kStructuring{
    TypologyKind::Structuring, 0.4, {
        {"amount_near_10k_threshold", 0.4,
         [](const AdjudicationInput& in) { return Amount(in) >= 9000.0 && Amount(in) < 10000.0; }},
        {"amount_near_3k_threshold", 0.3,
         [](const AdjudicationInput& in) { return Amount(in) >= 2700.0 && Amount(in) < 3000.0; }},
        {"high_statistical_anomaly", 0.2,
         [](const AdjudicationInput& in) { return in.getStatisticalScore() > 5.0; }},
        {"low_narrative_coherence", 0.2,
         [](const AdjudicationInput& in) { return in.getNarrativeScore() < 0.4; }},
        {"round_number_amount", 0.1,
         [](const AdjudicationInput& in) { return std::fmod(Amount(in), 100.0) == 0.0 && Amount(in) > 1000.0; }},
        {"high_transaction_frequency", 0.15,
         [](const AdjudicationInput& in) { return in.getStats().transactionFrequencyPerDay > 3.0; }},
    }};

const Rules kSmurfing{
    TypologyKind::Smurfing, 0.4, {
        {"small_amount_high_frequency", 0.35,
         [](const AdjudicationInput& in) {
             return Amount(in) < 5000.0 && in.getStats().transactionFrequencyPerDay > 2.0;
         }},
        {"many_counterparties", 0.25,
         [](const AdjudicationInput& in) { return in.getStats().uniqueCounterparties > 20; }},
        {"statistical_anomaly", 0.15,
         [](const AdjudicationInput& in) { return in.getStatisticalScore() > 4.0; }},
        {"narrative_break", 0.15,
         [](const AdjudicationInput& in) { return in.getNarrativeScore() < 0.5; }},
        {"balanced_in_out", 0.1,
         [](const AdjudicationInput& in) { return RatioWithin(in, 0.8, 1.2); }},
    }};

const Rules kLayering{
    TypologyKind::Layering, 0.5, {
        {"very_high_frequency", 0.3,
         [](const AdjudicationInput& in) { return in.getStats().transactionFrequencyPerDay > 5.0; }},
        {"high_transaction_count", 0.2,
         [](const AdjudicationInput& in) { return in.getStats().totalTransactions > 100; }},
        {"in_equals_out", 0.25,
         [](const AdjudicationInput& in) { return RatioWithin(in, 0.9, 1.1); }},
        {"high_statistical_anomaly", 0.15,
         [](const AdjudicationInput& in) { return in.getStatisticalScore() > 6.0; }},
        {"very_low_coherence", 0.2,
         [](const AdjudicationInput& in) { return in.getNarrativeScore() < 0.3; }},
    }};

const Rules kShellCompany{
    TypologyKind::ShellCompany, 0.4, {
        {"exact_passthrough", 0.35,
         [](const AdjudicationInput& in) { return RatioWithin(in, 0.95, 1.05); }},
        {"limited_counterparties", 0.2,
         [](const AdjudicationInput& in) {
             return in.getStats().uniqueCounterparties < 5 && in.getStats().totalTransactions > 20;
         }},
        {"high_value_low_frequency", 0.25,
         [](const AdjudicationInput& in) {
             return in.getStats().avgTransactionAmount > 50000.0 && in.getStats().transactionFrequencyPerDay < 1.0;
         }},
        {"statistical_anomaly", 0.15,
         [](const AdjudicationInput& in) { return in.getStatisticalScore() > 5.0; }},
    }};

const Rules kTradeBased{
    TypologyKind::TradeBased, 0.5, {
        {"high_value_transaction", 0.2,
         [](const AdjudicationInput& in) { return Amount(in) > 100000.0; }},
        {"high_amount_variance", 0.25,
         [](const AdjudicationInput& in) {
             return in.getStats().stdTransactionAmount > in.getStats().avgTransactionAmount;
         }},
        {"wire_transfer", 0.1,
         [](const AdjudicationInput& in) { return in.getTransaction().paymentFormat == "Wire"; }},
        {"extreme_statistical_anomaly", 0.25,
         [](const AdjudicationInput& in) { return in.getStatisticalScore() > 7.0; }},
        {"narrative_break", 0.2,
         [](const AdjudicationInput& in) { return in.getNarrativeScore() < 0.4; }},
    }};

} // namespace

const TypologyDetector::DetectorRules& TypologyDetector::GetRules(TypologyKind kind) {
    switch (kind) {
        case TypologyKind::Structuring: return kStructuring;
        case TypologyKind::Smurfing: return kSmurfing;
        case TypologyKind::Layering: return kLayering;
        case TypologyKind::ShellCompany: return kShellCompany;
        case TypologyKind::TradeBased: return kTradeBased;
    }
    return kStructuring;
}

std::optional<TypologyMatch> TypologyDetector::Evaluate(const DetectorRules& rules, const AdjudicationInput& input) {
    std::vector<std::string> signals;
    double confidence = 0.0;

    for (const auto& rule : rules.signals) {
        if (rule.applies(input)) {
            signals.push_back(rule.signal);
            confidence += rule.weight;
        }
    }

    // Floor is checked against the pre-clamp sum.
    if (signals.empty() || confidence < rules.activationFloor) {
        return std::nullopt;
    }

    const auto& definition = GetTypology(rules.kind);
    return TypologyMatch(definition.name, confidence, std::move(signals), definition.description);
}

std::optional<TypologyMatch> TypologyDetector::DetectStructuring(const AdjudicationInput& input) {
    return Evaluate(kStructuring, input);
}

std::optional<TypologyMatch> TypologyDetector::DetectSmurfing(const AdjudicationInput& input) {
    return Evaluate(kSmurfing, input);
}

std::optional<TypologyMatch> TypologyDetector::DetectLayering(const AdjudicationInput& input) {
    return Evaluate(kLayering, input);
}

std::optional<TypologyMatch> TypologyDetector::DetectShellCompany(const AdjudicationInput& input) {
    return Evaluate(kShellCompany, input);
}

std::optional<TypologyMatch> TypologyDetector::DetectTradeBased(const AdjudicationInput& input) {
    return Evaluate(kTradeBased, input);
}

std::vector<TypologyMatch> TypologyDetector::DetectAll(const AdjudicationInput& input) {
    const std::vector<std::optional<TypologyMatch> (*)(const AdjudicationInput&)> detectors = {
        &DetectStructuring,
        &DetectSmurfing,
        &DetectLayering,
        &DetectShellCompany,
        &DetectTradeBased,
    };

    std::vector<TypologyMatch> matches;
    for (auto detector : detectors) {
        if (auto match = detector(input)) {
            matches.push_back(std::move(*match));
        }
    }

    std::stable_sort(matches.begin(), matches.end(), [](const TypologyMatch& a, const TypologyMatch& b) {
        return a.getConfidence() > b.getConfidence();
    });
    return matches;
}

} // namespace amlgate::domain::services
