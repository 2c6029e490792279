/**
 * @file Typology.hpp
 * @brief Money-laundering typology catalog and detector match record.
 */

#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "domain/Errors.hpp"

namespace amlgate::domain {

/** @brief Typologies known to the detector, in detector-declaration order. */
enum class TypologyKind { Structuring, Smurfing, Layering, ShellCompany, TradeBased };

/**
 * @struct TypologyDefinition
 * @brief Static description of a typology. Not mutable at runtime.
 */
struct TypologyDefinition {
    TypologyKind kind;
    std::string key;
    std::string name;
    std::string description;
    std::vector<std::string> statisticalSignals;
    std::vector<std::string> narrativeSignals;
};

/** @brief Returns the immutable typology catalog. */
inline const std::vector<TypologyDefinition>& GetTypologyCatalog() {
    static const std::vector<TypologyDefinition> catalog = {
        {TypologyKind::Structuring, "structuring", "Structuring",
         "Transactions just below reporting thresholds ($10K in US)",
         {"amounts_near_threshold", "repetitive_patterns"},
         {"inconsistent_with_profile", "round_numbers"}},
        {TypologyKind::Smurfing, "smurfing", "Smurfing",
         "Breaking large amounts into smaller deposits to avoid reporting thresholds",
         {"high_frequency", "low_amounts", "multiple_accounts"},
         {"many_new_counterparties", "rapid_succession"}},
        {TypologyKind::Layering, "layering", "Layering",
         "Complex series of transactions to obscure money trail",
         {"high_velocity", "in_equals_out"},
         {"circular_flows", "rapid_movement"}},
        {TypologyKind::ShellCompany, "shell_company", "Shell Company Activity",
         "Using shell companies as passthrough entities",
         {"in_approx_out", "no_retained_value"},
         {"no_business_activity", "opaque_ownership"}},
        {TypologyKind::TradeBased, "tbml", "Trade-Based Money Laundering",
         "Using trade transactions to move value (over/under invoicing)",
         {"unusual_amounts_for_goods", "price_anomalies"},
         {"mismatched_counterparties", "unusual_trade_partners"}},
    };
    return catalog;
}

/** @brief Looks up a catalog entry. The catalog covers every TypologyKind. */
inline const TypologyDefinition& GetTypology(TypologyKind kind) {
    const auto& catalog = GetTypologyCatalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [kind](const TypologyDefinition& def) { return def.kind == kind; });
    return *it;
}

/** @brief Catalog entry whose display name or key equals the given label, or nullptr. */
inline const TypologyDefinition* FindTypology(const std::string& label) {
    for (const auto& def : GetTypologyCatalog()) {
        if (def.name == label || def.key == label) return &def;
    }
    return nullptr;
}

/**
 * @class TypologyMatch
 * @brief Confidence-scored result of one detector invocation. Immutable.
 */
class TypologyMatch {
public:
    /**
     * @param name Typology display name.
     * @param accumulatedConfidence Sum of matched signal weights; stored clamped to 1.0.
     * @param signalsMatched Ordered signal identifiers, never empty.
     * @param description Catalog description of the typology.
     */
    TypologyMatch(std::string name,
                  double accumulatedConfidence,
                  std::vector<std::string> signalsMatched,
                  std::string description)
        : m_name(std::move(name)),
          m_confidence(std::clamp(accumulatedConfidence, 0.0, 1.0)),
          m_signalsMatched(std::move(signalsMatched)),
          m_description(std::move(description)) {
        if (m_signalsMatched.empty()) {
            throw InvariantViolationError("TypologyMatch: at least one signal is required");
        }
    }

    const std::string& getName() const { return m_name; }
    double getConfidence() const { return m_confidence; }
    const std::vector<std::string>& getSignalsMatched() const { return m_signalsMatched; }
    const std::string& getDescription() const { return m_description; }

private:
    std::string m_name;
    double m_confidence;
    std::vector<std::string> m_signalsMatched;
    std::string m_description;
};

} // namespace amlgate::domain
