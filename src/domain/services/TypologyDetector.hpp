/**
 * @file TypologyDetector.hpp
 * @brief Rule-based matchers for the known money-laundering typologies.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Adjudication.hpp"
#include "domain/Typology.hpp"

namespace amlgate::domain::services {

/**
 * @class TypologyDetector
 * @brief Stateless detectors. Each adds a fixed weight per matched signal and emits a match
 * only when the accumulated weight reaches the typology's activation floor.
 */
class TypologyDetector {
public:
    /** @brief A weighted signal and the predicate that raises it. */
    struct SignalRule {
        std::string signal;
        double weight;
        std::function<bool(const AdjudicationInput&)> applies;
    };

    /** @brief Weight table of one typology. */
    struct DetectorRules {
        TypologyKind kind;
        double activationFloor;
        std::vector<SignalRule> signals;
    };

    static std::optional<TypologyMatch> DetectStructuring(const AdjudicationInput& input);
    static std::optional<TypologyMatch> DetectSmurfing(const AdjudicationInput& input);
    static std::optional<TypologyMatch> DetectLayering(const AdjudicationInput& input);
    static std::optional<TypologyMatch> DetectShellCompany(const AdjudicationInput& input);
    static std::optional<TypologyMatch> DetectTradeBased(const AdjudicationInput& input);

    /**
     * @brief Runs every detector.
     * @return Matches sorted by confidence descending; ties keep declaration order.
     * The first element is the primary typology.
     */
    static std::vector<TypologyMatch> DetectAll(const AdjudicationInput& input);

    /** @brief Weight table for one typology. */
    static const DetectorRules& GetRules(TypologyKind kind);

private:
    static std::optional<TypologyMatch> Evaluate(const DetectorRules& rules, const AdjudicationInput& input);
};

} // namespace amlgate::domain::services
