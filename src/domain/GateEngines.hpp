/**
 * @file GateEngines.hpp
 * @brief Interfaces for the two fast gates that precede adjudication.
 */

#pragma once

#include <map>
#include <string>

#include "domain/Transaction.hpp"

namespace amlgate::domain {

/** @brief Output of the statistical gate. */
struct StatisticalAssessment {
    double score = 0.0; ///< 0..10 anomaly score.
    bool passed = true;
    int clusterId = 0;
    double zScore = 0.0;
    std::map<std::string, std::string> details;
};

/** @brief Output of the narrative gate. */
struct NarrativeAssessment {
    double score = 1.0; ///< 0..1 coherence score.
    bool passed = true;
    std::map<std::string, std::string> details;
};

/**
 * @class StatisticalGate
 * @brief Peer-group anomaly scorer (budget: 10 ms).
 *
 * Implementations are shared across screening threads and must not keep per-call state.
 * Throw ExternalUnavailableError when the scorer cannot be reached.
 */
class StatisticalGate {
public:
    virtual ~StatisticalGate() = default;

    virtual StatisticalAssessment analyze(const Transaction& transaction, const AccountHistory& history) = 0;
};

/**
 * @class NarrativeGate
 * @brief Narrative-coherence scorer (budget: 200 ms).
 *
 * Same sharing and failure contract as StatisticalGate.
 */
class NarrativeGate {
public:
    virtual ~NarrativeGate() = default;

    virtual NarrativeAssessment analyze(const Transaction& transaction, const AccountHistory& history) = 0;
};

} // namespace amlgate::domain
