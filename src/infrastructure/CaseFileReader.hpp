/**
 * @file CaseFileReader.hpp
 * @brief Loads screening cases and their upstream gate scores from a JSON file.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Transaction.hpp"
#include "infrastructure/PrecomputedGates.hpp"

namespace amlgate::infrastructure {

/** @brief Cases in file order plus the score tables for the precomputed gates. */
struct CaseFile {
    std::vector<domain::ScreeningCase> cases;
    ScoreTable statisticalScores;
    ScoreTable narrativeScores;
};

/**
 * @class CaseFileReader
 * @brief Reads one case object or an array of them:
 * {transaction, history, statistical_score?, narrative_score?}.
 *
 * A case without txn_id is given "case-<index>" so its scores can be looked up.
 */
class CaseFileReader {
public:
    /** @throws std::runtime_error if the file cannot be read; std::invalid_argument on a bad case. */
    static CaseFile Read(const std::string& path);

    static CaseFile Parse(const std::string& text);
};

} // namespace amlgate::infrastructure
