/**
 * @file VerdictDecoder.hpp
 * @brief Strict schema decode of the reasoning service's adjudication answer.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/Adjudication.hpp"

namespace amlgate::application {

/** @brief Well-formed adjudication answer. */
struct ParsedVerdict {
    domain::Decision decision = domain::Decision::Review;
    double confidence = 0.5;
    std::optional<std::string> typology;
    std::string reasoning;
    std::vector<std::string> keyRiskFactors;
    std::vector<std::string> regulatoryCitations;
};

/** @brief Answer that did not satisfy the schema; the raw text is kept for the reviewer. */
struct MalformedVerdict {
    std::string rawText;
    std::string error;
};

using DecodedVerdict = std::variant<ParsedVerdict, MalformedVerdict>;

/**
 * @class VerdictDecoder
 * @brief Extracts the span between the first '{' and the last '}' and validates it.
 *
 * Required: "decision" (BLOCK|APPROVE|REVIEW, case-insensitive) and numeric "confidence".
 * Optional: "typology" (string or null), "reasoning" (string),
 * "key_risk_factors" and "regulatory_citations" (arrays of strings).
 */
class VerdictDecoder {
public:
    static DecodedVerdict Decode(const std::string& rawText);
};

} // namespace amlgate::application
