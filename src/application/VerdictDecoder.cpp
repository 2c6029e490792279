/**
 * @file VerdictDecoder.cpp
 * @brief Implementation of the adjudication answer decoder.
 */

#include "application/VerdictDecoder.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

#include "domain/TextFormat.hpp"

namespace amlgate::application {

namespace {

using json = nlohmann::json;

bool ReadStringArray(const json& j, const char* key, std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) {
        error = std::string(key) + " must be an array";
        return false;
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            error = std::string(key) + " must contain only strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

} // namespace

DecodedVerdict VerdictDecoder::Decode(const std::string& rawText) {
    auto start = rawText.find('{');
    auto end = rawText.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return MalformedVerdict{rawText, "no JSON object found"};
    }

    json j = json::parse(rawText.substr(start, end - start + 1), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return MalformedVerdict{rawText, "invalid JSON object"};
    }

    ParsedVerdict parsed;

    if (!j.contains("decision") || !j["decision"].is_string()) {
        return MalformedVerdict{rawText, "decision is missing or not a string"};
    }
    auto decision = domain::DecisionFromString(domain::ToUpperAscii(j["decision"].get<std::string>()));
    if (!decision) {
        return MalformedVerdict{rawText, "decision must be BLOCK, APPROVE or REVIEW"};
    }
    parsed.decision = *decision;

    if (!j.contains("confidence") || !j["confidence"].is_number()) {
        return MalformedVerdict{rawText, "confidence is missing or not a number"};
    }
    double confidence = j["confidence"].get<double>();
    if (!std::isfinite(confidence)) {
        return MalformedVerdict{rawText, "confidence is not finite"};
    }
    parsed.confidence = domain::ClampConfidence(confidence);

    if (j.contains("typology") && !j["typology"].is_null()) {
        if (!j["typology"].is_string()) {
            return MalformedVerdict{rawText, "typology must be a string or null"};
        }
        parsed.typology = j["typology"].get<std::string>();
    }

    if (j.contains("reasoning") && !j["reasoning"].is_null()) {
        if (!j["reasoning"].is_string()) {
            return MalformedVerdict{rawText, "reasoning must be a string"};
        }
        parsed.reasoning = j["reasoning"].get<std::string>();
    }

    std::string error;
    if (!ReadStringArray(j, "key_risk_factors", parsed.keyRiskFactors, error) ||
        !ReadStringArray(j, "regulatory_citations", parsed.regulatoryCitations, error)) {
        return MalformedVerdict{rawText, error};
    }

    return parsed;
}

} // namespace amlgate::application
