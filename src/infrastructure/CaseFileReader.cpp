/**
 * @file CaseFileReader.cpp
 * @brief Implementation of CaseFileReader.
 */

#include "infrastructure/CaseFileReader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/JsonMapping.hpp"

namespace amlgate::infrastructure {

using json = nlohmann::json;

namespace {

void ReadCase(const json& j, size_t index, CaseFile& out) {
    if (!j.is_object() || !j.contains("transaction") || !j.contains("history")) {
        throw std::invalid_argument("needs 'transaction' and 'history'");
    }

    domain::ScreeningCase screeningCase;
    screeningCase.transaction = JsonMapping::TransactionFromJson(j["transaction"]);
    screeningCase.history = JsonMapping::AccountHistoryFromJson(j["history"]);
    if (!screeningCase.transaction.id) {
        screeningCase.transaction.id = "case-" + std::to_string(index);
    }

    const std::string& id = *screeningCase.transaction.id;
    if (j.contains("statistical_score") && !j["statistical_score"].is_null()) {
        if (!j["statistical_score"].is_number()) throw std::invalid_argument("statistical_score must be a number");
        out.statisticalScores[id] = j["statistical_score"].get<double>();
    }
    if (j.contains("narrative_score") && !j["narrative_score"].is_null()) {
        if (!j["narrative_score"].is_number()) throw std::invalid_argument("narrative_score must be a number");
        out.narrativeScores[id] = j["narrative_score"].get<double>();
    }
    out.cases.push_back(std::move(screeningCase));
}

} // namespace

CaseFile CaseFileReader::Read(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open case file: " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

CaseFile CaseFileReader::Parse(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw std::invalid_argument("Case file is not valid JSON");
    }

    CaseFile out;
    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            try {
                ReadCase(j[i], i, out);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument("case " + std::to_string(i) + ": " + e.what());
            }
        }
    } else {
        try {
            ReadCase(j, 0, out);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::string("case 0: ") + e.what());
        }
    }
    return out;
}

} // namespace amlgate::infrastructure
