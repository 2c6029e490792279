#include <cassert>
#include <iostream>
#include <variant>

#include "application/VerdictDecoder.hpp"

using namespace amlgate::application;
using amlgate::domain::Decision;

namespace {

ParsedVerdict ExpectParsed(const DecodedVerdict& decoded) {
    assert(std::holds_alternative<ParsedVerdict>(decoded) && "Expected a well-formed verdict.");
    return std::get<ParsedVerdict>(decoded);
}

MalformedVerdict ExpectMalformed(const DecodedVerdict& decoded) {
    assert(std::holds_alternative<MalformedVerdict>(decoded) && "Expected a malformed verdict.");
    return std::get<MalformedVerdict>(decoded);
}

} // namespace

int main() {
    std::cout << "[Test] Starting VerdictDecoder Test..." << std::endl;

    // Object wrapped in prose and a code fence
    {
        std::string raw = "Here is my decision:\n```json\n"
                          "{\"decision\": \"BLOCK\", \"confidence\": 0.92, \"typology\": \"Structuring\","
                          " \"reasoning\": \"Repeated {sub-threshold} deposits.\","
                          " \"key_risk_factors\": [\"near threshold\"],"
                          " \"regulatory_citations\": [\"FATF Recommendation 20\", \"FinCEN 31 CFR 1010.314\"]}\n```";
        auto parsed = ExpectParsed(VerdictDecoder::Decode(raw));
        assert(parsed.decision == Decision::Block);
        assert(parsed.confidence == 0.92);
        assert(parsed.typology && *parsed.typology == "Structuring");
        assert(parsed.reasoning == "Repeated {sub-threshold} deposits.");
        assert(parsed.keyRiskFactors.size() == 1);
        assert(parsed.regulatoryCitations.size() == 2);
        std::cout << "[PASS] Fenced object decoded." << std::endl;
    }

    // Optional fields may be absent or null; decision case is normalised
    {
        auto parsed = ExpectParsed(VerdictDecoder::Decode("{\"decision\": \"approve\", \"confidence\": 1, \"typology\": null}"));
        assert(parsed.decision == Decision::Approve);
        assert(parsed.confidence == 1.0);
        assert(!parsed.typology);
        assert(parsed.reasoning.empty());
        assert(parsed.keyRiskFactors.empty() && parsed.regulatoryCitations.empty());
        std::cout << "[PASS] Minimal object decoded." << std::endl;
    }

    // Confidence is clamped
    {
        auto parsed = ExpectParsed(VerdictDecoder::Decode("{\"decision\": \"REVIEW\", \"confidence\": 1.7}"));
        assert(parsed.confidence == 1.0);
        std::cout << "[PASS] Confidence clamped." << std::endl;
    }

    // Malformed inputs keep the raw text
    {
        std::string prose = "I think this should be blocked.";
        auto noObject = ExpectMalformed(VerdictDecoder::Decode(prose));
        assert(noObject.rawText == prose);

        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"BLOCK\", \"confidence\": }"));
        ExpectMalformed(VerdictDecoder::Decode("{\"confidence\": 0.9}"));
        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"BLOCK\"}"));
        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"ESCALATE\", \"confidence\": 0.9}"));
        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"BLOCK\", \"confidence\": \"high\"}"));
        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"BLOCK\", \"confidence\": 0.9, \"regulatory_citations\": [1, 2]}"));
        ExpectMalformed(VerdictDecoder::Decode("{\"decision\": \"BLOCK\", \"confidence\": 0.9, \"key_risk_factors\": \"many\"}"));
        ExpectMalformed(VerdictDecoder::Decode("} backwards {"));
        std::cout << "[PASS] Malformed responses tagged." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
