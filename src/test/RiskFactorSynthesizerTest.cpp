#include <algorithm>
#include <cassert>
#include <iostream>

#include "domain/services/RiskFactorSynthesizer.hpp"
#include "domain/services/TypologyDetector.hpp"
#include "TestFixtures.hpp"

using namespace amlgate::domain;
using namespace amlgate::domain::services;
using namespace amlgate::test;

namespace {

int CountSeverity(const std::vector<RiskFactor>& factors, Severity severity) {
    return static_cast<int>(std::count_if(factors.begin(), factors.end(),
                                          [severity](const RiskFactor& f) { return f.severity == severity; }));
}

} // namespace

int main() {
    std::cout << "[Test] Starting RiskFactorSynthesizer Test..." << std::endl;

    // Extreme statistical anomaly
    {
        auto factors = RiskFactorSynthesizer::Synthesize(MakeInput(500.0, 8.5, 0.9), std::nullopt);
        assert(factors.size() == 1);
        assert(factors[0].factor == "Extreme Statistical Anomaly");
        assert(factors[0].severity == Severity::Critical);
        assert(factors[0].description.find("8.5") != std::string::npos);
        std::cout << "[PASS] Critical statistical factor." << std::endl;
    }

    // High band is exclusive with the extreme band
    {
        auto factors = RiskFactorSynthesizer::Synthesize(MakeInput(500.0, 6.0, 0.9), std::nullopt);
        assert(factors.size() == 1);
        assert(factors[0].factor == "High Statistical Anomaly");
        assert(factors[0].severity == Severity::High);
        std::cout << "[PASS] High statistical factor." << std::endl;
    }

    // Near-threshold amount
    {
        auto factors = RiskFactorSynthesizer::Synthesize(MakeInput(9500.0, 0.0, 1.0), std::nullopt);
        assert(factors.size() == 1);
        assert(factors[0].factor == "Near-Threshold Amount");
        assert(factors[0].severity == Severity::Medium);
        assert(factors[0].evidence.size() == 1 && factors[0].evidence[0] == "Amount: $9,500.00");
        assert(CountSeverity(factors, Severity::Medium) == 1);
        std::cout << "[PASS] Near-threshold amount factor." << std::endl;
    }

    // Narrative bands
    {
        auto severe = RiskFactorSynthesizer::Synthesize(MakeInput(500.0, 0.0, 0.2), std::nullopt);
        assert(severe.size() == 1 && severe[0].factor == "Severe Narrative Break");
        assert(severe[0].severity == Severity::Critical);

        auto mild = RiskFactorSynthesizer::Synthesize(MakeInput(500.0, 0.0, 0.45), std::nullopt);
        assert(mild.size() == 1 && mild[0].factor == "Narrative Inconsistency");
        assert(mild[0].severity == Severity::High);
        std::cout << "[PASS] Narrative factors." << std::endl;
    }

    // Typology factor carries the signals as evidence
    {
        auto input = MakeInput(9800.0, 7.5, 0.25, MakeHistory(50, 100000.0, 20000.0, 4.0, 10));
        auto matches = TypologyDetector::DetectAll(input);
        assert(!matches.empty());
        auto factors = RiskFactorSynthesizer::Synthesize(input, matches.front());

        assert(factors.size() == 4);
        assert(factors[0].factor == "Extreme Statistical Anomaly");
        assert(factors[1].factor == "Severe Narrative Break");
        assert(factors[2].factor == "Structuring Pattern Detected");
        assert(factors[2].severity == Severity::Critical);
        assert(factors[2].evidence == matches.front().getSignalsMatched());
        assert(factors[3].factor == "Near-Threshold Amount");
        std::cout << "[PASS] Typology factor and rule order." << std::endl;
    }

    // Weak typology yields a high, not critical, factor
    {
        TypologyMatch weak("Smurfing", 0.45, {"many_counterparties", "narrative_break"}, "desc");
        auto factors = RiskFactorSynthesizer::Synthesize(MakeInput(500.0, 0.0, 1.0), weak);
        assert(factors.size() == 1);
        assert(factors[0].factor == "Smurfing Pattern Detected");
        assert(factors[0].severity == Severity::High);
        std::cout << "[PASS] Weak typology factor." << std::endl;
    }

    // Clean input
    {
        auto factors = RiskFactorSynthesizer::Synthesize(MakeInput(750.0, 1.5, 0.85), std::nullopt);
        assert(factors.empty());
        std::cout << "[PASS] Clean input yields no factors." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
