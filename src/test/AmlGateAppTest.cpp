#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "app/AmlGateApp.hpp"

using amlgate::app::AmlGateApp;

namespace {

struct Captured {
    int exitCode = 0;
    std::string out;
    std::string err;
};

/** @brief Runs the CLI with stdout and stderr redirected into strings. */
Captured RunCaptured(const std::vector<std::string>& args) {
    std::ostringstream out;
    std::ostringstream err;
    auto* oldOut = std::cout.rdbuf(out.rdbuf());
    auto* oldErr = std::cerr.rdbuf(err.rdbuf());

    Captured captured;
    captured.exitCode = AmlGateApp().Run(args);

    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);
    captured.out = out.str();
    captured.err = err.str();
    return captured;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AmlGateApp Test..." << std::endl;

    // Command table
    {
        assert(AmlGateApp::IsKnownCommand("screen", {"cases.json"}));
        assert(AmlGateApp::IsKnownCommand("evaluate", {"cases.json"}));
        assert(!AmlGateApp::IsKnownCommand("screen", {}));
        assert(!AmlGateApp::IsKnownCommand("screen", {"a.json", "b.json"}));
        assert(AmlGateApp::IsKnownCommand("ask", {"what", "is", "structuring"}));
        assert(AmlGateApp::IsKnownCommand("search", {"smurfing"}));
        assert(!AmlGateApp::IsKnownCommand("search", {}));
        assert(!AmlGateApp::IsKnownCommand("bogus", {"x"}));
        std::cout << "[PASS] Command table." << std::endl;
    }

    // Unknown commands print usage without loading config or contacting the reasoning server
    {
        auto result = RunCaptured({"--config", "no_such_settings.json", "bogus", "x"});
        assert(result.exitCode == 1);
        assert(result.err.find("Usage: amlgate") != std::string::npos);
        assert(result.out.find("[ConfigLoader]") == std::string::npos);
        assert(result.err.find("[OllamaClient]") == std::string::npos);
        assert(result.out.find("[OllamaReasoningService]") == std::string::npos);
        assert(result.err.find("[OllamaReasoningService]") == std::string::npos);
        assert(result.out.find("[VectorKnowledgeBase]") == std::string::npos);
        assert(result.err.find("[VectorKnowledgeBase]") == std::string::npos);

        auto missingOperand = RunCaptured({"--config", "no_such_settings.json", "screen"});
        assert(missingOperand.exitCode == 1);
        assert(missingOperand.err.find("Usage: amlgate") != std::string::npos);
        assert(missingOperand.out.find("[ConfigLoader]") == std::string::npos);
        std::cout << "[PASS] Unknown command rejected before initialisation." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
