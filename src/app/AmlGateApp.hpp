/**
 * @file AmlGateApp.hpp
 * @brief Command-line application class for AmlGate.
 * @author AmlGate Team
 * @date 2026-10-19
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/Deadline.hpp"
#include "infrastructure/CaseFileReader.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace amlgate::app {

/**
 * @class AmlGateApp
 * @brief Parses the command line, builds the services and dispatches one command.
 *
 * Usage: amlgate [--config settings.json] screen|evaluate <cases.json>
 *        amlgate [--config settings.json] ask <question...> [--source S]
 *        amlgate [--config settings.json] search <query...> [--limit N]
 */
class AmlGateApp {
public:
    /**
     * @brief Runs one command.
     * @param args Arguments without the program name.
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

    static void PrintUsage();

    /** @brief True when the command exists and has the operands it needs. */
    static bool IsKnownCommand(const std::string& command, const std::vector<std::string>& operands);

private:
    /** @brief Composition root: clients, knowledge base, reasoning service, adjudicator. */
    void Init(const infrastructure::AppConfig& config);

    /** @brief timeouts_ms.case, or nothing when it is 0. */
    std::optional<std::chrono::milliseconds> PerCaseBudget() const;
    domain::Deadline CaseDeadline() const;

    std::shared_ptr<application::GatePipeline> BuildPipeline(const infrastructure::CaseFile& cases) const;

    int Screen(const std::string& path);
    int Evaluate(const std::string& path);
    int Ask(const std::vector<std::string>& words);
    int Search(const std::vector<std::string>& words);

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace amlgate::app
