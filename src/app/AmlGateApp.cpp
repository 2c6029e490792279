/**
 * @file AmlGateApp.cpp
 * @brief Implementation of the AmlGateApp class.
 * @author AmlGate Team
 * @date 2026-10-19
 */

#include "app/AmlGateApp.hpp"

#include <iostream>
#include <map>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "application/BatchScreeningService.hpp"
#include "domain/services/ReportDrafter.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaReasoningService.hpp"
#include "infrastructure/PrecomputedGates.hpp"
#include "infrastructure/VectorKnowledgeBase.hpp"

namespace amlgate::app {

using json = nlohmann::json;

namespace {

std::string JoinWords(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) out += " ";
        out += word;
    }
    return out;
}

} // namespace

void AmlGateApp::PrintUsage() {
    std::cerr << "Usage: amlgate [--config settings.json] <command>\n"
              << "  screen <cases.json>            Screen one case or an array of cases\n"
              << "  evaluate <cases.json>          Screen labelled cases and report metrics\n"
              << "  ask <question...> [--source S] Ask the regulatory knowledge base\n"
              << "  search <query...> [--limit N]  Search the regulatory knowledge base\n";
}

int AmlGateApp::Run(const std::vector<std::string>& args) {
    std::string configPath = "settings.json";
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            configPath = args[++i];
        } else {
            rest.push_back(args[i]);
        }
    }

    if (rest.empty()) {
        PrintUsage();
        return 1;
    }

    const std::string command = rest.front();
    std::vector<std::string> operands(rest.begin() + 1, rest.end());
    if (!IsKnownCommand(command, operands)) {
        PrintUsage();
        return 1;
    }

    try {
        Init(infrastructure::ConfigLoader::Load(configPath));

        if (command == "screen") return Screen(operands[0]);
        if (command == "evaluate") return Evaluate(operands[0]);
        if (command == "ask") return Ask(operands);
        return Search(operands);
    } catch (const std::exception& e) {
        std::cerr << "[amlgate] " << e.what() << std::endl;
        return 1;
    }
}

bool AmlGateApp::IsKnownCommand(const std::string& command, const std::vector<std::string>& operands) {
    if (command == "screen" || command == "evaluate") return operands.size() == 1;
    if (command == "ask" || command == "search") return !operands.empty();
    return false;
}

void AmlGateApp::Init(const infrastructure::AppConfig& config) {
    m_config = config;

    // Dependency Injection / Composition Root
    auto client = std::make_shared<infrastructure::OllamaClient>(config.ollama.host, config.ollama.port);

    auto reasoning = std::make_shared<infrastructure::OllamaReasoningService>(
        client, config.ollama.model, config.timeouts.reasoning);
    reasoning->initialize();

    auto knowledge = std::make_shared<infrastructure::VectorKnowledgeBase>(
        client, config.ollama.embeddingModel, config.knowledge.indexPath, config.timeouts.search);
    knowledge->load();

    application::AdjudicatorSettings settings;
    settings.maxTokens = config.reasoning.maxTokens;
    settings.temperature = config.reasoning.temperature;
    settings.reasoningTimeout = config.timeouts.reasoning;
    settings.searchTimeout = config.timeouts.search;
    settings.maxCharsPerResult = config.knowledge.maxCharsPerResult;

    m_services.knowledgeBase = knowledge;
    m_services.reasoningService = reasoning;
    m_services.adjudicator = std::make_shared<application::VerdictAdjudicator>(
        knowledge, reasoning, config.thresholds,
        domain::services::ReportDrafter(config.filingInstitution), settings);
    m_services.consultationService = std::make_unique<application::ExpertConsultationService>(
        knowledge, reasoning, config.knowledge.maxCharsPerResult, config.timeouts.reasoning);
    m_services.gateBudgets.statistical = config.timeouts.statistical;
    m_services.gateBudgets.narrative = config.timeouts.narrative;
}

std::shared_ptr<application::GatePipeline> AmlGateApp::BuildPipeline(const infrastructure::CaseFile& cases) const {
    auto statistical = std::make_shared<infrastructure::PrecomputedStatisticalGate>(
        cases.statisticalScores, m_config.thresholds.statisticalGate);
    auto narrative = std::make_shared<infrastructure::PrecomputedNarrativeGate>(
        cases.narrativeScores, m_config.thresholds.narrativeGate);
    return std::make_shared<application::GatePipeline>(
        statistical, narrative, m_services.adjudicator, m_services.gateBudgets);
}

std::optional<std::chrono::milliseconds> AmlGateApp::PerCaseBudget() const {
    if (m_config.timeouts.perCase.count() == 0) return std::nullopt;
    return m_config.timeouts.perCase;
}

domain::Deadline AmlGateApp::CaseDeadline() const {
    auto budget = PerCaseBudget();
    return budget ? domain::Deadline::After(*budget) : domain::Deadline();
}

int AmlGateApp::Screen(const std::string& path) {
    auto file = infrastructure::CaseFileReader::Read(path);
    auto pipeline = BuildPipeline(file);

    if (file.cases.size() == 1) {
        const auto& item = file.cases.front();
        auto result = pipeline->process(item.transaction, item.history, CaseDeadline());
        std::cout << infrastructure::JsonMapping::ToJson(result).dump(2) << std::endl;
        return 0;
    }

    application::BatchScreeningService batch(pipeline, m_config.batchWorkers, PerCaseBudget());
    auto report = batch.run(file.cases);

    json out = json::array();
    for (size_t i = 0; i < report.outcomes.size(); ++i) {
        const auto& outcome = report.outcomes[i];
        if (outcome.succeeded()) {
            out.push_back(infrastructure::JsonMapping::ToJson(*outcome.result));
        } else {
            out.push_back({{"transaction_id", *file.cases[i].transaction.id}, {"error", outcome.error}});
        }
    }
    std::cout << out.dump(2) << std::endl;
    return report.errorCount == 0 ? 0 : 1;
}

int AmlGateApp::Evaluate(const std::string& path) {
    auto file = infrastructure::CaseFileReader::Read(path);
    application::BatchScreeningService batch(BuildPipeline(file), m_config.batchWorkers, PerCaseBudget());
    auto report = batch.run(file.cases);

    std::map<std::string, int> decisions;
    int escalated = 0;
    for (const auto& outcome : report.outcomes) {
        if (!outcome.succeeded()) continue;
        decisions[domain::ToString(outcome.result->finalDecision)]++;
        if (outcome.result->expertResult) escalated++;
    }

    json out = {
        {"screened", file.cases.size()},
        {"errors", report.errorCount},
        {"escalated", escalated},
        {"decisions", decisions},
        {"metrics", infrastructure::JsonMapping::ToJson(report.metrics)}
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int AmlGateApp::Ask(const std::vector<std::string>& words) {
    std::vector<std::string> question;
    std::optional<std::string> source;
    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i] == "--source" && i + 1 < words.size()) {
            source = words[++i];
        } else {
            question.push_back(words[i]);
        }
    }
    if (question.empty()) {
        PrintUsage();
        return 1;
    }

    std::cout << m_services.consultationService->ask(JoinWords(question), source) << std::endl;
    return 0;
}

int AmlGateApp::Search(const std::vector<std::string>& words) {
    std::vector<std::string> query;
    int limit = 5;
    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i] == "--limit" && i + 1 < words.size()) {
            try {
                limit = std::stoi(words[++i]);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("--limit expects a number, got '" + words[i] + "'");
            }
        } else {
            query.push_back(words[i]);
        }
    }
    if (query.empty() || limit <= 0) {
        PrintUsage();
        return 1;
    }

    json out = json::array();
    for (const auto& hit : m_services.consultationService->search(JoinWords(query), limit)) {
        out.push_back(infrastructure::JsonMapping::ToJson(hit));
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

} // namespace amlgate::app
