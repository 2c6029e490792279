/**
 * @file JsonMapping.hpp
 * @brief Manual mapping between domain objects and their JSON documents.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/EvaluationMetrics.hpp"
#include "domain/KnowledgeBase.hpp"
#include "domain/PipelineResult.hpp"
#include "domain/Transaction.hpp"

namespace amlgate::infrastructure {

/**
 * @class JsonMapping
 * @brief Field names follow the snake_case wire format (txn_id, payment_format, total_sent...).
 *
 * Readers throw std::invalid_argument naming the offending field.
 */
class JsonMapping {
public:
    /** @brief Accepts "YYYY-MM-DDTHH:MM:SS[Z]", "YYYY-MM-DD HH:MM[:SS]", "YYYY/MM/DD HH:MM" and "YYYY-MM-DD" (UTC). */
    static domain::Timestamp ParseTimestamp(const std::string& text);
    static std::string FormatTimestamp(domain::Timestamp timestamp);

    static domain::Transaction TransactionFromJson(const nlohmann::json& j);
    static domain::AccountStats AccountStatsFromJson(const nlohmann::json& j);
    static domain::AccountHistory AccountHistoryFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::RiskFactor& factor);
    static nlohmann::json ToJson(const domain::RegulatoryReference& reference);
    static nlohmann::json ToJson(const domain::ReportDraft& draft);
    static nlohmann::json ToJson(const domain::Verdict& verdict);
    static nlohmann::json ToJson(const domain::LayerResult& layer);
    static nlohmann::json ToJson(const domain::PipelineResult& result);
    static nlohmann::json ToJson(const domain::EvaluationMetrics& metrics);
    static nlohmann::json ToJson(const domain::SearchHit& hit);
};

} // namespace amlgate::infrastructure
