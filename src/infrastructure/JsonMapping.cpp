/**
 * @file JsonMapping.cpp
 * @brief Implementation of the domain JSON mapping.
 */

#include "infrastructure/JsonMapping.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "domain/TextFormat.hpp"

namespace amlgate::infrastructure {

using json = nlohmann::json;

namespace {

const json& Require(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        throw std::invalid_argument(std::string("missing field '") + key + "'");
    }
    return j[key];
}

template <typename T>
T RequireAs(const json& j, const char* key) {
    const json& value = Require(j, key);
    try {
        return value.get<T>();
    } catch (const json::exception&) {
        throw std::invalid_argument(std::string("field '") + key + "' has the wrong type");
    }
}

template <typename T>
T ValueOr(const json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    try {
        return j[key].get<T>();
    } catch (const json::exception&) {
        throw std::invalid_argument(std::string("field '") + key + "' has the wrong type");
    }
}

domain::TransactionParty PartyFromJson(const json& j) {
    domain::TransactionParty party;
    party.accountId = RequireAs<std::string>(j, "account_id");
    party.bankId = RequireAs<std::string>(j, "bank_id");
    return party;
}

json LayersToJson(const std::vector<domain::Layer>& layers) {
    json out = json::array();
    for (auto layer : layers) out.push_back(domain::ToString(layer));
    return out;
}

} // namespace

domain::Timestamp JsonMapping::ParseTimestamp(const std::string& text) {
    static const char* kFormats[] = {
        "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M", "%Y/%m/%d %H:%M", "%Y-%m-%d",
    };
    for (const char* format : kFormats) {
        std::tm tm{};
        std::istringstream in(text);
        in >> std::get_time(&tm, format);
        if (in.fail()) continue;
        // Fractional seconds and a trailing 'Z' are tolerated; anything else is not.
        std::string rest;
        std::getline(in, rest);
        if (!rest.empty() && rest != "Z" && rest.find_first_not_of("0123456789.Z") != std::string::npos) continue;
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }
    throw std::invalid_argument("unrecognised timestamp '" + text + "'");
}

std::string JsonMapping::FormatTimestamp(domain::Timestamp timestamp) {
    return domain::FormatUtc(timestamp, "%Y-%m-%dT%H:%M:%SZ");
}

domain::Transaction JsonMapping::TransactionFromJson(const json& j) {
    domain::Transaction tx;
    if (j.contains("txn_id") && !j["txn_id"].is_null()) {
        tx.id = RequireAs<std::string>(j, "txn_id");
    }
    tx.sender = PartyFromJson(Require(j, "sender"));
    tx.receiver = PartyFromJson(Require(j, "receiver"));

    const json& amount = Require(j, "amount");
    tx.amount.sent = RequireAs<double>(amount, "sent");
    tx.amount.received = RequireAs<double>(amount, "received");
    tx.amount.currencySent = ValueOr<std::string>(amount, "currency_sent", tx.amount.currencySent);
    tx.amount.currencyReceived = ValueOr<std::string>(amount, "currency_received", tx.amount.currencyReceived);

    tx.paymentFormat = RequireAs<std::string>(j, "payment_format");
    tx.timestamp = ParseTimestamp(RequireAs<std::string>(j, "timestamp"));
    if (j.contains("is_laundering") && !j["is_laundering"].is_null()) {
        tx.isLaundering = RequireAs<bool>(j, "is_laundering");
    }
    return tx;
}

domain::AccountStats JsonMapping::AccountStatsFromJson(const json& j) {
    domain::AccountStats stats;
    stats.totalTransactions = RequireAs<int>(j, "total_transactions");
    stats.totalSent = RequireAs<double>(j, "total_sent");
    stats.totalReceived = RequireAs<double>(j, "total_received");
    stats.avgTransactionAmount = RequireAs<double>(j, "avg_transaction_amount");
    stats.stdTransactionAmount = RequireAs<double>(j, "std_transaction_amount");
    stats.uniqueCounterparties = RequireAs<int>(j, "unique_counterparties");
    stats.transactionFrequencyPerDay = RequireAs<double>(j, "transaction_frequency_per_day");
    stats.firstTransaction = ParseTimestamp(RequireAs<std::string>(j, "first_transaction"));
    stats.lastTransaction = ParseTimestamp(RequireAs<std::string>(j, "last_transaction"));

    if (j.contains("payment_format_distribution") && j["payment_format_distribution"].is_object()) {
        for (auto& [format, share] : j["payment_format_distribution"].items()) {
            stats.paymentFormatDistribution[format] = share.get<double>();
        }
    }
    if (j.contains("hour_distribution") && j["hour_distribution"].is_object()) {
        for (auto& [hour, share] : j["hour_distribution"].items()) {
            try {
                stats.hourDistribution[std::stoi(hour)] = share.get<double>();
            } catch (const std::logic_error&) {
                throw std::invalid_argument("hour_distribution key '" + hour + "' is not an hour");
            }
        }
    }
    return stats;
}

domain::AccountHistory JsonMapping::AccountHistoryFromJson(const json& j) {
    domain::AccountHistory history;
    history.accountId = RequireAs<std::string>(j, "account_id");
    history.bankId = RequireAs<std::string>(j, "bank_id");
    history.stats = AccountStatsFromJson(Require(j, "stats"));
    if (j.contains("cluster_id") && !j["cluster_id"].is_null()) {
        history.clusterId = RequireAs<int>(j, "cluster_id");
    }
    return history;
}

json JsonMapping::ToJson(const domain::RiskFactor& factor) {
    return {
        {"factor", factor.factor},
        {"severity", domain::ToString(factor.severity)},
        {"description", factor.description},
        {"evidence", factor.evidence}
    };
}

json JsonMapping::ToJson(const domain::RegulatoryReference& reference) {
    return {
        {"source", reference.source},
        {"reference", reference.reference},
        {"relevance", reference.relevance}
    };
}

json JsonMapping::ToJson(const domain::ReportDraft& draft) {
    json references = json::array();
    for (const auto& ref : draft.regulatoryReferences) references.push_back(ToJson(ref));

    return {
        {"subject_account", draft.subjectAccount},
        {"filing_institution", draft.filingInstitution},
        {"activity_type", draft.activityType},
        {"activity_date_range", json::array({FormatTimestamp(draft.activityDateRange.first),
                                             FormatTimestamp(draft.activityDateRange.second)})},
        {"total_amount_involved", draft.totalAmountInvolved},
        {"summary", draft.summary},
        {"detailed_description", draft.detailedDescription},
        {"transaction_ids", draft.transactionIds},
        {"red_flags", draft.redFlags},
        {"regulatory_references", references},
        {"recommended_action", domain::ToString(draft.recommendedAction)}
    };
}

json JsonMapping::ToJson(const domain::Verdict& verdict) {
    json factors = json::array();
    for (const auto& factor : verdict.riskFactors) factors.push_back(ToJson(factor));
    json citations = json::array();
    for (const auto& citation : verdict.citations) citations.push_back(ToJson(citation));

    json j = {
        {"decision", domain::ToString(verdict.decision)},
        {"confidence", verdict.confidence},
        {"typology", verdict.typology ? json(*verdict.typology) : json(nullptr)},
        {"typology_confidence", verdict.typologyConfidence ? json(*verdict.typologyConfidence) : json(nullptr)},
        {"risk_factors", factors},
        {"risk_score", verdict.riskScore},
        {"citations", citations},
        {"sar_draft", verdict.reportDraft ? ToJson(*verdict.reportDraft) : json(nullptr)},
        {"reasoning", verdict.reasoning},
        {"malformed_response", verdict.malformedResponse},
        {"processing_time_ms", verdict.processingTimeMs},
        {"model_used", verdict.modelUsed}
    };
    return j;
}

json JsonMapping::ToJson(const domain::LayerResult& layer) {
    return {
        {"layer", domain::ToString(layer.layer)},
        {"score", layer.score},
        {"passed", layer.passed},
        {"processing_time_ms", layer.processingTimeMs},
        {"details", layer.details}
    };
}

json JsonMapping::ToJson(const domain::PipelineResult& result) {
    return {
        {"transaction_id", result.transactionId ? json(*result.transactionId) : json(nullptr)},
        {"statistical_result", ToJson(result.statisticalResult)},
        {"narrative_result", result.narrativeResult ? ToJson(*result.narrativeResult) : json(nullptr)},
        {"expert_result", result.expertResult ? ToJson(*result.expertResult) : json(nullptr)},
        {"final_decision", domain::ToString(result.finalDecision)},
        {"final_confidence", result.finalConfidence},
        {"total_processing_time_ms", result.totalProcessingTimeMs},
        {"layers_invoked", LayersToJson(result.layersInvoked)}
    };
}

json JsonMapping::ToJson(const domain::EvaluationMetrics& metrics) {
    return {
        {"true_positives", metrics.truePositives},
        {"false_positives", metrics.falsePositives},
        {"true_negatives", metrics.trueNegatives},
        {"false_negatives", metrics.falseNegatives},
        {"precision", metrics.precision()},
        {"recall", metrics.recall()},
        {"f1_score", metrics.f1Score()},
        {"accuracy", metrics.accuracy()}
    };
}

json JsonMapping::ToJson(const domain::SearchHit& hit) {
    return {
        {"text", hit.text},
        {"metadata", {{"source", hit.metadata.source}, {"filename", hit.metadata.filename}}},
        {"score", hit.score}
    };
}

} // namespace amlgate::infrastructure
