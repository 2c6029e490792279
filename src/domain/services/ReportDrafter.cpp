/**
 * @file ReportDrafter.cpp
 * @brief Implementation of the ReportDrafter templates.
 */

#include "domain/services/ReportDrafter.hpp"

#include <algorithm>
#include <sstream>

#include "domain/TextFormat.hpp"

namespace amlgate::domain::services {

namespace {

std::string JoinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

ReportDrafter::ReportDrafter(std::string filingInstitution)
    : m_filingInstitution(std::move(filingInstitution)) {}

ReportDraft ReportDrafter::draft(const AdjudicationInput& input,
                                 const std::optional<TypologyMatch>& primaryTypology,
                                 const std::vector<RiskFactor>& riskFactors,
                                 const std::string& reasoning) const {
    const auto& tx = input.getTransaction();
    const auto& stats = input.getStats();

    ReportDraft report;
    report.subjectAccount = input.getHistory().accountId;
    report.filingInstitution = m_filingInstitution;
    report.activityType = primaryTypology ? primaryTypology->getName() : "Unusual Activity";
    report.activityDateRange = {stats.firstTransaction, tx.timestamp};
    report.totalAmountInvolved = stats.totalSent + tx.amountSent();

    for (const auto& factor : riskFactors) {
        report.redFlags.push_back(factor.factor + ": " + factor.description);
    }
    if (primaryTypology) {
        for (const auto& signal : primaryTypology->getSignalsMatched()) {
            report.redFlags.push_back("Signal: " + signal);
        }
    }

    if (tx.id) {
        report.transactionIds.push_back(*tx.id);
    }
    report.regulatoryReferences = GetRegulatoryReferences(report.activityType);
    report.summary = buildSummary(input, primaryTypology, riskFactors);
    report.detailedDescription = buildDetailedDescription(input, primaryTypology, riskFactors, reasoning);
    report.recommendedAction = RecommendAction(primaryTypology, riskFactors);
    return report;
}

std::vector<RegulatoryReference> ReportDrafter::GetRegulatoryReferences(const std::string& activityType) {
    std::vector<RegulatoryReference> refs = {
        {"FATF", "Recommendation 20", "Reporting of suspicious transactions"},
    };

    if (activityType == "Structuring") {
        refs.push_back({"FinCEN", "31 CFR 1010.314", "Structuring transactions to evade reporting requirements"});
        refs.push_back({"FATF", "Recommendation 10", "Customer due diligence for suspicious patterns"});
    } else if (activityType == "Smurfing") {
        refs.push_back({"FATF", "Recommendation 10", "Customer due diligence and ongoing monitoring"});
        refs.push_back({"EU AMLD6", "Article 3(4)(f)", "Money laundering through multiple transactions"});
    } else if (activityType == "Layering") {
        refs.push_back({"FATF", "Recommendation 16", "Wire transfers and beneficiary information"});
        refs.push_back({"EU AMLR", "Article 50", "Enhanced monitoring for complex transactions"});
    } else if (activityType.find("Trade") != std::string::npos) {
        refs.push_back({"FATF", "Trade-Based Money Laundering Typologies Report", "Red flags and detection methods for TBML"});
        refs.push_back({"Wolfsberg", "Trade Finance Principles", "Due diligence for trade transactions"});
    } else if (activityType.find("Shell") != std::string::npos) {
        refs.push_back({"FATF", "Recommendation 24", "Transparency of beneficial ownership"});
        refs.push_back({"EU AMLD5", "Article 30", "Beneficial ownership registers"});
    }
    return refs;
}

RecommendedAction ReportDrafter::RecommendAction(const std::optional<TypologyMatch>& primaryTypology,
                                                 const std::vector<RiskFactor>& riskFactors) {
    if (primaryTypology && primaryTypology->getConfidence() > 0.7) {
        return RecommendedAction::FileSar;
    }
    bool anyCritical = std::any_of(riskFactors.begin(), riskFactors.end(),
                                   [](const RiskFactor& f) { return f.severity == Severity::Critical; });
    if (anyCritical) {
        return RecommendedAction::FileSar;
    }
    if (riskFactors.size() >= 3) {
        return RecommendedAction::EscalateToCompliance;
    }
    return RecommendedAction::EnhancedMonitoring;
}

std::string ReportDrafter::buildSummary(const AdjudicationInput& input,
                                        const std::optional<TypologyMatch>& primaryTypology,
                                        const std::vector<RiskFactor>& riskFactors) const {
    const auto& tx = input.getTransaction();
    const auto& stats = input.getStats();

    std::stringstream ss;
    ss << "Account " << input.getHistory().accountId << " has been flagged for potential "
       << (primaryTypology ? primaryTypology->getName() : std::string("suspicious activity")) << ". "
       << "A transaction of " << FormatMoney(tx.amountSent()) << " via " << tx.paymentFormat << " on "
       << FormatUtc(tx.timestamp) << " triggered automated detection systems. "
       << "The account has processed " << stats.totalTransactions << " transactions totaling "
       << FormatMoney(stats.totalSent) << " sent and " << FormatMoney(stats.totalReceived) << " received. "
       << "Statistical analysis indicates a " << FormatFixed(input.getStatisticalScore(), 1) << "/10 anomaly score, "
       << "and narrative coherence analysis shows " << FormatPercent(input.getNarrativeScore())
       << " consistency with historical behavior.";

    if (!riskFactors.empty()) {
        ss << " " << riskFactors.size() << " risk factors were identified.";
    }
    return ss.str();
}

std::string ReportDrafter::buildDetailedDescription(const AdjudicationInput& input,
                                                    const std::optional<TypologyMatch>& primaryTypology,
                                                    const std::vector<RiskFactor>& riskFactors,
                                                    const std::string& reasoning) const {
    const auto& tx = input.getTransaction();
    const auto& stats = input.getStats();
    std::vector<std::string> sections;

    {
        std::stringstream ss;
        ss << "TRANSACTION DETAILS:\n"
           << "- Transaction ID: " << tx.id.value_or("N/A") << "\n"
           << "- Date/Time: " << FormatUtc(tx.timestamp, "%Y-%m-%d %H:%M:%S UTC") << "\n"
           << "- Amount Sent: " << FormatMoney(tx.amount.sent) << " " << tx.amount.currencySent << "\n"
           << "- Amount Received: " << FormatMoney(tx.amount.received) << " " << tx.amount.currencyReceived << "\n"
           << "- Payment Method: " << tx.paymentFormat << "\n"
           << "- Sender: Account " << tx.sender.accountId << " at Bank " << tx.sender.bankId << "\n"
           << "- Receiver: Account " << tx.receiver.accountId << " at Bank " << tx.receiver.bankId;
        sections.push_back(ss.str());
    }

    {
        std::stringstream ss;
        ss << "ACCOUNT HISTORY:\n"
           << "- Total Transactions: " << stats.totalTransactions << "\n"
           << "- Total Sent: " << FormatMoney(stats.totalSent) << "\n"
           << "- Total Received: " << FormatMoney(stats.totalReceived) << "\n"
           << "- Average Transaction: " << FormatMoney(stats.avgTransactionAmount) << "\n"
           << "- Unique Counterparties: " << stats.uniqueCounterparties << "\n"
           << "- Transaction Frequency: " << FormatFixed(stats.transactionFrequencyPerDay, 2) << "/day\n"
           << "- Account Active Since: " << FormatUtc(stats.firstTransaction);
        sections.push_back(ss.str());
    }

    {
        std::stringstream ss;
        ss << "DETECTION ANALYSIS:\n"
           << "- Statistical Anomaly Score: " << FormatFixed(input.getStatisticalScore(), 2) << "/10.0\n"
           << "- Narrative Coherence Score: " << FormatPercent(input.getNarrativeScore(), 2) << "\n"
           << "- Triggered By: " << TitleCase(ToString(input.getTriggeredBy())) << " Engine";
        sections.push_back(ss.str());
    }

    if (primaryTypology) {
        std::stringstream ss;
        ss << "TYPOLOGY ANALYSIS:\n"
           << "- Detected Pattern: " << primaryTypology->getName() << "\n"
           << "- Confidence: " << FormatPercent(primaryTypology->getConfidence()) << "\n"
           << "- Description: " << primaryTypology->getDescription() << "\n"
           << "- Signals Matched:";
        for (const auto& signal : primaryTypology->getSignalsMatched()) {
            ss << "\n  * " << signal;
        }
        if (const auto* definition = FindTypology(primaryTypology->getName())) {
            ss << "\n- Catalog Key: " << definition->key
               << "\n- Typical Statistical Indicators: " << JoinList(definition->statisticalSignals)
               << "\n- Typical Behavioural Indicators: " << JoinList(definition->narrativeSignals);
        }
        sections.push_back(ss.str());
    }

    if (!riskFactors.empty()) {
        std::stringstream ss;
        ss << "RISK FACTORS:\n";
        int index = 1;
        for (const auto& factor : riskFactors) {
            ss << index++ << ". " << factor.factor << " [" << ToUpperAscii(ToString(factor.severity)) << "]\n"
               << "   " << factor.description << "\n";
            if (!factor.evidence.empty()) {
                ss << "   Evidence: ";
                for (size_t i = 0; i < factor.evidence.size(); ++i) {
                    if (i > 0) ss << ", ";
                    ss << factor.evidence[i];
                }
                ss << "\n";
            }
        }
        sections.push_back(ss.str());
    }

    sections.push_back("AI ANALYSIS:\n" + reasoning);

    std::string out;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += sections[i];
    }
    return out;
}

} // namespace amlgate::domain::services
