#include "infrastructure/PromptCatalog.hpp"
#include "domain/TextFormat.hpp"
#include <sstream>

namespace amlgate::infrastructure {

std::string PromptCatalog::GetAdjudicationSystemPrompt() {
    return
        "You are a senior AML/CFT compliance expert acting as the final decision maker in a staged transaction screening system.\n\n"
        "Your background:\n"
        "- Former MLRO (Money Laundering Reporting Officer) at a Tier 1 bank\n"
        "- Certified Anti-Money Laundering Specialist (CAMS)\n"
        "- Deep expertise in FATF recommendations, EU AML directives, and US regulations\n"
        "- Experience with enforcement actions and regulatory examinations\n\n"
        "Your role:\n"
        "- You are invoked ONLY when the statistical gate and the narrative gate both flag suspicious activity\n"
        "- You receive pre-computed scores: statistical_score (0-10) and narrative_score (0-1)\n"
        "- You must synthesize these signals with regulatory knowledge to make a final decision\n\n"
        "Your task:\n"
        "1. Analyze the transaction and account history\n"
        "2. Consider the statistical and narrative scores\n"
        "3. Identify the most likely money laundering typology (if any)\n"
        "4. Make a decision: BLOCK, APPROVE, or REVIEW\n"
        "5. Provide clear reasoning citing specific regulations\n\n"
        "Output format - respond with JSON only:\n"
        "{\n"
        "    \"decision\": \"BLOCK\" | \"APPROVE\" | \"REVIEW\",\n"
        "    \"confidence\": 0.0-1.0,\n"
        "    \"typology\": \"Structuring\" | \"Smurfing\" | \"Layering\" | \"TBML\" | \"Shell Company\" | null,\n"
        "    \"reasoning\": \"Your detailed reasoning here\",\n"
        "    \"key_risk_factors\": [\"factor1\", \"factor2\"],\n"
        "    \"regulatory_citations\": [\"FATF Rec 20\", \"EU AMLD6 Art 3\"]\n"
        "}\n";
}

std::string PromptCatalog::GetConsultationSystemPrompt() {
    return
        "You are a senior AML/CFT compliance expert with 20+ years of experience.\n\n"
        "Your background:\n"
        "- Former MLRO (Money Laundering Reporting Officer) at a Tier 1 bank\n"
        "- Certified Anti-Money Laundering Specialist (CAMS)\n"
        "- Deep expertise in FATF recommendations, EU AML directives, and UK/US regulations\n"
        "- Practical knowledge of transaction monitoring, KYC/CDD, and SAR filing\n\n"
        "Your role:\n"
        "- Answer questions about AML/CFT compliance with precision\n"
        "- Explain complex regulatory concepts in clear terms\n"
        "- Cite specific regulations and guidance when relevant\n"
        "- Identify red flags and typologies\n\n"
        "Your style:\n"
        "- Professional but accessible\n"
        "- Specific and detailed, not vague\n"
        "- Always cite sources when available\n"
        "- Acknowledge uncertainty when appropriate\n";
}

std::string PromptCatalog::BuildAdjudicationPrompt(const domain::AdjudicationInput& input,
                                                   const std::optional<domain::TypologyMatch>& typology,
                                                   const std::string& regulatoryContext) {
    using namespace domain;
    const auto& tx = input.getTransaction();
    const auto& stats = input.getStats();
    const double stat = input.getStatisticalScore();
    const double narr = input.getNarrativeScore();

    std::stringstream ss;
    ss << "TRANSACTION UNDER REVIEW:\n"
       << "- Amount: " << FormatMoney(tx.amountSent()) << " " << tx.amount.currencySent << "\n"
       << "- Payment Format: " << tx.paymentFormat << "\n"
       << "- Date: " << FormatUtc(tx.timestamp, "%Y-%m-%d %H:%M") << "\n"
       << "- Sender: Account " << tx.sender.accountId << " at Bank " << tx.sender.bankId << "\n"
       << "- Receiver: Account " << tx.receiver.accountId << " at Bank " << tx.receiver.bankId << "\n\n";

    ss << "STATISTICAL GATE SCORE: " << FormatFixed(stat, 2) << "/10.0\n"
       << "- Interpretation: "
       << (stat > 5.0 ? "HIGH ANOMALY" : stat > 3.0 ? "MODERATE ANOMALY" : "LOW ANOMALY") << "\n\n";

    ss << "NARRATIVE GATE SCORE: " << FormatPercent(narr, 2) << "\n"
       << "- Interpretation: "
       << (narr < 0.3 ? "SEVERE BREAK" : narr < 0.5 ? "SUSPICIOUS" : "MODERATE DEVIATION") << "\n\n";

    ss << "ACCOUNT HISTORY:\n"
       << "- Total Transactions: " << stats.totalTransactions << "\n"
       << "- Total Sent: " << FormatMoney(stats.totalSent) << "\n"
       << "- Total Received: " << FormatMoney(stats.totalReceived) << "\n"
       << "- Avg Transaction: " << FormatMoney(stats.avgTransactionAmount) << "\n"
       << "- Unique Counterparties: " << stats.uniqueCounterparties << "\n"
       << "- Frequency: " << FormatFixed(stats.transactionFrequencyPerDay, 2) << "/day\n\n";

    ss << "TRIGGERED BY: " << ToUpperAscii(ToString(input.getTriggeredBy())) << " GATE\n\n";

    ss << "PRE-DETECTED TYPOLOGY: " << (typology ? typology->getName() : std::string("None detected")) << "\n";
    if (typology) {
        ss << "- Confidence: " << FormatPercent(typology->getConfidence()) << "\n"
           << "- Signals: ";
        const auto& signals = typology->getSignalsMatched();
        for (size_t i = 0; i < signals.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << signals[i];
        }
        ss << "\n";
        if (const auto* definition = FindTypology(typology->getName())) {
            ss << "- Typical indicators:";
            for (const auto& indicator : definition->statisticalSignals) ss << " " << indicator;
            for (const auto& indicator : definition->narrativeSignals) ss << " " << indicator;
            ss << "\n";
        }
    }

    ss << "\nREGULATORY CONTEXT:\n" << regulatoryContext << "\n\n"
       << "Based on all the above, provide your decision as JSON.";
    return ss.str();
}

std::string PromptCatalog::BuildConsultationPrompt(const std::string& regulatoryContext, const std::string& question) {
    return
        "REGULATORY CONTEXT (from knowledge base):\n" + regulatoryContext + "\n\n"
        "USER QUESTION:\n" + question + "\n\n"
        "Provide a comprehensive answer based on the regulatory context above and your expertise.\n"
        "Structure your response clearly. Cite specific documents when referencing guidance.";
}

} // namespace amlgate::infrastructure
