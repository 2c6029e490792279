/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include "domain/TextFormat.hpp"
#include <sstream>
#include <unordered_set>

namespace amlgate::application {

namespace {
constexpr int kQueryLimit = 3;
constexpr size_t kMaxTypologyHits = 6;
constexpr size_t kDedupPrefix = 100;
}

ContextAssembler::ContextAssembler(std::shared_ptr<domain::KnowledgeBase> knowledge,
                                   size_t maxCharsPerResult,
                                   std::chrono::milliseconds searchTimeout)
    : m_knowledge(std::move(knowledge)), m_maxChars(maxCharsPerResult), m_searchTimeout(searchTimeout) {}

RegulatoryContext ContextAssembler::assemble(const domain::AdjudicationInput& input,
                                             const std::optional<domain::TypologyMatch>& typology,
                                             const domain::Deadline& deadline) const {
    RegulatoryContext context;

    if (typology) {
        context.sections.emplace_back("TYPOLOGY GUIDANCE (" + typology->getName() + ")",
                                      searchTypologyGuidance(typology->getName(), deadline));
    }

    const double amount = input.getTransaction().amountSent();
    if (amount >= 9000.0 && amount < 10000.0) {
        auto hits = search("structuring reporting threshold $10000", "threshold guidance search", deadline);
        context.sections.emplace_back("THRESHOLD GUIDANCE", FormatHits(hits, m_maxChars));
    }

    auto hits = search("suspicious activity report filing requirements", "reporting requirements search", deadline);
    context.sections.emplace_back("SAR REQUIREMENTS", FormatHits(hits, m_maxChars));

    return context;
}

std::string ContextAssembler::searchTypologyGuidance(const std::string& typology,
                                                     const domain::Deadline& deadline) const {
    const std::vector<std::string> queries = {
        typology + " money laundering typology red flags",
        typology + " suspicious activity indicators",
        typology + " detection methods AML",
    };

    std::vector<domain::SearchHit> unique;
    std::unordered_set<std::string> seen;
    for (const auto& query : queries) {
        for (auto& hit : search(query, "typology guidance search", deadline)) {
            if (seen.insert(domain::TruncateUtf8(hit.text, kDedupPrefix)).second) {
                unique.push_back(std::move(hit));
            }
        }
    }

    if (unique.size() > kMaxTypologyHits) unique.resize(kMaxTypologyHits);
    return FormatHits(unique, m_maxChars);
}

std::vector<domain::SearchHit> ContextAssembler::search(const std::string& query,
                                                       const std::string& stage,
                                                       const domain::Deadline& deadline) const {
    return domain::CallWithin(deadline, m_searchTimeout, stage, [&](std::chrono::milliseconds timeout) {
        return m_knowledge->search(query, kQueryLimit, std::nullopt, timeout);
    });
}

std::string ContextAssembler::FormatHits(const std::vector<domain::SearchHit>& hits, size_t maxChars) {
    std::stringstream ss;
    int index = 1;
    for (const auto& hit : hits) {
        if (index > 1) ss << "\n";
        ss << "---\n"
           << "SOURCE " << index++ << ": [" << hit.metadata.source << "] " << hit.metadata.filename
           << " (relevance: " << domain::FormatFixed(hit.score, 2) << ")\n"
           << domain::TruncateUtf8(hit.text, maxChars) << "\n"
           << "---";
    }
    return ss.str();
}

std::string RegulatoryContext::render() const {
    std::stringstream ss;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) ss << "\n\n";
        ss << sections[i].first << ":\n" << sections[i].second;
    }
    return ss.str();
}

} // namespace amlgate::application
