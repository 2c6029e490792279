/**
 * @file ContextAssembler.hpp
 * @brief Application service to assemble regulatory context for the reasoning service.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/Adjudication.hpp"
#include "domain/Deadline.hpp"
#include "domain/KnowledgeBase.hpp"
#include "domain/Typology.hpp"

namespace amlgate::application {

/**
 * @struct RegulatoryContext
 * @brief Labelled context sections, rendered into a single blob for the prompt.
 */
struct RegulatoryContext {
    std::vector<std::pair<std::string, std::string>> sections;

    /** @brief "<LABEL>:\n<body>" per section, joined by blank lines. */
    std::string render() const;

    bool isEmpty() const { return sections.empty(); }
};

/**
 * @class ContextAssembler
 * @brief Queries the knowledge base for typology, threshold and reporting guidance.
 */
class ContextAssembler {
public:
    ContextAssembler(std::shared_ptr<domain::KnowledgeBase> knowledge,
                     size_t maxCharsPerResult = 1500,
                     std::chrono::milliseconds searchTimeout = std::chrono::milliseconds(2000));

    /**
     * @brief Assembles the context for one escalated case.
     * @param input The case under adjudication.
     * @param typology Primary typology, if any.
     * @param deadline Bounds each search; expiry raises domain::DeadlineExceededError.
     */
    RegulatoryContext assemble(const domain::AdjudicationInput& input,
                               const std::optional<domain::TypologyMatch>& typology,
                               const domain::Deadline& deadline = domain::Deadline()) const;

    /** @brief Three typology queries, deduplicated by leading text, at most six hits. */
    std::string searchTypologyGuidance(const std::string& typology,
                                       const domain::Deadline& deadline = domain::Deadline()) const;

    /** @brief "---\nSOURCE i: [source] filename (relevance: x.xx)\n<text>\n---" per hit. */
    static std::string FormatHits(const std::vector<domain::SearchHit>& hits, size_t maxChars);

    size_t getMaxCharsPerResult() const { return m_maxChars; }

private:
    std::vector<domain::SearchHit> search(const std::string& query,
                                          const std::string& stage,
                                          const domain::Deadline& deadline) const;

    std::shared_ptr<domain::KnowledgeBase> m_knowledge;
    size_t m_maxChars;
    std::chrono::milliseconds m_searchTimeout;
};

} // namespace amlgate::application
