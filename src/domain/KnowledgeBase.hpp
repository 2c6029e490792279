/**
 * @file KnowledgeBase.hpp
 * @brief Interface for the regulatory knowledge-base search.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace amlgate::domain {

/** @brief One ranked search result. */
struct SearchHit {
    struct Metadata {
        std::string source;   ///< "FATF", "EU", "Enforcement"...
        std::string filename;
    };

    std::string text;
    Metadata metadata;
    double score = 0.0;
};

/**
 * @class KnowledgeBase
 * @brief Similarity search over regulatory documents.
 */
class KnowledgeBase {
public:
    virtual ~KnowledgeBase() = default;

    /**
     * @brief Searches the knowledge base.
     * @param query Free-text query.
     * @param limit Maximum number of hits.
     * @param sourceFilter Restrict hits to one metadata source.
     * @param timeout Bound on the backend call; the implementation default when empty.
     * @return Hits ranked by score, highest first.
     * @throws ExternalUnavailableError if the search backend cannot be reached.
     */
    virtual std::vector<SearchHit> search(const std::string& query,
                                          int limit,
                                          const std::optional<std::string>& sourceFilter = std::nullopt,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;
};

} // namespace amlgate::domain
