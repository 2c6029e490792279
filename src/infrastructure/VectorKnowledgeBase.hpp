/**
 * @file VectorKnowledgeBase.hpp
 * @brief Knowledge-base search over a pre-embedded regulatory index file.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "domain/KnowledgeBase.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace amlgate::infrastructure {

/**
 * @class VectorKnowledgeBase
 * @brief Loads regulatory chunks with their embeddings once, then ranks them by cosine similarity
 * to the embedded query. Read-only after load().
 */
class VectorKnowledgeBase : public domain::KnowledgeBase {
public:
    VectorKnowledgeBase(std::shared_ptr<OllamaClient> client,
                        std::string embeddingModel,
                        std::string indexPath,
                        std::chrono::milliseconds timeout);

    /** @brief Loads the index from disk. Missing file leaves the index empty. */
    void load();

    /** @see domain::KnowledgeBase::search */
    std::vector<domain::SearchHit> search(const std::string& query,
                                          int limit,
                                          const std::optional<std::string>& sourceFilter = std::nullopt,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    size_t size() const { return m_entries.size(); }

    static float CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2);

private:
    struct IndexEntry {
        std::string text;
        domain::SearchHit::Metadata metadata;
        std::vector<float> vector;
    };

    std::shared_ptr<OllamaClient> m_client;
    std::string m_embeddingModel;
    std::string m_indexPath;
    std::chrono::milliseconds m_timeout;
    std::vector<IndexEntry> m_entries;
};

} // namespace amlgate::infrastructure
