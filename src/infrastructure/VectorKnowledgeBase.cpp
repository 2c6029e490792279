/**
 * @file VectorKnowledgeBase.cpp
 * @brief Implementation of VectorKnowledgeBase.
 */

#include "infrastructure/VectorKnowledgeBase.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace amlgate::infrastructure {

VectorKnowledgeBase::VectorKnowledgeBase(std::shared_ptr<OllamaClient> client,
                                         std::string embeddingModel,
                                         std::string indexPath,
                                         std::chrono::milliseconds timeout)
    : m_client(std::move(client)),
      m_embeddingModel(std::move(embeddingModel)),
      m_indexPath(std::move(indexPath)),
      m_timeout(timeout) {}

void VectorKnowledgeBase::load() {
    m_entries.clear();
    if (m_indexPath.empty() || !fs::exists(m_indexPath)) {
        std::cerr << "[VectorKnowledgeBase] Index not found: " << m_indexPath
                  << ". Regulatory context will be empty." << std::endl;
        return;
    }

    std::ifstream f(m_indexPath);
    if (!f.is_open()) {
        std::cerr << "[VectorKnowledgeBase] Cannot open index: " << m_indexPath << std::endl;
        return;
    }

    try {
        json j = json::parse(f);
        if (!j.is_array()) {
            std::cerr << "[VectorKnowledgeBase] Index must be a JSON array." << std::endl;
            return;
        }
        size_t skipped = 0;
        for (const auto& item : j) {
            if (!item.contains("text") || !item.contains("embedding") || !item["embedding"].is_array()) {
                skipped++;
                continue;
            }
            IndexEntry entry;
            entry.text = item["text"].get<std::string>();
            if (item.contains("metadata") && item["metadata"].is_object()) {
                entry.metadata.source = item["metadata"].value("source", "Unknown");
                entry.metadata.filename = item["metadata"].value("filename", "Unknown");
            } else {
                entry.metadata = {"Unknown", "Unknown"};
            }
            entry.vector = item["embedding"].get<std::vector<float>>();
            m_entries.push_back(std::move(entry));
        }
        std::cout << "[VectorKnowledgeBase] Loaded " << m_entries.size() << " chunks";
        if (skipped > 0) std::cout << " (" << skipped << " malformed skipped)";
        std::cout << " from " << m_indexPath << std::endl;
    } catch (const json::exception& e) {
        m_entries.clear();
        std::cerr << "[VectorKnowledgeBase] Error reading index: " << e.what() << std::endl;
    }
}

std::vector<domain::SearchHit> VectorKnowledgeBase::search(const std::string& query,
                                                           int limit,
                                                           const std::optional<std::string>& sourceFilter,
                                                           std::optional<std::chrono::milliseconds> timeout) {
    std::vector<domain::SearchHit> hits;
    if (m_entries.empty() || limit <= 0) return hits;

    auto queryVec = m_client->getEmbedding(m_embeddingModel, query, timeout.value_or(m_timeout));

    for (const auto& entry : m_entries) {
        if (sourceFilter && entry.metadata.source != *sourceFilter) continue;
        domain::SearchHit hit;
        hit.text = entry.text;
        hit.metadata = entry.metadata;
        hit.score = CosineSimilarity(queryVec, entry.vector);
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    if (hits.size() > static_cast<size_t>(limit)) hits.resize(limit);
    return hits;
}

float VectorKnowledgeBase::CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0f;
    float dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += v1[i] * v2[i];
        n1 += v1[i] * v1[i];
        n2 += v2[i] * v2[i];
    }
    float norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0f;
}

} // namespace amlgate::infrastructure
