/**
 * @file InMemoryPatentRepository.cpp
 * @brief Implementation of InMemoryPatentRepository.
 */

#include "infrastructure/InMemoryPatentRepository.hpp"
#include "domain/SimilarityFusion.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace patentlens::infrastructure {

using domain::SimilarityFusion;

namespace {

template <typename Hit>
void KeepNearest(std::vector<Hit>& hits, size_t limit) {
    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.distance < b.distance;
    });
    if (hits.size() > limit) hits.resize(limit);
}

} // namespace

void InMemoryPatentRepository::saveDocument(const domain::Document& document) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_indexById.find(document.id);
    if (it != m_indexById.end()) {
        m_documents[it->second] = document;
        return;
    }
    m_indexById[document.id] = m_documents.size();
    m_documents.push_back(document);
}

std::optional<domain::Document> InMemoryPatentRepository::findDocument(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_indexById.find(id);
    if (it == m_indexById.end()) return std::nullopt;
    return m_documents[it->second];
}

std::vector<domain::Document> InMemoryPatentRepository::listDocuments(size_t limit, size_t offset) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::Document> out;
    for (size_t i = offset; i < m_documents.size() && out.size() < limit; ++i) {
        out.push_back(m_documents[i]);
    }
    return out;
}

size_t InMemoryPatentRepository::documentCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_documents.size();
}

std::vector<domain::Claim> InMemoryPatentRepository::claimsFor(const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_claims.find(documentId);
    if (it == m_claims.end()) return {};
    return it->second;
}

void InMemoryPatentRepository::replaceClaims(const std::string& documentId, const std::vector<domain::Claim>& claims) {
    std::vector<domain::Claim> sorted = claims;
    std::stable_sort(sorted.begin(), sorted.end(), [](const domain::Claim& a, const domain::Claim& b) {
        return a.number < b.number;
    });
    for (auto& claim : sorted) claim.documentId = documentId;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (sorted.empty()) {
        m_claims.erase(documentId);
    } else {
        m_claims[documentId] = std::move(sorted);
    }
}

std::vector<domain::NeighborHit> InMemoryPatentRepository::nearestDocuments(const std::vector<float>& query, size_t limit) const {
    std::vector<domain::NeighborHit> hits;
    if (limit == 0) return hits;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& document : m_documents) {
        if (document.embedding.size() != query.size() || query.empty()) continue;
        hits.push_back({document.id, 1.0 - SimilarityFusion::Cosine(query, document.embedding)});
    }
    KeepNearest(hits, limit);
    return hits;
}

std::vector<domain::ClaimNeighborHit> InMemoryPatentRepository::nearestClaims(const std::vector<float>& query,
                                                                              size_t limit,
                                                                              const std::optional<std::string>& excludeDocumentId) const {
    std::vector<domain::ClaimNeighborHit> hits;
    if (limit == 0) return hits;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& document : m_documents) {
        if (excludeDocumentId && document.id == *excludeDocumentId) continue;
        auto it = m_claims.find(document.id);
        if (it == m_claims.end()) continue;
        for (const auto& claim : it->second) {
            if (claim.embedding.size() != query.size() || query.empty()) continue;
            hits.push_back({document.id, claim.number, 1.0 - SimilarityFusion::Cosine(query, claim.embedding)});
        }
    }
    KeepNearest(hits, limit);
    return hits;
}

json InMemoryPatentRepository::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    json documents = json::array();
    json claims = json::array();
    for (const auto& document : m_documents) {
        documents.push_back(JsonMapping::ToJson(document, true));
        auto it = m_claims.find(document.id);
        if (it == m_claims.end()) continue;
        for (const auto& claim : it->second) {
            claims.push_back(JsonMapping::ToJson(claim, true));
        }
    }
    return { {"documents", documents}, {"claims", claims} };
}

void InMemoryPatentRepository::loadJson(const json& snapshot) {
    std::vector<domain::Document> documents;
    std::map<std::string, size_t> indexById;
    std::map<std::string, std::vector<domain::Claim>> claims;

    for (const auto& node : snapshot.value("documents", json::array())) {
        auto document = JsonMapping::DocumentFromJson(node);
        if (document.id.empty() || indexById.count(document.id)) continue;
        indexById[document.id] = documents.size();
        documents.push_back(std::move(document));
    }
    for (const auto& node : snapshot.value("claims", json::array())) {
        auto claim = JsonMapping::ClaimFromJson(node);
        if (!indexById.count(claim.documentId)) continue;
        claims[claim.documentId].push_back(std::move(claim));
    }
    for (auto& [id, list] : claims) {
        std::stable_sort(list.begin(), list.end(), [](const domain::Claim& a, const domain::Claim& b) {
            return a.number < b.number;
        });
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_documents = std::move(documents);
    m_indexById = std::move(indexById);
    m_claims = std::move(claims);
}

bool InMemoryPatentRepository::loadFile(const std::string& path) {
    if (!fs::exists(path)) return false;

    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[PatentRepository] Cannot open " << path << std::endl;
            return false;
        }
        loadJson(json::parse(f));
        std::clog << "[PatentRepository] Loaded " << documentCount() << " documents from " << path << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[PatentRepository] Unreadable store " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace patentlens::infrastructure
