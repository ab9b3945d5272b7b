/**
 * @file InMemoryPatentRepository.hpp
 * @brief PatentRepository kept in memory with brute-force nearest-neighbour search.
 */

#pragma once
#include <map>
#include <optional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/PatentRepository.hpp"

namespace patentlens::infrastructure {

/**
 * @class InMemoryPatentRepository
 * @brief Thread-safe store; snapshots round-trip through JSON.
 *
 * The corpus stays below a few thousand documents, so nearest-neighbour
 * queries scan every embedding.
 */
class InMemoryPatentRepository : public domain::PatentRepository {
public:
    InMemoryPatentRepository() = default;

    void saveDocument(const domain::Document& document) override;
    std::optional<domain::Document> findDocument(const std::string& id) const override;
    std::vector<domain::Document> listDocuments(size_t limit, size_t offset = 0) const override;
    size_t documentCount() const override;

    std::vector<domain::Claim> claimsFor(const std::string& documentId) const override;
    void replaceClaims(const std::string& documentId, const std::vector<domain::Claim>& claims) override;

    std::vector<domain::NeighborHit> nearestDocuments(const std::vector<float>& query, size_t limit) const override;
    std::vector<domain::ClaimNeighborHit> nearestClaims(const std::vector<float>& query,
                                                        size_t limit,
                                                        const std::optional<std::string>& excludeDocumentId = std::nullopt) const override;

    /** @brief Documents and claims, embeddings included. */
    nlohmann::json toJson() const;

    /** @brief Replaces the contents with a snapshot produced by toJson(). */
    void loadJson(const nlohmann::json& snapshot);

    /** @brief Loads a snapshot file; a missing file leaves the store empty. */
    bool loadFile(const std::string& path);

private:
    mutable std::mutex m_mutex;
    std::vector<domain::Document> m_documents;      ///< Storage order.
    std::map<std::string, size_t> m_indexById;
    std::map<std::string, std::vector<domain::Claim>> m_claims;
};

} // namespace patentlens::infrastructure
