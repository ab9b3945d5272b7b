/**
 * @file PatentRepository.hpp
 * @brief Interface for document and claim storage with nearest-neighbour lookup.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Patent.hpp"
#include "domain/SimilarityMatch.hpp"

namespace patentlens::domain {

/**
 * @struct NeighborHit
 * @brief Entity id with its cosine distance (1 - cosine) to the query vector.
 */
struct NeighborHit {
    std::string id;
    double distance = 0.0;
};

/**
 * @struct ClaimNeighborHit
 * @brief Nearest-claim hit. Claims have no id of their own, so the hit names
 *        the owning document and the claim number.
 */
struct ClaimNeighborHit {
    std::string documentId;
    int claimNumber = 0;
    double distance = 0.0;
};

/**
 * @class PatentRepository
 * @brief Abstract storage of documents and their derived claims.
 *
 * Nearest-neighbour results are ordered by ascending distance; equal
 * distances keep storage order.
 */
class PatentRepository {
public:
    virtual ~PatentRepository() = default;

    virtual void saveDocument(const Document& document) = 0;
    virtual std::optional<Document> findDocument(const std::string& id) const = 0;

    /** @brief Documents in storage order, at most @p limit of them. */
    virtual std::vector<Document> listDocuments(size_t limit, size_t offset = 0) const = 0;
    virtual size_t documentCount() const = 0;

    /** @brief Stored claims of a document ordered by claim number. */
    virtual std::vector<Claim> claimsFor(const std::string& documentId) const = 0;

    /** @brief Deletes every stored claim of the document, then stores @p claims. */
    virtual void replaceClaims(const std::string& documentId, const std::vector<Claim>& claims) = 0;

    /** @brief Nearest embedded documents. */
    virtual std::vector<NeighborHit> nearestDocuments(const std::vector<float>& query, size_t limit) const = 0;

    /** @brief Nearest embedded claims across all documents. */
    virtual std::vector<ClaimNeighborHit> nearestClaims(const std::vector<float>& query,
                                                        size_t limit,
                                                        const std::optional<std::string>& excludeDocumentId = std::nullopt) const = 0;
};

} // namespace patentlens::domain
