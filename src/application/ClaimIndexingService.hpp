/**
 * @file ClaimIndexingService.hpp
 * @brief Derives, embeds and stores the claims of a document.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/EmbeddingPipeline.hpp"
#include "domain/PatentRepository.hpp"

namespace patentlens::application {

/**
 * @class ClaimIndexingService
 * @brief Keeps the stored claim set of each document in sync with its claims text.
 */
class ClaimIndexingService {
public:
    ClaimIndexingService(std::shared_ptr<domain::PatentRepository> repository,
                         std::shared_ptr<EmbeddingPipeline> embeddings,
                         size_t concurrentRequests = 5);

    /**
     * @brief Parses, embeds and stores the claims of a document.
     *
     * The stored set is replaced in one step. A claim whose embedding fails
     * is stored without one; when every embedding fails the previous set is
     * kept and the last ProviderError is rethrown.
     *
     * @throws domain::InvalidInputError for an unknown document id.
     */
    std::vector<domain::Claim> processClaims(const std::string& documentId);

    /** @brief Same as above for a document already in hand. */
    std::vector<domain::Claim> processClaims(const domain::Document& document);

    /** @brief Returns the stored claims, indexing the document first if it has none. */
    std::vector<domain::Claim> ensureClaims(const std::string& documentId);

private:
    void embedAll(std::vector<domain::Claim>& claims);

    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<EmbeddingPipeline> m_embeddings;
    size_t m_concurrentRequests;
};

} // namespace patentlens::application
