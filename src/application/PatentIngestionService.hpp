/**
 * @file PatentIngestionService.hpp
 * @brief Stores new patent documents with their embeddings and claims.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/ClaimIndexingService.hpp"
#include "application/EmbeddingPipeline.hpp"
#include "domain/PatentRepository.hpp"

namespace patentlens::application {

/**
 * @class PatentIngestionService
 * @brief Orchestrates the ingestion pipeline from raw document to indexed claims.
 */
class PatentIngestionService {
public:
    PatentIngestionService(std::shared_ptr<domain::PatentRepository> repository,
                           std::shared_ptr<EmbeddingPipeline> embeddings,
                           std::shared_ptr<ClaimIndexingService> indexing);

    /**
     * @brief Result of an ingestion run.
     */
    struct IngestionResult {
        int documentsReceived = 0;
        int documentsStored = 0;
        int claimsIndexed = 0;
        std::vector<std::string> errors;
    };

    /**
     * @brief Embeds and stores one document, then indexes its claims.
     *
     * A document without id takes its patent number as id. A claim indexing
     * failure is logged; the stored document is kept.
     *
     * @return Number of claims indexed.
     * @throws domain::InvalidInputError when title, abstract or id is missing.
     * @throws domain::ProviderError when the document cannot be embedded.
     */
    int ingest(domain::Document document);

    /**
     * @brief Ingests a batch, collecting per-document errors instead of stopping.
     * Documents whose id is already stored are reported as already imported.
     * @param statusCallback Progress feedback.
     */
    IngestionResult ingestAll(const std::vector<domain::Document>& documents,
                              std::function<void(std::string)> statusCallback = nullptr);

private:
    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<EmbeddingPipeline> m_embeddings;
    std::shared_ptr<ClaimIndexingService> m_indexing;
};

} // namespace patentlens::application
