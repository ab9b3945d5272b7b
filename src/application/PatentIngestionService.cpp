/**
 * @file PatentIngestionService.cpp
 * @brief Implementation of PatentIngestionService.
 */

#include "application/PatentIngestionService.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <iostream>

namespace patentlens::application {

using domain::TextUtils;

PatentIngestionService::PatentIngestionService(std::shared_ptr<domain::PatentRepository> repository,
                                               std::shared_ptr<EmbeddingPipeline> embeddings,
                                               std::shared_ptr<ClaimIndexingService> indexing)
    : m_repository(std::move(repository)), m_embeddings(std::move(embeddings)), m_indexing(std::move(indexing)) {}

int PatentIngestionService::ingest(domain::Document document) {
    if (TextUtils::Trim(document.title).empty()) {
        throw domain::InvalidInputError("document title must not be empty");
    }
    if (TextUtils::Trim(document.abstract).empty()) {
        throw domain::InvalidInputError("document abstract must not be empty");
    }
    if (document.id.empty()) {
        document.id = document.patentNumber;
    }
    if (document.id.empty()) {
        throw domain::InvalidInputError("document needs an id or a patent number");
    }

    // Corpus files may ship precomputed embeddings of the configured size.
    if (document.embedding.size() != m_embeddings->dimensions()) {
        document.embedding = m_embeddings->embedDocument(document);
    }
    m_repository->saveDocument(document);

    try {
        return static_cast<int>(m_indexing->processClaims(document).size());
    } catch (const domain::ProviderError& e) {
        std::cerr << "[Ingestion] Claims of " << document.id << " not indexed: " << e.what() << std::endl;
        return 0;
    }
}

PatentIngestionService::IngestionResult PatentIngestionService::ingestAll(const std::vector<domain::Document>& documents,
                                                                         std::function<void(std::string)> statusCallback) {
    IngestionResult result;
    result.documentsReceived = static_cast<int>(documents.size());

    for (const auto& document : documents) {
        const std::string label = document.id.empty() ? document.patentNumber : document.id;
        if (statusCallback) statusCallback("Ingesting: " + label);

        if (!label.empty() && m_repository->findDocument(label)) {
            result.errors.push_back(label + ": Already imported");
            continue;
        }

        try {
            result.claimsIndexed += ingest(document);
            ++result.documentsStored;
        } catch (const std::exception& e) {
            std::cerr << "[Ingestion] Skipped " << label << ": " << e.what() << std::endl;
            result.errors.push_back(label + ": " + e.what());
        }
    }

    std::clog << "[Ingestion] Stored " << result.documentsStored << "/" << result.documentsReceived
              << " documents, " << result.claimsIndexed << " claims" << std::endl;
    return result;
}

} // namespace patentlens::application
