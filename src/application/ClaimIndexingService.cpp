/**
 * @file ClaimIndexingService.cpp
 * @brief Implementation of ClaimIndexingService.
 */

#include "application/ClaimIndexingService.hpp"
#include "domain/ClaimParser.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <iostream>

namespace patentlens::application {

ClaimIndexingService::ClaimIndexingService(std::shared_ptr<domain::PatentRepository> repository,
                                           std::shared_ptr<EmbeddingPipeline> embeddings,
                                           size_t concurrentRequests)
    : m_repository(std::move(repository)),
      m_embeddings(std::move(embeddings)),
      m_concurrentRequests(std::max<size_t>(1, concurrentRequests)) {}

std::vector<domain::Claim> ClaimIndexingService::processClaims(const std::string& documentId) {
    auto document = m_repository->findDocument(documentId);
    if (!document) {
        throw domain::InvalidInputError("Patent not found: " + documentId);
    }
    return processClaims(*document);
}

std::vector<domain::Claim> ClaimIndexingService::processClaims(const domain::Document& document) {
    if (!document.claimsText || document.claimsText->empty()) {
        std::clog << "[ClaimIndexing] " << document.id << " has no claims text" << std::endl;
        m_repository->replaceClaims(document.id, {});
        return {};
    }

    auto claims = domain::ClaimParser::Parse(*document.claimsText);
    if (claims.empty()) {
        std::cerr << "[ClaimIndexing] No claims recognised in " << document.id << std::endl;
        m_repository->replaceClaims(document.id, {});
        return {};
    }

    for (auto& claim : claims) {
        claim.documentId = document.id;
        claim.keyElements = domain::ClaimParser::ExtractKeyElements(claim.text);
    }

    embedAll(claims);

    m_repository->replaceClaims(document.id, claims);
    std::clog << "[ClaimIndexing] Stored " << claims.size() << " claims for " << document.id << std::endl;
    return claims;
}

std::vector<domain::Claim> ClaimIndexingService::ensureClaims(const std::string& documentId) {
    auto stored = m_repository->claimsFor(documentId);
    if (!stored.empty()) {
        return stored;
    }
    return processClaims(documentId);
}

void ClaimIndexingService::embedAll(std::vector<domain::Claim>& claims) {
    size_t embedded = 0;
    std::exception_ptr lastError;

    for (size_t i = 0; i < claims.size(); i += m_concurrentRequests) {
        const size_t end = std::min(i + m_concurrentRequests, claims.size());
        std::vector<std::future<std::vector<float>>> pending;
        for (size_t j = i; j < end; ++j) {
            pending.push_back(std::async(std::launch::async, [this, &claims, j]() {
                return m_embeddings->embedClaim(claims[j].number, claims[j].text);
            }));
        }

        for (size_t j = i; j < end; ++j) {
            try {
                claims[j].embedding = pending[j - i].get();
                ++embedded;
            } catch (const domain::ProviderError& e) {
                std::cerr << "[ClaimIndexing] Claim " << claims[j].number
                          << " stored without embedding: " << e.what() << std::endl;
                lastError = std::current_exception();
            }
        }
    }

    if (embedded == 0 && lastError) {
        std::rethrow_exception(lastError);
    }
}

} // namespace patentlens::application
