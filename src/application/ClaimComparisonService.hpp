/**
 * @file ClaimComparisonService.hpp
 * @brief Document-level claim comparison and claim nearest-neighbour queries.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/ClaimComparator.hpp"
#include "application/ClaimIndexingService.hpp"
#include "application/EmbeddingPipeline.hpp"
#include "domain/NarrativeAnalysisService.hpp"
#include "domain/PatentRepository.hpp"

namespace patentlens::application {

/**
 * @class ClaimComparisonService
 * @brief Orchestrates claim indexing, comparison and narrative enrichment.
 */
class ClaimComparisonService {
public:
    ClaimComparisonService(std::shared_ptr<domain::PatentRepository> repository,
                           std::shared_ptr<ClaimIndexingService> indexing,
                           std::shared_ptr<EmbeddingPipeline> embeddings,
                           std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                           ClaimComparisonSettings settings,
                           domain::RiskThresholds inventionThresholds = domain::kPriorArtThresholds);

    /**
     * @brief Compares the claims of two stored documents, indexing either on demand.
     * @param includeAnalysis Ask the narrative provider about the strongest matches.
     */
    domain::ClaimComparisonResult compareDocuments(const std::string& sourceId,
                                                   const std::string& targetId,
                                                   bool includeAnalysis = true);

    /**
     * @brief Stored claims nearest to a free-text claim.
     * @throws domain::InvalidInputError when the text is shorter than 10
     *         characters or @p limit is outside 1..50.
     */
    std::vector<domain::ClaimHit> findSimilarClaims(const std::string& claimText,
                                                    size_t limit = 10,
                                                    const std::optional<std::string>& excludeDocumentId = std::nullopt);

    /**
     * @brief Scores an invention description against every claim of one document.
     * @throws domain::InvalidInputError for short text, an unknown document or
     *         a document without claims.
     */
    domain::InventionClaimComparison compareInventionToClaims(const std::string& inventionText,
                                                              const std::string& documentId);

    const ClaimComparator& comparator() const { return m_comparator; }

    static constexpr size_t kMinClaimQueryLength = 10;
    static constexpr size_t kMaxSimilarClaims = 50;
    static constexpr size_t kMinInventionLength = 20;

private:
    void applyNarrative(domain::ClaimComparisonResult& result);

    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<ClaimIndexingService> m_indexing;
    std::shared_ptr<EmbeddingPipeline> m_embeddings;
    std::shared_ptr<domain::NarrativeAnalysisService> m_narrative;
    ClaimComparator m_comparator;
    domain::RiskThresholds m_inventionThresholds;
};

} // namespace patentlens::application
