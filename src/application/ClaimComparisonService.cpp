/**
 * @file ClaimComparisonService.cpp
 * @brief Implementation of ClaimComparisonService.
 */

#include "application/ClaimComparisonService.hpp"
#include "application/ClaimHits.hpp"
#include "domain/Errors.hpp"
#include "domain/SimilarityFusion.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace patentlens::application {

using domain::SimilarityFusion;

ClaimComparisonService::ClaimComparisonService(std::shared_ptr<domain::PatentRepository> repository,
                                               std::shared_ptr<ClaimIndexingService> indexing,
                                               std::shared_ptr<EmbeddingPipeline> embeddings,
                                               std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                                               ClaimComparisonSettings settings,
                                               domain::RiskThresholds inventionThresholds)
    : m_repository(std::move(repository)),
      m_indexing(std::move(indexing)),
      m_embeddings(std::move(embeddings)),
      m_narrative(std::move(narrative)),
      m_comparator(settings),
      m_inventionThresholds(inventionThresholds) {}

domain::ClaimComparisonResult ClaimComparisonService::compareDocuments(const std::string& sourceId,
                                                                       const std::string& targetId,
                                                                       bool includeAnalysis) {
    auto sourceClaims = m_indexing->ensureClaims(sourceId);
    auto targetClaims = m_indexing->ensureClaims(targetId);

    auto result = m_comparator.compare(sourceClaims, targetClaims);
    result.sourceDocumentId = sourceId;
    result.targetDocumentId = targetId;

    if (result.message) {
        std::cerr << "[ClaimComparison] " << *result.message << " (" << sourceId << ", " << targetId << ")" << std::endl;
        return result;
    }

    std::clog << "[ClaimComparison] " << sourceId << " vs " << targetId << ": "
              << result.totalMatches << " matches, highest " << result.highestSimilarity << std::endl;

    if (includeAnalysis && !result.topMatches.empty()) {
        applyNarrative(result);
    }
    return result;
}

void ClaimComparisonService::applyNarrative(domain::ClaimComparisonResult& result) {
    const size_t analysed = std::min(m_comparator.settings().analysedMatches, result.topMatches.size());
    std::vector<domain::SimilarityMatch> strongest(result.topMatches.begin(), result.topMatches.begin() + analysed);

    std::optional<domain::ClaimMatchNarrative> narrative;
    if (m_narrative) {
        narrative = m_narrative->analyzeClaimMatches(strongest);
    }

    if (!narrative) {
        std::cerr << "[ClaimComparison] Narrative analysis unavailable, using default" << std::endl;
        result.summary = "LLM analysis unavailable.";
        result.recommendation = "Manual review recommended.";
        return;
    }

    result.summary = narrative->summary;
    result.recommendation = narrative->recommendation;
    for (size_t i = 0; i < narrative->matchAssessments.size() && i < result.topMatches.size(); ++i) {
        result.topMatches[i].overlapAssessment = narrative->matchAssessments[i];
    }
}

std::vector<domain::ClaimHit> ClaimComparisonService::findSimilarClaims(const std::string& claimText,
                                                                        size_t limit,
                                                                        const std::optional<std::string>& excludeDocumentId) {
    if (domain::TextUtils::Trim(claimText).size() < kMinClaimQueryLength) {
        throw domain::InvalidInputError("claim text must be at least 10 characters");
    }
    if (limit < 1 || limit > kMaxSimilarClaims) {
        throw domain::InvalidInputError("limit must be between 1 and 50");
    }

    auto query = m_embeddings->embedText(claimText);
    auto neighbours = m_repository->nearestClaims(query, limit, excludeDocumentId);

    return ResolveClaimHits(*m_repository, neighbours);
}

domain::InventionClaimComparison ClaimComparisonService::compareInventionToClaims(const std::string& inventionText,
                                                                                  const std::string& documentId) {
    if (domain::TextUtils::Trim(inventionText).size() < kMinInventionLength) {
        throw domain::InvalidInputError("invention description must be at least 20 characters");
    }
    auto document = m_repository->findDocument(documentId);
    if (!document) {
        throw domain::InvalidInputError("Patent not found: " + documentId);
    }

    auto claims = m_indexing->ensureClaims(documentId);
    if (claims.empty()) {
        throw domain::InvalidInputError("No claims found for patent " + documentId);
    }

    auto query = m_embeddings->embedText(inventionText);

    domain::InventionClaimComparison comparison;
    comparison.document = *document;
    comparison.totalClaims = claims.size();
    for (const auto& claim : claims) {
        domain::InventionClaimComparison::Entry entry;
        entry.claim = claim;
        entry.similarity = claim.hasEmbedding() ? SimilarityFusion::Cosine(query, claim.embedding) : 0.0;
        entry.risk = SimilarityFusion::RiskOf(entry.similarity, m_inventionThresholds);
        if (entry.risk == domain::RiskLevel::High) ++comparison.highRiskClaims;
        comparison.comparisons.push_back(std::move(entry));
    }

    std::stable_sort(comparison.comparisons.begin(), comparison.comparisons.end(),
                     [](const auto& a, const auto& b) { return a.similarity > b.similarity; });
    return comparison;
}

} // namespace patentlens::application
