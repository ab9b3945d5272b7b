/**
 * @file InfringementAnalysisService.cpp
 * @brief Implementation of InfringementAnalysisService.
 */

#include "application/InfringementAnalysisService.hpp"
#include "domain/Errors.hpp"
#include "domain/SimilarityFusion.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <iostream>

namespace patentlens::application {

using domain::SimilarityFusion;
using infrastructure::JsonMapping;

InfringementAnalysisService::InfringementAnalysisService(std::shared_ptr<domain::PatentRepository> repository,
                                                         std::shared_ptr<domain::TextSimilarityScorer> scorer,
                                                         std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                                                         std::shared_ptr<infrastructure::ResultCache> cache,
                                                         double vectorWeight)
    : m_repository(std::move(repository)),
      m_scorer(std::move(scorer)),
      m_narrative(std::move(narrative)),
      m_cache(std::move(cache)),
      m_vectorWeight(vectorWeight) {}

domain::InfringementNarrative InfringementAnalysisService::FallbackAssessment(double combinedScore) {
    domain::InfringementNarrative narrative;
    narrative.riskLevel = combinedScore > 0.7 ? domain::RiskLevel::Medium : domain::RiskLevel::Low;
    narrative.confidence = combinedScore;
    narrative.explanation = "Narrative analysis unavailable; risk estimated from similarity scores.";
    narrative.recommendation = "Manual review recommended";
    return narrative;
}

domain::InfringementReport InfringementAnalysisService::analyze(const std::string& sourceId, const std::string& targetId) {
    const std::string cacheKey = "analysis:" + sourceId + ":" + targetId;
    if (m_cache) {
        if (auto cached = m_cache->get(cacheKey)) {
            try {
                return JsonMapping::InfringementReportFromJson(*cached);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Infringement] Discarding unreadable cache entry " << cacheKey << ": " << e.what() << std::endl;
                m_cache->erase(cacheKey);
            }
        }
    }

    auto source = m_repository->findDocument(sourceId);
    auto target = m_repository->findDocument(targetId);
    if (!source || !target) {
        throw domain::InvalidInputError("Patent not found: " + (source ? targetId : sourceId));
    }

    domain::InfringementReport report;
    report.vectorSimilarity = (source->hasEmbedding() && target->hasEmbedding())
        ? SimilarityFusion::Cosine(source->embedding, target->embedding)
        : 0.0;
    report.fuzzySimilarity = m_scorer->score(source->searchText(), target->searchText());
    report.combinedScore = SimilarityFusion::Combine(report.vectorSimilarity, report.fuzzySimilarity, m_vectorWeight);

    std::optional<domain::InfringementNarrative> narrative;
    if (m_narrative) {
        narrative = m_narrative->analyzeInfringement(*source, *target, report.combinedScore);
    }
    if (!narrative) {
        std::cerr << "[Infringement] Narrative analysis unavailable for " << sourceId << " vs " << targetId << std::endl;
        narrative = FallbackAssessment(report.combinedScore);
    }
    report.assessment = std::move(*narrative);

    report.source = std::move(*source);
    report.target = std::move(*target);
    report.source.embedding.clear();
    report.target.embedding.clear();

    if (m_cache) {
        m_cache->put(cacheKey, JsonMapping::ToJson(report), m_cache->defaultTtl() * 24);
    }
    return report;
}

} // namespace patentlens::application
