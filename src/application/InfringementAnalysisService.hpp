/**
 * @file InfringementAnalysisService.hpp
 * @brief Whole-document infringement screening between two stored patents.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/Infringement.hpp"
#include "domain/NarrativeAnalysisService.hpp"
#include "domain/PatentRepository.hpp"
#include "domain/TextSimilarityScorer.hpp"
#include "infrastructure/ResultCache.hpp"

namespace patentlens::application {

/**
 * @class InfringementAnalysisService
 * @brief Scores two documents and asks the narrative provider for an assessment.
 *
 * Reports are cached per ordered (source, target) pair.
 */
class InfringementAnalysisService {
public:
    InfringementAnalysisService(std::shared_ptr<domain::PatentRepository> repository,
                                std::shared_ptr<domain::TextSimilarityScorer> scorer,
                                std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                                std::shared_ptr<infrastructure::ResultCache> cache,
                                double vectorWeight = 0.7);

    /** @throws domain::InvalidInputError when either document is unknown. */
    domain::InfringementReport analyze(const std::string& sourceId, const std::string& targetId);

    /** @brief Assessment used when the narrative provider gives no answer. */
    static domain::InfringementNarrative FallbackAssessment(double combinedScore);

private:
    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<domain::TextSimilarityScorer> m_scorer;
    std::shared_ptr<domain::NarrativeAnalysisService> m_narrative;
    std::shared_ptr<infrastructure::ResultCache> m_cache;
    double m_vectorWeight;
};

} // namespace patentlens::application
