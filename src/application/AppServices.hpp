/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ClaimComparisonService.hpp"
#include "application/ClaimIndexingService.hpp"
#include "application/EmbeddingPipeline.hpp"
#include "application/HybridSearchService.hpp"
#include "application/InfringementAnalysisService.hpp"
#include "application/PatentIngestionService.hpp"
#include "application/PriorArtService.hpp"
#include "infrastructure/InMemoryPatentRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ResultCache.hpp"

namespace patentlens::application {

struct AppServices {
    std::shared_ptr<infrastructure::InMemoryPatentRepository> repository;
    std::shared_ptr<EmbeddingPipeline> embeddings;
    std::shared_ptr<ClaimIndexingService> claimIndexing;
    std::unique_ptr<PatentIngestionService> ingestionService;
    std::unique_ptr<ClaimComparisonService> claimComparisonService;
    std::unique_ptr<HybridSearchService> searchService;
    std::unique_ptr<PriorArtService> priorArtService;
    std::unique_ptr<InfringementAnalysisService> infringementService;
    std::shared_ptr<infrastructure::ResultCache> cache;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
};

} // namespace patentlens::application
