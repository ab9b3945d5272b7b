/**
 * @file AnalysisSettings.hpp
 * @brief Immutable tuning knobs handed to the analysis services at construction.
 */

#pragma once
#include <cstddef>
#include "domain/Risk.hpp"

namespace patentlens::application {

struct EmbeddingSettings {
    size_t dimensions = 768;
    size_t maxChunkChars = 2000;
    size_t chunkOverlap = 200;
    size_t documentClaimsChars = 3000; ///< Claims text kept in a document embedding.
    size_t concurrentRequests = 5;
};

struct SearchSettings {
    double similarityFloor = 0.7; ///< Applied after truncation to the limit.
    size_t maxResults = 20;
    double fuzzyThreshold = 0.8;
    size_t fuzzyCorpusLimit = 1000;
    double defaultVectorWeight = 0.7;
    size_t maxLimit = 100;
};

struct ClaimComparisonSettings {
    double minSimilarity = 0.5;
    domain::RiskThresholds thresholds = domain::kClaimComparisonThresholds;
    size_t topMatches = 10;
    size_t analysedMatches = 5;
    size_t parallelPairThreshold = 4096; ///< Pair count above which scoring is split across threads.
};

struct PriorArtSettings {
    domain::RiskThresholds thresholds = domain::kPriorArtThresholds;
    double noiseFloor = 0.4;
    size_t claimsPerDocument = 5;
    size_t analysedDocuments = 5;
    size_t minInventionLength = 50;
    size_t maxLimit = 50;
    size_t quickCheckResults = 5;
};

/**
 * @struct AnalysisSettings
 * @brief Everything the scoring, comparison and ranking services read.
 */
struct AnalysisSettings {
    EmbeddingSettings embedding;
    SearchSettings search;
    ClaimComparisonSettings claims;
    PriorArtSettings priorArt;
};

} // namespace patentlens::application
