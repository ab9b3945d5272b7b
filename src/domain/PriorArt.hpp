/**
 * @file PriorArt.hpp
 * @brief Prior-art search results grouped by blocking document.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/SimilarityMatch.hpp"

namespace patentlens::domain {

struct BlockingClaim {
    ClaimHit hit;
    RiskLevel risk = RiskLevel::Low;
};

/**
 * @struct BlockingDocument
 * @brief A document whose claims sit near the invention in embedding space.
 */
struct BlockingDocument {
    std::string documentId;
    std::string patentNumber;
    std::string title;
    std::string abstract;
    std::string applicant;
    std::string publicationDate;
    std::vector<BlockingClaim> blockingClaims; ///< Descending, at most claimsPerDocument.
    double highestSimilarity = 0.0;
    RiskLevel overallRisk = RiskLevel::Low;
};

/**
 * @struct PriorArtNarrative
 * @brief Freedom-to-operate assessment from the narrative provider.
 */
struct PriorArtNarrative {
    std::string freedomToOperate; ///< likely | uncertain | unlikely
    std::vector<std::string> keyRisks;
    std::vector<std::string> designAroundSuggestions;
    std::string recommendation;
};

struct PriorArtReport {
    std::string querySummary;
    size_t totalDocumentsSearched = 0;
    std::vector<BlockingDocument> documents;
    std::optional<PriorArtNarrative> analysis;
};

} // namespace patentlens::domain
