/**
 * @file SimilarityMatch.hpp
 * @brief Results of claim-level comparisons.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Patent.hpp"
#include "domain/Risk.hpp"

namespace patentlens::domain {

/**
 * @struct SimilarityMatch
 * @brief A scored (source claim, target claim) pair. Reproducible from the
 *        two claims' embeddings alone.
 */
struct SimilarityMatch {
    Claim source;
    Claim target;
    double similarity = 0.0; ///< In [0, 1].
    RiskLevel risk = RiskLevel::Low;
    std::optional<std::string> overlapAssessment; ///< Narrative note, when requested.
};

/**
 * @struct ClaimComparisonResult
 * @brief All-pairs comparison outcome with aggregate statistics.
 */
struct ClaimComparisonResult {
    std::string sourceDocumentId;
    std::string targetDocumentId;
    size_t sourceClaimsCount = 0;
    size_t targetClaimsCount = 0;
    size_t totalMatches = 0; ///< Pairs kept above the minimum similarity.

    std::vector<SimilarityMatch> topMatches;

    double highestSimilarity = 0.0;
    double averageSimilarity = 0.0; ///< Over all kept pairs, not only the top ones.
    int independentClaimsAtRisk = 0;
    RiskLevel overallRisk = RiskLevel::Unknown;

    std::string summary;
    std::string recommendation;
    std::optional<std::string> message; ///< Set when a side had no parsable claims.
};

/**
 * @struct ClaimHit
 * @brief A stored claim returned by a nearest-neighbour query, with the
 *        owning document's display fields.
 */
struct ClaimHit {
    Claim claim;
    std::string documentTitle;
    std::string patentNumber;
    double similarity = 0.0;
};

/**
 * @struct InventionClaimComparison
 * @brief Similarity of an invention description to each claim of one document.
 */
struct InventionClaimComparison {
    struct Entry {
        Claim claim;
        double similarity = 0.0;
        RiskLevel risk = RiskLevel::Low;
    };

    Document document;
    size_t totalClaims = 0;
    int highRiskClaims = 0;
    std::vector<Entry> comparisons; ///< Sorted by similarity, descending.
};

} // namespace patentlens::domain
