/**
 * @file ClaimComparator.hpp
 * @brief All-pairs claim similarity with aggregate risk statistics.
 */

#pragma once
#include <vector>
#include "application/AnalysisSettings.hpp"
#include "domain/SimilarityMatch.hpp"

namespace patentlens::application {

/**
 * @class ClaimComparator
 * @brief Pure comparison of two claim sets. Holds only its settings.
 */
class ClaimComparator {
public:
    explicit ClaimComparator(ClaimComparisonSettings settings);

    /**
     * @brief Scores every (source, target) pair that has both embeddings.
     *
     * Pairs below @p minSimilarity are dropped. Kept pairs are ordered by
     * similarity, descending; equal similarities keep source then target
     * order. When either side is empty the result carries a message and
     * RiskLevel::Unknown.
     */
    domain::ClaimComparisonResult compare(const std::vector<domain::Claim>& source,
                                          const std::vector<domain::Claim>& target,
                                          double minSimilarity) const;

    /** @brief compare() with the configured minimum similarity. */
    domain::ClaimComparisonResult compare(const std::vector<domain::Claim>& source,
                                          const std::vector<domain::Claim>& target) const {
        return compare(source, target, m_settings.minSimilarity);
    }

    const ClaimComparisonSettings& settings() const { return m_settings; }

    static constexpr const char* kUnparsedMessage = "Could not parse claims from one or both patents.";
    static constexpr const char* kUnparsedRecommendation = "Manual review required - claims could not be automatically parsed.";

private:
    struct ScoredPair {
        size_t sourceIndex;
        size_t targetIndex;
        double similarity;
    };

    std::vector<ScoredPair> scoreRange(const std::vector<domain::Claim>& source,
                                       const std::vector<domain::Claim>& target,
                                       size_t begin, size_t end,
                                       double minSimilarity) const;

    ClaimComparisonSettings m_settings;
};

} // namespace patentlens::application
