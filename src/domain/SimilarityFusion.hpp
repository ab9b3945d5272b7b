/**
 * @file SimilarityFusion.hpp
 * @brief Pure scoring math shared by every ranking component.
 */

#pragma once
#include "domain/Risk.hpp"
#include <vector>

namespace patentlens::domain {

class SimilarityFusion {
public:
    /**
     * @brief Cosine similarity clamped to [0, 1].
     * @return 0.0 when either vector has zero norm or the lengths differ.
     */
    static double Cosine(const std::vector<float>& a, const std::vector<float>& b);

    /** @brief vectorScore * vectorWeight + fuzzyScore * (1 - vectorWeight). */
    static double Combine(double vectorScore, double fuzzyScore, double vectorWeight);

    /** @brief Buckets a score; thresholds are inclusive lower bounds. */
    static RiskLevel RiskOf(double score, const RiskThresholds& thresholds);

    /** @brief Similarity from a cosine distance (1 - cosine), clamped to [0, 1]. */
    static double SimilarityFromDistance(double distance);
};

} // namespace patentlens::domain
