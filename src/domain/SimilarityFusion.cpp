/**
 * @file SimilarityFusion.cpp
 * @brief Cosine similarity and weighted score fusion.
 */

#include "domain/SimilarityFusion.hpp"
#include <algorithm>
#include <cmath>

namespace patentlens::domain {

double SimilarityFusion::Cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        n1 += static_cast<double>(a[i]) * a[i];
        n2 += static_cast<double>(b[i]) * b[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    if (!(norm > 0)) return 0.0;
    return std::clamp(dot / norm, 0.0, 1.0);
}

double SimilarityFusion::Combine(double vectorScore, double fuzzyScore, double vectorWeight) {
    return vectorScore * vectorWeight + fuzzyScore * (1.0 - vectorWeight);
}

RiskLevel SimilarityFusion::RiskOf(double score, const RiskThresholds& thresholds) {
    if (score >= thresholds.high) return RiskLevel::High;
    if (score >= thresholds.medium) return RiskLevel::Medium;
    return RiskLevel::Low;
}

double SimilarityFusion::SimilarityFromDistance(double distance) {
    return std::clamp(1.0 - distance, 0.0, 1.0);
}

} // namespace patentlens::domain
