/**
 * @file ClaimComparator.cpp
 * @brief Implementation of ClaimComparator.
 */

#include "application/ClaimComparator.hpp"
#include "domain/SimilarityFusion.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <thread>

namespace patentlens::application {

using domain::SimilarityFusion;

ClaimComparator::ClaimComparator(ClaimComparisonSettings settings)
    : m_settings(settings) {}

std::vector<ClaimComparator::ScoredPair> ClaimComparator::scoreRange(const std::vector<domain::Claim>& source,
                                                                     const std::vector<domain::Claim>& target,
                                                                     size_t begin, size_t end,
                                                                     double minSimilarity) const {
    std::vector<ScoredPair> kept;
    for (size_t s = begin; s < end; ++s) {
        const auto& a = source[s];
        if (!a.hasEmbedding()) continue;
        for (size_t t = 0; t < target.size(); ++t) {
            const auto& b = target[t];
            // Embeddings from different models are not comparable.
            if (!b.hasEmbedding() || a.embedding.size() != b.embedding.size()) continue;

            double similarity = SimilarityFusion::Cosine(a.embedding, b.embedding);
            if (similarity >= minSimilarity) {
                kept.push_back({s, t, similarity});
            }
        }
    }
    return kept;
}

domain::ClaimComparisonResult ClaimComparator::compare(const std::vector<domain::Claim>& source,
                                                       const std::vector<domain::Claim>& target,
                                                       double minSimilarity) const {
    domain::ClaimComparisonResult result;
    result.sourceClaimsCount = source.size();
    result.targetClaimsCount = target.size();
    if (!source.empty()) result.sourceDocumentId = source.front().documentId;
    if (!target.empty()) result.targetDocumentId = target.front().documentId;

    if (source.empty() || target.empty()) {
        result.overallRisk = domain::RiskLevel::Unknown;
        result.summary = kUnparsedMessage;
        result.recommendation = kUnparsedRecommendation;
        result.message = kUnparsedMessage;
        return result;
    }

    std::vector<ScoredPair> pairs;
    const size_t pairCount = source.size() * target.size();
    const size_t workers = std::max<size_t>(1, std::thread::hardware_concurrency());

    if (pairCount < m_settings.parallelPairThreshold || workers == 1 || source.size() == 1) {
        pairs = scoreRange(source, target, 0, source.size(), minSimilarity);
    } else {
        // Contiguous source ranges; joining in range order keeps encounter order.
        const size_t slices = std::min(workers, source.size());
        const size_t step = (source.size() + slices - 1) / slices;
        std::vector<std::future<std::vector<ScoredPair>>> pending;
        for (size_t begin = 0; begin < source.size(); begin += step) {
            size_t end = std::min(begin + step, source.size());
            pending.push_back(std::async(std::launch::async, [this, &source, &target, begin, end, minSimilarity]() {
                return scoreRange(source, target, begin, end, minSimilarity);
            }));
        }
        for (auto& f : pending) {
            auto part = f.get();
            pairs.insert(pairs.end(), part.begin(), part.end());
        }
    }

    std::stable_sort(pairs.begin(), pairs.end(), [](const ScoredPair& a, const ScoredPair& b) {
        return a.similarity > b.similarity;
    });

    result.totalMatches = pairs.size();
    if (pairs.empty()) {
        result.overallRisk = SimilarityFusion::RiskOf(0.0, m_settings.thresholds);
        return result;
    }

    double sum = 0.0;
    std::set<int> independentAtRisk;
    for (const auto& pair : pairs) {
        sum += pair.similarity;
        const auto& claim = source[pair.sourceIndex];
        if (claim.isIndependent && pair.similarity >= m_settings.thresholds.medium) {
            independentAtRisk.insert(claim.number);
        }
    }

    result.highestSimilarity = pairs.front().similarity;
    result.averageSimilarity = sum / static_cast<double>(pairs.size());
    result.independentClaimsAtRisk = static_cast<int>(independentAtRisk.size());
    result.overallRisk = SimilarityFusion::RiskOf(result.highestSimilarity, m_settings.thresholds);

    const size_t top = std::min(m_settings.topMatches, pairs.size());
    result.topMatches.reserve(top);
    for (size_t i = 0; i < top; ++i) {
        domain::SimilarityMatch match;
        match.source = source[pairs[i].sourceIndex];
        match.target = target[pairs[i].targetIndex];
        match.similarity = pairs[i].similarity;
        match.risk = SimilarityFusion::RiskOf(pairs[i].similarity, m_settings.thresholds);
        result.topMatches.push_back(std::move(match));
    }
    return result;
}

} // namespace patentlens::application
