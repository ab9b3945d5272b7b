/**
 * @file PriorArtService.cpp
 * @brief Implementation of PriorArtService.
 */

#include "application/PriorArtService.hpp"
#include "application/ClaimHits.hpp"
#include "domain/Errors.hpp"
#include "domain/SimilarityFusion.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>

namespace patentlens::application {

using domain::SimilarityFusion;
using domain::TextUtils;

PriorArtService::PriorArtService(std::shared_ptr<domain::PatentRepository> repository,
                                 std::shared_ptr<EmbeddingPipeline> embeddings,
                                 std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                                 PriorArtSettings settings)
    : m_repository(std::move(repository)),
      m_embeddings(std::move(embeddings)),
      m_narrative(std::move(narrative)),
      m_settings(settings) {}

domain::PriorArtNarrative PriorArtService::DefaultNarrative() {
    domain::PriorArtNarrative narrative;
    narrative.freedomToOperate = "uncertain";
    narrative.keyRisks = {"Analysis unavailable - manual review recommended"};
    narrative.recommendation = "LLM analysis failed: the narrative provider gave no usable answer.";
    return narrative;
}

domain::PriorArtReport PriorArtService::locate(const std::string& inventionText, size_t limit, bool includeAnalysis) {
    if (TextUtils::Trim(inventionText).size() < m_settings.minInventionLength) {
        throw domain::InvalidInputError("invention description must be at least " +
                                        std::to_string(m_settings.minInventionLength) + " characters");
    }
    if (limit < 1 || limit > m_settings.maxLimit) {
        throw domain::InvalidInputError("limit must be between 1 and " + std::to_string(m_settings.maxLimit));
    }

    auto query = m_embeddings->embedText(inventionText);
    auto hits = ResolveClaimHits(*m_repository, m_repository->nearestClaims(query, limit * 3));

    domain::PriorArtReport report;
    report.querySummary = TextUtils::Ellipsize(inventionText, kSummaryChars);
    report.totalDocumentsSearched = m_repository->documentCount();
    report.documents = groupByDocument(hits, limit);

    std::clog << "[PriorArt] " << hits.size() << " claims retrieved, "
              << report.documents.size() << " blocking documents" << std::endl;

    if (includeAnalysis && !report.documents.empty()) {
        const size_t analysed = std::min(m_settings.analysedDocuments, report.documents.size());
        std::vector<domain::BlockingDocument> leading(report.documents.begin(), report.documents.begin() + analysed);

        std::optional<domain::PriorArtNarrative> narrative;
        if (m_narrative) {
            narrative = m_narrative->analyzePriorArt(inventionText, leading);
        }
        if (!narrative) {
            std::cerr << "[PriorArt] Narrative analysis unavailable, using default" << std::endl;
            narrative = DefaultNarrative();
        }
        report.analysis = std::move(narrative);
    }
    return report;
}

std::vector<domain::BlockingDocument> PriorArtService::groupByDocument(const std::vector<domain::ClaimHit>& hits, size_t limit) const {
    std::vector<domain::BlockingDocument> groups;
    std::unordered_map<std::string, size_t> indexById;

    for (const auto& hit : hits) {
        auto it = indexById.find(hit.claim.documentId);
        if (it == indexById.end()) {
            it = indexById.emplace(hit.claim.documentId, groups.size()).first;
            domain::BlockingDocument group;
            group.documentId = hit.claim.documentId;
            group.patentNumber = hit.patentNumber;
            group.title = hit.documentTitle;
            if (auto document = m_repository->findDocument(hit.claim.documentId)) {
                group.abstract = document->abstract;
                group.applicant = document->applicant;
                group.publicationDate = document->publicationDate;
            }
            groups.push_back(std::move(group));
        }

        auto& group = groups[it->second];
        group.blockingClaims.push_back({hit, SimilarityFusion::RiskOf(hit.similarity, m_settings.thresholds)});
        group.highestSimilarity = std::max(group.highestSimilarity, hit.similarity);
    }

    std::vector<domain::BlockingDocument> kept;
    for (auto& group : groups) {
        if (group.highestSimilarity < m_settings.noiseFloor) continue;

        std::stable_sort(group.blockingClaims.begin(), group.blockingClaims.end(),
                         [](const auto& a, const auto& b) { return a.hit.similarity > b.hit.similarity; });
        if (group.blockingClaims.size() > m_settings.claimsPerDocument) {
            group.blockingClaims.resize(m_settings.claimsPerDocument);
        }
        group.overallRisk = SimilarityFusion::RiskOf(group.highestSimilarity, m_settings.thresholds);
        kept.push_back(std::move(group));
    }

    std::stable_sort(kept.begin(), kept.end(), [](const auto& a, const auto& b) {
        return a.highestSimilarity > b.highestSimilarity;
    });
    if (kept.size() > limit) kept.resize(limit);
    return kept;
}

std::vector<domain::ClaimHit> PriorArtService::quickCheck(const std::string& inventionText) {
    if (TextUtils::Trim(inventionText).size() < kQuickCheckMinLength) {
        throw domain::InvalidInputError("invention description must be at least 20 characters");
    }

    auto query = m_embeddings->embedText(inventionText);
    auto hits = ResolveClaimHits(*m_repository, m_repository->nearestClaims(query, m_settings.quickCheckResults));
    for (auto& hit : hits) {
        hit.claim.text = TextUtils::Ellipsize(hit.claim.text, kQuickCheckClaimChars);
    }
    return hits;
}

} // namespace patentlens::application
