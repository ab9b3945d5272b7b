/**
 * @file HybridSearchService.cpp
 * @brief Implementation of HybridSearchService.
 */

#include "application/HybridSearchService.hpp"
#include "domain/Errors.hpp"
#include "domain/SimilarityFusion.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace patentlens::application {

using domain::SimilarityFusion;

namespace {

std::string NowIso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

HybridSearchService::HybridSearchService(std::shared_ptr<domain::PatentRepository> repository,
                                         std::shared_ptr<EmbeddingPipeline> embeddings,
                                         std::shared_ptr<domain::TextSimilarityScorer> scorer,
                                         std::shared_ptr<domain::QueryHistorySink> history,
                                         SearchSettings settings)
    : m_repository(std::move(repository)),
      m_embeddings(std::move(embeddings)),
      m_scorer(std::move(scorer)),
      m_history(std::move(history)),
      m_settings(settings) {}

std::vector<domain::SearchResult> HybridSearchService::search(const std::string& query, size_t limit, double vectorWeight) {
    if (domain::TextUtils::Trim(query).empty()) {
        throw domain::InvalidInputError("query must not be empty");
    }
    if (limit < 1 || limit > m_settings.maxLimit) {
        throw domain::InvalidInputError("limit must be between 1 and " + std::to_string(m_settings.maxLimit));
    }
    if (!(vectorWeight >= 0.0 && vectorWeight <= 1.0)) {
        throw domain::InvalidInputError("vector weight must be within [0, 1]");
    }

    const auto start = std::chrono::steady_clock::now();
    const auto queryEmbedding = m_embeddings->embedText(query);
    const size_t candidateCount = limit * 2;

    auto vectorFuture = std::async(std::launch::async, [this, &queryEmbedding, candidateCount]() {
        return vectorCandidates(queryEmbedding, candidateCount);
    });
    auto fuzzyFuture = std::async(std::launch::async, [this, &query, candidateCount]() {
        return fuzzyCandidates(query, candidateCount);
    });
    auto vectorHits = vectorFuture.get();
    auto fuzzyHits = fuzzyFuture.get();

    // Vector candidates first so equal combined scores keep vector order, then fuzzy order.
    std::vector<domain::SearchResult> merged;
    std::unordered_map<std::string, size_t> indexById;
    for (auto& hit : vectorHits) {
        if (indexById.count(hit.document.id)) continue;
        indexById[hit.document.id] = merged.size();
        domain::SearchResult result;
        result.document = std::move(hit.document);
        result.vectorScore = hit.score;
        result.matchType = domain::MatchType::Vector;
        merged.push_back(std::move(result));
    }
    for (auto& hit : fuzzyHits) {
        auto it = indexById.find(hit.document.id);
        if (it != indexById.end()) {
            merged[it->second].fuzzyScore = hit.score;
            merged[it->second].matchType = domain::MatchType::Hybrid;
            continue;
        }
        indexById[hit.document.id] = merged.size();
        domain::SearchResult result;
        result.document = std::move(hit.document);
        result.fuzzyScore = hit.score;
        result.matchType = domain::MatchType::Fuzzy;
        merged.push_back(std::move(result));
    }

    for (auto& result : merged) {
        result.combinedScore = SimilarityFusion::Combine(result.vectorScore, result.fuzzyScore, vectorWeight);
    }
    std::stable_sort(merged.begin(), merged.end(), [](const auto& a, const auto& b) {
        return a.combinedScore > b.combinedScore;
    });

    if (merged.size() > limit) merged.resize(limit);
    merged.erase(std::remove_if(merged.begin(), merged.end(), [this](const auto& r) {
        return r.combinedScore < m_settings.similarityFloor;
    }), merged.end());

    const double latencyMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    record(query, merged, latencyMs);
    return merged;
}

std::vector<HybridSearchService::Candidate> HybridSearchService::vectorCandidates(const std::vector<float>& query, size_t count) const {
    std::vector<Candidate> candidates;
    for (const auto& hit : m_repository->nearestDocuments(query, count)) {
        auto document = m_repository->findDocument(hit.id);
        if (!document) continue;
        candidates.push_back({std::move(*document), SimilarityFusion::SimilarityFromDistance(hit.distance)});
    }
    return candidates;
}

std::vector<HybridSearchService::Candidate> HybridSearchService::fuzzyCandidates(const std::string& query, size_t count) const {
    auto corpus = m_repository->listDocuments(m_settings.fuzzyCorpusLimit);
    std::vector<Candidate> scored;
    size_t failures = 0;

    for (auto& document : corpus) {
        try {
            double score = m_scorer->score(query, document.searchText());
            if (score >= m_settings.fuzzyThreshold) {
                scored.push_back({std::move(document), score});
            }
        } catch (const std::exception& e) {
            ++failures;
            std::cerr << "[HybridSearch] Fuzzy scoring skipped " << document.id << ": " << e.what() << std::endl;
        }
    }

    if (!corpus.empty() && failures == corpus.size()) {
        throw domain::ProviderError(domain::ProviderErrorKind::Unavailable, "fuzzy scoring failed for every candidate");
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Candidate& a, const Candidate& b) {
        return a.score > b.score;
    });
    if (scored.size() > count) scored.resize(count);
    return scored;
}

void HybridSearchService::record(const std::string& query, const std::vector<domain::SearchResult>& results, double latencyMs) {
    if (!m_history) return;

    domain::QueryRecord entry;
    entry.queryText = query;
    entry.resultsCount = results.size();
    if (!results.empty()) entry.topScore = results.front().combinedScore;
    entry.latencyMs = latencyMs;
    entry.createdAt = NowIso8601();

    try {
        m_history->append(entry);
    } catch (const std::exception& e) {
        std::cerr << "[HybridSearch] Query history record dropped: " << e.what() << std::endl;
    }
}

} // namespace patentlens::application
