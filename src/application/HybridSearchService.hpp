/**
 * @file HybridSearchService.hpp
 * @brief Document search fusing embedding similarity with lexical fuzzy scores.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/AnalysisSettings.hpp"
#include "application/EmbeddingPipeline.hpp"
#include "domain/PatentRepository.hpp"
#include "domain/QueryHistory.hpp"
#include "domain/SearchResult.hpp"
#include "domain/TextSimilarityScorer.hpp"

namespace patentlens::application {

/**
 * @class HybridSearchService
 * @brief Runs vector and fuzzy retrieval concurrently and merges them by document.
 */
class HybridSearchService {
public:
    HybridSearchService(std::shared_ptr<domain::PatentRepository> repository,
                        std::shared_ptr<EmbeddingPipeline> embeddings,
                        std::shared_ptr<domain::TextSimilarityScorer> scorer,
                        std::shared_ptr<domain::QueryHistorySink> history,
                        SearchSettings settings);

    /**
     * @brief Ranked documents for a free-text query.
     *
     * Candidates are ordered by combined score, cut to @p limit and only then
     * filtered by the similarity floor, so fewer than @p limit results may be
     * returned while qualifying documents exist past the cut.
     *
     * @throws domain::InvalidInputError for a blank query, a limit outside
     *         1..maxLimit or a weight outside [0, 1].
     * @throws domain::ProviderError when the query cannot be embedded.
     */
    std::vector<domain::SearchResult> search(const std::string& query, size_t limit, double vectorWeight);

    /** @brief search() with the configured default limit and weight. */
    std::vector<domain::SearchResult> search(const std::string& query) {
        return search(query, m_settings.maxResults, m_settings.defaultVectorWeight);
    }

    const SearchSettings& settings() const { return m_settings; }

private:
    struct Candidate {
        domain::Document document;
        double score;
    };

    std::vector<Candidate> vectorCandidates(const std::vector<float>& query, size_t count) const;
    std::vector<Candidate> fuzzyCandidates(const std::string& query, size_t count) const;
    void record(const std::string& query, const std::vector<domain::SearchResult>& results, double latencyMs);

    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<EmbeddingPipeline> m_embeddings;
    std::shared_ptr<domain::TextSimilarityScorer> m_scorer;
    std::shared_ptr<domain::QueryHistorySink> m_history;
    SearchSettings m_settings;
};

} // namespace patentlens::application
