/**
 * @file PriorArtService.hpp
 * @brief Claim-level prior-art search grouped by owning document.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/AnalysisSettings.hpp"
#include "application/EmbeddingPipeline.hpp"
#include "domain/NarrativeAnalysisService.hpp"
#include "domain/PatentRepository.hpp"
#include "domain/PriorArt.hpp"

namespace patentlens::application {

/**
 * @class PriorArtService
 * @brief Finds stored documents whose claims may block an invention.
 */
class PriorArtService {
public:
    PriorArtService(std::shared_ptr<domain::PatentRepository> repository,
                    std::shared_ptr<EmbeddingPipeline> embeddings,
                    std::shared_ptr<domain::NarrativeAnalysisService> narrative,
                    PriorArtSettings settings);

    /**
     * @brief Nearest claims to the invention, grouped per document.
     *
     * Retrieves 3 x @p limit claims, keeps the strongest claims of each
     * document, drops documents whose best claim is under the noise floor and
     * returns at most @p limit documents by best similarity. When requested,
     * the leading documents are handed to the narrative provider; a missing
     * narrative is replaced with an "uncertain" assessment.
     *
     * @throws domain::InvalidInputError for text under 50 characters or a
     *         limit outside 1..50.
     */
    domain::PriorArtReport locate(const std::string& inventionText, size_t limit = 20, bool includeAnalysis = true);

    /**
     * @brief The few nearest claims, for a fast first screen.
     * @throws domain::InvalidInputError for text under 20 characters.
     */
    std::vector<domain::ClaimHit> quickCheck(const std::string& inventionText);

    /** @brief Groups ranked claim hits into blocking documents (no I/O). */
    std::vector<domain::BlockingDocument> groupByDocument(const std::vector<domain::ClaimHit>& hits, size_t limit) const;

    static domain::PriorArtNarrative DefaultNarrative();

    static constexpr size_t kQuickCheckMinLength = 20;
    static constexpr size_t kSummaryChars = 200;
    static constexpr size_t kQuickCheckClaimChars = 300;

private:
    std::shared_ptr<domain::PatentRepository> m_repository;
    std::shared_ptr<EmbeddingPipeline> m_embeddings;
    std::shared_ptr<domain::NarrativeAnalysisService> m_narrative;
    PriorArtSettings m_settings;
};

} // namespace patentlens::application
