/**
 * @file EmbeddingPipeline.hpp
 * @brief Text preparation, chunking and averaging around the embedding provider.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/AnalysisSettings.hpp"
#include "domain/EmbeddingService.hpp"
#include "domain/Patent.hpp"

namespace patentlens::application {

/**
 * @class EmbeddingPipeline
 * @brief Builds provider inputs for queries, claims and documents.
 *
 * Long texts are split into overlapping chunks whose embeddings are averaged
 * and L2-normalised. Provider failures propagate as domain::ProviderError.
 */
class EmbeddingPipeline {
public:
    EmbeddingPipeline(std::shared_ptr<domain::EmbeddingService> service, EmbeddingSettings settings);

    /** @brief Embeds trimmed text; blank text yields a zero vector without a provider call. */
    std::vector<float> embedText(const std::string& text) const;

    /** @brief Embeds every chunk of @p text and returns their normalised mean. */
    std::vector<float> embedChunked(const std::string& text) const;

    /** @brief Embeds "Patent Claim N: <text>". */
    std::vector<float> embedClaim(int claimNumber, const std::string& claimText) const;

    /** @brief Embeds the labelled title, abstract and (truncated) claims. */
    std::vector<float> embedDocument(const domain::Document& document) const;

    size_t dimensions() const { return m_settings.dimensions; }

    /**
     * @brief Splits text into windows of at most @p maxChars characters.
     * Each window is cut back to the last sentence separator found past its
     * midpoint; consecutive windows overlap by @p overlap characters.
     */
    static std::vector<std::string> ChunkText(const std::string& text, size_t maxChars, size_t overlap);

private:
    std::shared_ptr<domain::EmbeddingService> m_service;
    EmbeddingSettings m_settings;
};

} // namespace patentlens::application
