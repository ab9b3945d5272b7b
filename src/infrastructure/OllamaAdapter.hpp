/**
 * @file OllamaAdapter.hpp
 * @brief Domain provider implementations backed by a local Ollama server.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/EmbeddingService.hpp"
#include "domain/NarrativeAnalysisService.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace patentlens::infrastructure {

/**
 * @class OllamaEmbeddingAdapter
 * @brief Implements EmbeddingService with the configured embedding model.
 */
class OllamaEmbeddingAdapter : public domain::EmbeddingService {
public:
    OllamaEmbeddingAdapter(std::shared_ptr<OllamaClient> client, size_t dimensions);

    /** @see domain::EmbeddingService::embed */
    std::vector<float> embed(const std::string& text) override;

    size_t dimensions() const override { return m_dimensions; }

private:
    std::shared_ptr<OllamaClient> m_client;
    size_t m_dimensions;
};

/**
 * @class OllamaNarrativeAdapter
 * @brief Implements NarrativeAnalysisService with the configured LLM.
 *
 * Model output is free text that usually, but not always, holds a JSON
 * object, sometimes inside a fenced code block. All of that recovery lives
 * here; callers only see a typed result or std::nullopt.
 */
class OllamaNarrativeAdapter : public domain::NarrativeAnalysisService {
public:
    explicit OllamaNarrativeAdapter(std::shared_ptr<OllamaClient> client);

    std::optional<domain::InfringementNarrative> analyzeInfringement(const domain::Document& source,
                                                                     const domain::Document& target,
                                                                     double similarity) override;

    std::optional<domain::ClaimMatchNarrative> analyzeClaimMatches(const std::vector<domain::SimilarityMatch>& matches) override;

    std::optional<domain::PriorArtNarrative> analyzePriorArt(const std::string& invention,
                                                             const std::vector<domain::BlockingDocument>& documents) override;

    /**
     * @brief Recovers the JSON object from model output.
     * Prefers a ```json fence, then any ``` fence, then the raw text.
     */
    static std::optional<nlohmann::json> ExtractJsonObject(const std::string& content);

    static std::optional<domain::InfringementNarrative> ParseInfringement(const std::string& content, double similarity);
    static std::optional<domain::ClaimMatchNarrative> ParseClaimMatches(const std::string& content);
    static std::optional<domain::PriorArtNarrative> ParsePriorArt(const std::string& content);

private:
    std::optional<std::string> ask(const std::string& prompt, const char* purpose);

    std::shared_ptr<OllamaClient> m_client;
};

} // namespace patentlens::infrastructure
