/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the Ollama-backed providers.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <iostream>

using json = nlohmann::json;

namespace patentlens::infrastructure {

namespace {

std::string Between(const std::string& content, const std::string& open) {
    size_t start = content.find(open);
    if (start == std::string::npos) return {};
    start += open.size();
    size_t end = content.find("```", start);
    return content.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

OllamaEmbeddingAdapter::OllamaEmbeddingAdapter(std::shared_ptr<OllamaClient> client, size_t dimensions)
    : m_client(std::move(client)), m_dimensions(dimensions) {}

std::vector<float> OllamaEmbeddingAdapter::embed(const std::string& text) {
    auto vec = m_client->getEmbedding(text);
    if (vec.size() != m_dimensions) {
        std::cerr << "[OllamaEmbedding] Expected " << m_dimensions << " components, got " << vec.size() << std::endl;
        throw domain::ProviderError(domain::ProviderErrorKind::MalformedResponse,
                                    "embedding dimension " + std::to_string(vec.size()) +
                                    " does not match " + std::to_string(m_dimensions));
    }
    return vec;
}

OllamaNarrativeAdapter::OllamaNarrativeAdapter(std::shared_ptr<OllamaClient> client)
    : m_client(std::move(client)) {}

std::optional<std::string> OllamaNarrativeAdapter::ask(const std::string& prompt, const char* purpose) {
    try {
        return m_client->generate(prompt, false);
    } catch (const domain::ProviderError& e) {
        std::cerr << "[OllamaNarrative] " << purpose << " failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<json> OllamaNarrativeAdapter::ExtractJsonObject(const std::string& content) {
    std::string payload;
    if (content.find("```json") != std::string::npos) {
        payload = Between(content, "```json");
    } else if (content.find("```") != std::string::npos) {
        payload = Between(content, "```");
    } else {
        payload = content;
    }
    payload = domain::TextUtils::Trim(payload);

    auto parsed = json::parse(payload, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        // Models sometimes wrap the object in prose; retry on the outermost braces.
        size_t first = payload.find('{');
        size_t last = payload.rfind('}');
        if (first == std::string::npos || last == std::string::npos || last <= first) {
            return std::nullopt;
        }
        parsed = json::parse(payload.substr(first, last - first + 1), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return std::nullopt;
        }
    }
    return parsed;
}

std::optional<domain::InfringementNarrative> OllamaNarrativeAdapter::ParseInfringement(const std::string& content, double similarity) {
    auto j = ExtractJsonObject(content);
    if (!j) return std::nullopt;

    auto narrative = JsonMapping::InfringementNarrativeFromJson(*j);
    if (!j->contains("confidence") || !(*j)["confidence"].is_number()) {
        narrative.confidence = similarity;
    }
    return narrative;
}

std::optional<domain::ClaimMatchNarrative> OllamaNarrativeAdapter::ParseClaimMatches(const std::string& content) {
    auto j = ExtractJsonObject(content);
    if (!j) return std::nullopt;

    domain::ClaimMatchNarrative narrative;
    narrative.summary = j->value("summary", std::string());
    narrative.recommendation = j->value("recommendation", std::string());
    narrative.matchAssessments = JsonMapping::StringList(*j, "match_assessments");
    return narrative;
}

std::optional<domain::PriorArtNarrative> OllamaNarrativeAdapter::ParsePriorArt(const std::string& content) {
    auto j = ExtractJsonObject(content);
    if (!j) return std::nullopt;

    domain::PriorArtNarrative narrative;
    narrative.freedomToOperate = j->value("freedom_to_operate", std::string("uncertain"));
    narrative.keyRisks = JsonMapping::StringList(*j, "key_risks");
    narrative.designAroundSuggestions = JsonMapping::StringList(*j, "design_around_suggestions");
    narrative.recommendation = j->value("recommendation", std::string());
    return narrative;
}

std::optional<domain::InfringementNarrative> OllamaNarrativeAdapter::analyzeInfringement(const domain::Document& source,
                                                                                         const domain::Document& target,
                                                                                         double similarity) {
    auto content = ask(PromptCatalog::GetInfringementPrompt(source, target, similarity), "Infringement analysis");
    if (!content) return std::nullopt;

    try {
        auto narrative = ParseInfringement(*content, similarity);
        if (!narrative) std::cerr << "[OllamaNarrative] Infringement answer is not JSON" << std::endl;
        return narrative;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaNarrative] Infringement answer unreadable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::ClaimMatchNarrative> OllamaNarrativeAdapter::analyzeClaimMatches(const std::vector<domain::SimilarityMatch>& matches) {
    auto content = ask(PromptCatalog::GetClaimMatchPrompt(matches), "Claim match analysis");
    if (!content) return std::nullopt;

    try {
        auto narrative = ParseClaimMatches(*content);
        if (!narrative) std::cerr << "[OllamaNarrative] Claim match answer is not JSON" << std::endl;
        return narrative;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaNarrative] Claim match answer unreadable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::PriorArtNarrative> OllamaNarrativeAdapter::analyzePriorArt(const std::string& invention,
                                                                                 const std::vector<domain::BlockingDocument>& documents) {
    auto content = ask(PromptCatalog::GetPriorArtPrompt(invention, documents), "Prior-art analysis");
    if (!content) return std::nullopt;

    try {
        auto narrative = ParsePriorArt(*content);
        if (!narrative) std::cerr << "[OllamaNarrative] Prior-art answer is not JSON" << std::endl;
        return narrative;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaNarrative] Prior-art answer unreadable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace patentlens::infrastructure
