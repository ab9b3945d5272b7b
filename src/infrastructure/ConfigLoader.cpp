/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace patentlens::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void Read(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

const json& Section(const json& j, const char* name) {
    static const json kEmpty = json::object();
    auto it = j.find(name);
    return (it != j.end() && it->is_object()) ? *it : kEmpty;
}

} // namespace

Settings ConfigLoader::Defaults() {
    Settings settings;
    settings.paths.corpus = PathUtils::GetCorpusPath().string();
    settings.paths.cache = PathUtils::GetCachePath().string();
    settings.paths.history = PathUtils::GetHistoryPath().string();
    return settings;
}

Settings ConfigLoader::Apply(Settings s, const json& j) {
    const auto& ollama = Section(j, "ollama");
    Read(ollama, "host", s.ollama.host);
    Read(ollama, "port", s.ollama.port);
    Read(ollama, "embed_model", s.ollama.embedModel);
    Read(ollama, "llm_model", s.ollama.llmModel);
    Read(ollama, "embed_timeout_seconds", s.ollama.embedTimeoutSeconds);
    Read(ollama, "llm_timeout_seconds", s.ollama.llmTimeoutSeconds);

    auto& analysis = s.analysis;
    const auto& embedding = Section(j, "embedding");
    Read(embedding, "dimensions", analysis.embedding.dimensions);
    Read(embedding, "max_chunk_chars", analysis.embedding.maxChunkChars);
    Read(embedding, "chunk_overlap", analysis.embedding.chunkOverlap);

    const auto& search = Section(j, "search");
    Read(search, "similarity_threshold", analysis.search.similarityFloor);
    Read(search, "max_results", analysis.search.maxResults);
    Read(search, "fuzzy_threshold", analysis.search.fuzzyThreshold);
    Read(search, "fuzzy_corpus_limit", analysis.search.fuzzyCorpusLimit);
    Read(search, "default_vector_weight", analysis.search.defaultVectorWeight);

    const auto& claims = Section(j, "claims");
    Read(claims, "min_similarity", analysis.claims.minSimilarity);
    Read(claims, "medium_threshold", analysis.claims.thresholds.medium);
    Read(claims, "high_threshold", analysis.claims.thresholds.high);
    Read(claims, "top_matches", analysis.claims.topMatches);

    const auto& priorArt = Section(j, "prior_art");
    Read(priorArt, "medium_threshold", analysis.priorArt.thresholds.medium);
    Read(priorArt, "high_threshold", analysis.priorArt.thresholds.high);
    Read(priorArt, "noise_floor", analysis.priorArt.noiseFloor);
    Read(priorArt, "claims_per_document", analysis.priorArt.claimsPerDocument);
    Read(priorArt, "analysis_documents", analysis.priorArt.analysedDocuments);

    Read(Section(j, "cache"), "ttl_seconds", s.cache.ttlSeconds);

    const auto& paths = Section(j, "paths");
    Read(paths, "corpus", s.paths.corpus);
    Read(paths, "cache", s.paths.cache);
    Read(paths, "history", s.paths.history);
    return s;
}

Settings ConfigLoader::Load(const std::string& path) {
    Settings defaults = Defaults();
    if (path.empty() || !std::filesystem::exists(path)) {
        return defaults;
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return Apply(defaults, j);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << " (using defaults)" << std::endl;
    }
    return defaults;
}

} // namespace patentlens::infrastructure
