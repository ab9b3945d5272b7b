#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using namespace patentlens::infrastructure;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    auto defaults = ConfigLoader::Defaults();
    assert(defaults.ollama.host == "localhost");
    assert(defaults.ollama.port == 11434);
    assert(defaults.analysis.embedding.dimensions == 768);
    assert(defaults.analysis.search.similarityFloor == 0.7);
    assert(defaults.analysis.claims.thresholds.high == 0.8);
    assert(defaults.analysis.priorArt.thresholds.medium == 0.55);
    assert(defaults.cache.ttlSeconds == 3600);
    assert(!defaults.paths.corpus.empty());
    std::cout << "[PASS] Defaults." << std::endl;

    json overrides = {
        {"ollama", {{"host", "gpu-box"}, {"llm_model", "llama3"}}},
        {"embedding", {{"dimensions", 384}}},
        {"search", {{"fuzzy_threshold", 0.9}, {"max_results", 5}}},
        {"claims", {{"top_matches", 3}}},
        {"prior_art", {{"noise_floor", 0.5}}},
        {"cache", {{"ttl_seconds", 60}}},
        {"paths", {{"corpus", "/tmp/corpus.json"}}},
        {"unknown_section", {{"x", 1}}}
    };
    auto applied = ConfigLoader::Apply(defaults, overrides);
    assert(applied.ollama.host == "gpu-box");
    assert(applied.ollama.port == 11434);
    assert(applied.ollama.llmModel == "llama3");
    assert(applied.analysis.embedding.dimensions == 384);
    assert(applied.analysis.search.fuzzyThreshold == 0.9);
    assert(applied.analysis.search.maxResults == 5);
    assert(applied.analysis.claims.topMatches == 3);
    assert(applied.analysis.priorArt.noiseFloor == 0.5);
    assert(applied.cache.ttlSeconds == 60);
    assert(applied.paths.corpus == "/tmp/corpus.json");
    assert(applied.paths.cache == defaults.paths.cache);
    std::cout << "[PASS] Partial overrides." << std::endl;

    const std::string dir = "test_config_loader";
    std::filesystem::create_directories(dir);
    std::ofstream(dir + "/settings.json") << overrides.dump();
    std::ofstream(dir + "/broken.json") << "{ \"ollama\": ";

    assert(ConfigLoader::Load(dir + "/settings.json").ollama.host == "gpu-box");
    assert(ConfigLoader::Load(dir + "/broken.json").ollama.host == "localhost");
    assert(ConfigLoader::Load(dir + "/missing.json").analysis.embedding.dimensions == 768);

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
