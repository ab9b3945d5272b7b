/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access provider, path and tuning settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "application/AnalysisSettings.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace patentlens::infrastructure {

struct PathSettings {
    std::string corpus;
    std::string cache;
    std::string history;
};

struct CacheSettings {
    std::int64_t ttlSeconds = 3600;
    int longLivedFactor = 24; ///< Embeddings and analyses live this many TTLs.
};

/**
 * @struct Settings
 * @brief Complete configuration; immutable once loaded.
 */
struct Settings {
    OllamaSettings ollama;
    application::AnalysisSettings analysis;
    PathSettings paths;
    CacheSettings cache;
};

class ConfigLoader {
public:
    /** @brief Defaults, with paths under the XDG data and cache homes. */
    static Settings Defaults();

    /**
     * @brief Reads settings.json over the defaults.
     * A missing file yields the defaults; a malformed one is reported on
     * stderr and also yields the defaults.
     */
    static Settings Load(const std::string& path);

    /** @brief Applies every recognised key of @p j over @p base. Unknown keys are ignored. */
    static Settings Apply(Settings base, const nlohmann::json& j);
};

} // namespace patentlens::infrastructure
