/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace patentlens::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDir = "PatentLens";
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCorpusPath() {
    return GetDataHome() / kAppDir / "corpus.json";
}

fs::path PathUtils::GetCachePath() {
    return GetCacheHome() / kAppDir / "results.json";
}

fs::path PathUtils::GetHistoryPath() {
    return GetDataHome() / kAppDir / "query_history.jsonl";
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / kAppDir / "settings.json";
}

} // namespace patentlens::infrastructure
