/**
 * @file PathUtils.hpp
 * @brief Data directory resolution.
 */

#pragma once
#include <string>
#include <filesystem>

namespace patentlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief Default location of the document/claim store. */
    static std::filesystem::path GetCorpusPath();

    /** @brief Default location of the persisted result cache. */
    static std::filesystem::path GetCachePath();

    /** @brief Default location of the query history (JSON lines). */
    static std::filesystem::path GetHistoryPath();

    /** @brief Default location of settings.json. */
    static std::filesystem::path GetSettingsPath();
};

} // namespace patentlens::infrastructure
