/**
 * @file PatentLensApp.hpp
 * @brief Command-line front end for PatentLens.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace patentlens::app {

/**
 * @class PatentLensApp
 * @brief Orchestrates the application lifecycle: configuration, wiring, one
 *        command, persistence of whatever the command changed.
 */
class PatentLensApp {
public:
    /** @brief Process exit codes. */
    enum ExitCode {
        kSuccess = 0,
        kInvalidInput = 1,
        kRetryableFailure = 2,
        kFailure = 3
    };

    /**
     * @brief Parses the arguments, runs one command and prints its JSON result.
     * @return One of ExitCode.
     */
    int Run(int argc, char** argv);

    /** @brief Usage text printed for unknown or incomplete commands. */
    static std::string Usage();

private:
    /**
     * @brief Loads settings, the stored corpus and the cache, and wires the services.
     */
    void Init(const std::string& configPath);

    /**
     * @brief Persists the corpus (when changed) and the cache, then drains pending writes.
     */
    void Shutdown();

    nlohmann::json Dispatch(const std::vector<std::string>& args, bool includeAnalysis);

    nlohmann::json CmdImport(const std::string& path);
    nlohmann::json CmdParse(const std::string& path);
    nlohmann::json CmdElements(const std::string& text);
    nlohmann::json CmdSearch(const std::vector<std::string>& args);
    nlohmann::json CmdCompare(const std::string& sourceId, const std::string& targetId, bool includeAnalysis);
    nlohmann::json CmdAnalyze(const std::string& sourceId, const std::string& targetId);
    nlohmann::json CmdPriorArt(const std::vector<std::string>& args, bool includeAnalysis);
    nlohmann::json CmdQuickCheck(const std::string& text);
    nlohmann::json CmdSimilarClaims(const std::vector<std::string>& args);
    nlohmann::json CmdInventionVs(const std::string& documentId, const std::string& text);

    infrastructure::Settings m_settings;
    application::AppServices m_services;
    bool m_corpusChanged = false;
};

} // namespace patentlens::app
