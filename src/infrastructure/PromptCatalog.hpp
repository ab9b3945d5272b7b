/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the patent-analysis prompts.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Patent.hpp"
#include "domain/PriorArt.hpp"
#include "domain/SimilarityMatch.hpp"

namespace patentlens::infrastructure {

class PromptCatalog {
public:
    /** @brief Prompt asking for a JSON infringement assessment of two documents. */
    static std::string GetInfringementPrompt(const domain::Document& source,
                                             const domain::Document& target,
                                             double similarity);

    /** @brief Prompt asking for a JSON assessment of the strongest claim pairs. */
    static std::string GetClaimMatchPrompt(const std::vector<domain::SimilarityMatch>& matches);

    /** @brief Prompt asking for a JSON freedom-to-operate assessment. */
    static std::string GetPriorArtPrompt(const std::string& invention,
                                         const std::vector<domain::BlockingDocument>& documents);

    /** @brief "87.5%" style rendering of a [0, 1] score. */
    static std::string Percent(double score);
};

} // namespace patentlens::infrastructure
