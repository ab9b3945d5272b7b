/**
 * @file JsonMapping.hpp
 * @brief Manual JSON mapping of domain types (corpus files, cache entries, CLI output).
 */

#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Infringement.hpp"
#include "domain/Patent.hpp"
#include "domain/PriorArt.hpp"
#include "domain/QueryHistory.hpp"
#include "domain/SearchResult.hpp"
#include "domain/SimilarityMatch.hpp"

namespace patentlens::infrastructure {

/**
 * @class JsonMapping
 * @brief Snake_case JSON views of the domain model.
 *
 * The *FromJson readers accept missing optional fields and throw
 * nlohmann::json::exception when a required field has the wrong type.
 */
class JsonMapping {
public:
    static nlohmann::json ToJson(const domain::Document& document, bool withEmbedding = false);
    static domain::Document DocumentFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::Claim& claim, bool withEmbedding = false);
    static domain::Claim ClaimFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::SearchResult& result);
    static nlohmann::json ToJson(const domain::SimilarityMatch& match);
    static nlohmann::json ToJson(const domain::ClaimComparisonResult& result);
    static nlohmann::json ToJson(const domain::ClaimHit& hit);
    static nlohmann::json ToJson(const domain::InventionClaimComparison& comparison);
    static nlohmann::json ToJson(const domain::BlockingDocument& document);
    static nlohmann::json ToJson(const domain::PriorArtNarrative& narrative);
    static nlohmann::json ToJson(const domain::PriorArtReport& report);
    static nlohmann::json ToJson(const domain::QueryRecord& record);

    static nlohmann::json ToJson(const domain::InfringementNarrative& narrative);
    static domain::InfringementNarrative InfringementNarrativeFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::InfringementReport& report);
    static domain::InfringementReport InfringementReportFromJson(const nlohmann::json& j);

    template <typename T>
    static nlohmann::json ToJsonArray(const std::vector<T>& items) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : items) array.push_back(ToJson(item));
        return array;
    }

    /** @brief Reads an array of strings, skipping non-string entries. */
    static std::vector<std::string> StringList(const nlohmann::json& j, const char* key);
};

} // namespace patentlens::infrastructure
