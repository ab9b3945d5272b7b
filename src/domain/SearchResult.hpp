/**
 * @file SearchResult.hpp
 * @brief Per-document fusion record produced by a hybrid query.
 */

#pragma once
#include <string>
#include "domain/Patent.hpp"

namespace patentlens::domain {

/**
 * @enum MatchType
 * @brief Which retrieval modalities surfaced a document.
 */
enum class MatchType {
    Vector,
    Fuzzy,
    Hybrid ///< Found by both.
};

inline std::string MatchTypeToString(MatchType type) {
    switch (type) {
        case MatchType::Vector: return "vector";
        case MatchType::Fuzzy: return "fuzzy";
        case MatchType::Hybrid: return "hybrid";
    }
    return "hybrid";
}

struct SearchResult {
    Document document;
    double vectorScore = 0.0;
    double fuzzyScore = 0.0;
    double combinedScore = 0.0;
    MatchType matchType = MatchType::Vector;
};

} // namespace patentlens::domain
