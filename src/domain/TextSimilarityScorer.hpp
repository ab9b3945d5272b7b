/**
 * @file TextSimilarityScorer.hpp
 * @brief Interface for lexical (fuzzy) similarity scoring.
 */

#pragma once
#include <string>
#include <vector>

namespace patentlens::domain {

class TextSimilarityScorer {
public:
    virtual ~TextSimilarityScorer() = default;

    /** @brief Normalized lexical similarity in [0, 1]. */
    virtual double score(const std::string& query, const std::string& candidate) const = 0;
};

} // namespace patentlens::domain
