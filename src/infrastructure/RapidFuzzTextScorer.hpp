/**
 * @file RapidFuzzTextScorer.hpp
 * @brief Lexical similarity through rapidfuzz-cpp.
 */

#pragma once
#include "domain/TextSimilarityScorer.hpp"

namespace patentlens::infrastructure {

/**
 * @class RapidFuzzTextScorer
 * @brief Token-set ratio of the lowercased texts, rescaled from 0..100 to [0, 1].
 *
 * Token-set matching ignores word order and repeated words, so a short query
 * contained in a long title+abstract still scores high.
 */
class RapidFuzzTextScorer : public domain::TextSimilarityScorer {
public:
    double score(const std::string& query, const std::string& candidate) const override;
};

} // namespace patentlens::infrastructure
