/**
 * @file RapidFuzzTextScorer.cpp
 * @brief Fuzzy text scoring with rapidfuzz.
 */

#include "infrastructure/RapidFuzzTextScorer.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <rapidfuzz/fuzz.hpp>

namespace patentlens::infrastructure {

double RapidFuzzTextScorer::score(const std::string& query, const std::string& candidate) const {
    const std::string a = domain::TextUtils::ToLower(query);
    const std::string b = domain::TextUtils::ToLower(candidate);
    double ratio = rapidfuzz::fuzz::token_set_ratio(a, b);
    return std::clamp(ratio / 100.0, 0.0, 1.0);
}

} // namespace patentlens::infrastructure
