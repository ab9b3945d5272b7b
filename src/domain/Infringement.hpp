/**
 * @file Infringement.hpp
 * @brief Document-to-document infringement comparison.
 */

#pragma once
#include <string>
#include "domain/NarrativeAnalysisService.hpp"

namespace patentlens::domain {

struct InfringementReport {
    Document source;
    Document target;
    double vectorSimilarity = 0.0;
    double fuzzySimilarity = 0.0;
    double combinedScore = 0.0;
    InfringementNarrative assessment;
};

} // namespace patentlens::domain
