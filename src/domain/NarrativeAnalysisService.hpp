/**
 * @file NarrativeAnalysisService.hpp
 * @brief Interface for LLM-backed narrative assessments.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Patent.hpp"
#include "domain/PriorArt.hpp"
#include "domain/Risk.hpp"
#include "domain/SimilarityMatch.hpp"

namespace patentlens::domain {

/**
 * @struct InfringementNarrative
 * @brief Document-to-document infringement assessment.
 */
struct InfringementNarrative {
    RiskLevel riskLevel = RiskLevel::Unknown;
    double confidence = 0.0;
    std::vector<std::string> keyOverlaps;
    std::vector<std::string> differences;
    std::string explanation;
    std::string recommendation;
};

/**
 * @struct ClaimMatchNarrative
 * @brief Assessment of the strongest claim pairs of a comparison.
 */
struct ClaimMatchNarrative {
    std::string summary;
    std::string recommendation;
    std::vector<std::string> matchAssessments; ///< In the order of the analysed matches.
};

/**
 * @class NarrativeAnalysisService
 * @brief Produces structured narrative assessments.
 *
 * Every method returns std::nullopt when the provider is unavailable, times
 * out, or answers with something that cannot be read as the expected
 * structure. Callers substitute their own safe default.
 */
class NarrativeAnalysisService {
public:
    virtual ~NarrativeAnalysisService() = default;

    virtual std::optional<InfringementNarrative> analyzeInfringement(const Document& source,
                                                                     const Document& target,
                                                                     double similarity) = 0;

    virtual std::optional<ClaimMatchNarrative> analyzeClaimMatches(const std::vector<SimilarityMatch>& matches) = 0;

    virtual std::optional<PriorArtNarrative> analyzePriorArt(const std::string& invention,
                                                             const std::vector<BlockingDocument>& documents) = 0;
};

} // namespace patentlens::domain
