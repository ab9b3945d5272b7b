/**
 * @file Risk.hpp
 * @brief Risk buckets and the thresholds that produce them.
 */

#pragma once
#include <string>

namespace patentlens::domain {

/**
 * @enum RiskLevel
 * @brief Discretization of a similarity score.
 */
enum class RiskLevel {
    Low,
    Medium,
    High,
    Unknown ///< No score could be computed (e.g. claims could not be parsed).
};

/**
 * @struct RiskThresholds
 * @brief Lower bounds (inclusive) of the medium and high buckets.
 */
struct RiskThresholds {
    double medium;
    double high;
};

/** @brief Thresholds used when comparing claim sets of two documents. */
inline constexpr RiskThresholds kClaimComparisonThresholds{0.6, 0.8};

/** @brief Thresholds used when ranking prior art against an invention. */
inline constexpr RiskThresholds kPriorArtThresholds{0.55, 0.75};

inline std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        case RiskLevel::Unknown: return "unknown";
    }
    return "unknown";
}

inline RiskLevel RiskLevelFromString(const std::string& value) {
    if (value == "low") return RiskLevel::Low;
    if (value == "medium") return RiskLevel::Medium;
    if (value == "high") return RiskLevel::High;
    return RiskLevel::Unknown;
}

} // namespace patentlens::domain
