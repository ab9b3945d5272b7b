/**
 * @file ClaimParser.hpp
 * @brief Turns a raw claims section into structured, dependency-linked claims.
 */

#pragma once

#include "domain/Patent.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace patentlens::domain {

/**
 * @brief Stateless parser for patent claims text.
 *
 * Extraction is attempted with an ordered list of strategies; the first
 * strategy that recognises at least one claim marker wins and the others are
 * not consulted. When the winning strategy yields nothing usable, a manual
 * line scan runs as the final fallback.
 */
class ClaimParser {
public:
    /** @brief A numbered block of text recognised by a strategy. */
    struct Candidate {
        int number;
        std::string text;
    };

    /**
     * @brief Extraction strategy over normalized text.
     * An empty result means "no match"; the next strategy is tried.
     */
    using Strategy = std::function<std::vector<Candidate>(const std::string& normalized)>;

    /** @brief Cleaned claim text shorter than this is treated as noise. */
    static constexpr std::size_t kMinClaimLength = 11;

    /** @brief Upper bound on extracted key elements per claim. */
    static constexpr std::size_t kMaxKeyElements = 10;

    /**
     * @brief Parses a raw claims blob. Never throws; may return an empty list.
     * @return Claims sorted ascending by number (stable for duplicates).
     */
    static std::vector<Claim> Parse(const std::string& rawText);

    /**
     * @brief Collects quoted terms and the components listed after
     *        "comprising"/"including"/"having"/"consists of".
     * @return Up to 10 distinct elements, quoted terms first.
     */
    static std::vector<std::string> ExtractKeyElements(const std::string& claimText);

    /**
     * @brief Detects a reference to an earlier claim.
     * @return {isIndependent, parentNumber}.
     */
    static std::pair<bool, std::optional<int>> AnalyzeDependency(const std::string& claimText);

    /** @brief Classifies the claim preamble; nullopt when no rule matches. */
    static std::optional<ClaimType> DetectClaimType(const std::string& claimText);

    /** @brief Unifies line endings, collapses blanks and drops page-number lines. */
    static std::string Normalize(const std::string& rawText);

    /** @brief Collapses all whitespace runs to one space and trims. */
    static std::string CleanClaimText(const std::string& text);

    /** @brief "N." or "N)" at line start. */
    static std::vector<Candidate> NumberedLineStrategy(const std::string& normalized);

    /** @brief "Claim N:" or "Claim N." at line start. */
    static std::vector<Candidate> ClaimLabelStrategy(const std::string& normalized);

    /** @brief Line-by-line accumulation used when no strategy produced claims. */
    static std::vector<Candidate> LineScanFallback(const std::string& normalized);

    /** @brief Strategies in priority order. */
    static const std::vector<Strategy>& Strategies();
};

} // namespace patentlens::domain
