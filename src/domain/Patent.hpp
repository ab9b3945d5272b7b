/**
 * @file Patent.hpp
 * @brief Domain entities for patent documents and their claims.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace patentlens::domain {

/**
 * @enum ClaimType
 * @brief Statutory category detected from a claim preamble.
 */
enum class ClaimType {
    Method,
    Apparatus,
    System,
    Composition,
    Article,
    Process
};

inline std::string ClaimTypeToString(ClaimType type) {
    switch (type) {
        case ClaimType::Method: return "method";
        case ClaimType::Apparatus: return "apparatus";
        case ClaimType::System: return "system";
        case ClaimType::Composition: return "composition";
        case ClaimType::Article: return "article";
        case ClaimType::Process: return "process";
    }
    return "";
}

inline std::optional<ClaimType> ClaimTypeFromString(const std::string& value) {
    if (value == "method") return ClaimType::Method;
    if (value == "apparatus") return ClaimType::Apparatus;
    if (value == "system") return ClaimType::System;
    if (value == "composition") return ClaimType::Composition;
    if (value == "article") return ClaimType::Article;
    if (value == "process") return ClaimType::Process;
    return std::nullopt;
}

/**
 * @struct Claim
 * @brief A single numbered claim, owned by the document whose id it carries.
 *
 * Claims are regenerated from the document's claims text whenever it changes,
 * so they carry no identity beyond (documentId, number).
 */
struct Claim {
    std::string documentId;
    int number = 0;
    std::string text;
    bool isIndependent = true;
    std::optional<int> parentNumber; ///< Present iff !isIndependent.
    std::optional<ClaimType> type;
    std::vector<float> embedding; ///< Empty when not embedded.
    std::vector<std::string> keyElements; ///< At most 10, no duplicates.

    bool hasEmbedding() const { return !embedding.empty(); }
};

/**
 * @struct Document
 * @brief A patent document with optional raw claims text and embedding.
 */
struct Document {
    std::string id;
    std::string title;
    std::string abstract;
    std::optional<std::string> claimsText;
    std::string patentNumber;
    std::string applicant;
    std::string classification; ///< IPC/CPC code.
    std::string filingDate;
    std::string publicationDate;
    std::vector<float> embedding; ///< Empty or exactly D components.

    bool hasEmbedding() const { return !embedding.empty(); }

    /** @brief Text used for lexical (fuzzy) matching. */
    std::string searchText() const { return title + " " + abstract; }
};

} // namespace patentlens::domain
