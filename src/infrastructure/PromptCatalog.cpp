/**
 * @file PromptCatalog.cpp
 * @brief Prompt texts for the narrative analyses.
 */

#include "infrastructure/PromptCatalog.hpp"
#include "domain/TextUtils.hpp"
#include <iomanip>
#include <sstream>

namespace patentlens::infrastructure {

namespace {

std::string Clip(const std::string& text, size_t maxChars) {
    return domain::TextUtils::Utf8Prefix(text, maxChars);
}

const char* Independence(const domain::Claim& claim) {
    return claim.isIndependent ? "Independent" : "Dependent";
}

} // namespace

std::string PromptCatalog::Percent(double score) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << score * 100.0 << "%";
    return ss.str();
}

std::string PromptCatalog::GetInfringementPrompt(const domain::Document& source,
                                                 const domain::Document& target,
                                                 double similarity) {
    std::ostringstream ss;
    ss << "You are a patent attorney AI assistant. Analyze the following two patents for potential infringement.\n\n"
       << "SOURCE PATENT:\n"
       << "Title: " << source.title << "\n"
       << "Abstract: " << source.abstract << "\n"
       << "Claims: " << (source.claimsText ? Clip(*source.claimsText, 2000) : "N/A") << "\n\n"
       << "TARGET PATENT (potentially infringing):\n"
       << "Title: " << target.title << "\n"
       << "Abstract: " << target.abstract << "\n"
       << "Claims: " << (target.claimsText ? Clip(*target.claimsText, 2000) : "N/A") << "\n\n"
       << "Similarity Score: " << Percent(similarity) << "\n\n"
       << "Analyze and respond in JSON format:\n"
       << "{\n"
       << "    \"risk_level\": \"low|medium|high\",\n"
       << "    \"confidence\": 0.0-1.0,\n"
       << "    \"key_overlaps\": [\"overlap 1\", \"overlap 2\"],\n"
       << "    \"differences\": [\"difference 1\", \"difference 2\"],\n"
       << "    \"explanation\": \"Brief explanation of the analysis\",\n"
       << "    \"recommendation\": \"What action to take\"\n"
       << "}\n\n"
       << "Be precise and technical. Focus on claim overlap and technical similarities.";
    return ss.str();
}

std::string PromptCatalog::GetClaimMatchPrompt(const std::vector<domain::SimilarityMatch>& matches) {
    std::ostringstream ss;
    ss << "You are a patent attorney AI. Analyze these matching patent claims for potential infringement.\n\n";
    for (size_t i = 0; i < matches.size(); ++i) {
        const auto& m = matches[i];
        ss << "MATCH " << (i + 1) << " (Similarity: " << Percent(m.similarity) << "):\n"
           << "Source Claim " << m.source.number << " (" << Independence(m.source) << "):\n"
           << Clip(m.source.text, 500) << "...\n\n"
           << "Target Claim " << m.target.number << " (" << Independence(m.target) << "):\n"
           << Clip(m.target.text, 500) << "...\n\n";
    }
    ss << "Provide analysis in JSON format:\n"
       << "{\n"
       << "    \"summary\": \"Brief overall assessment of infringement risk (2-3 sentences)\",\n"
       << "    \"recommendation\": \"Specific action recommended\",\n"
       << "    \"match_assessments\": [\"Brief assessment for match 1\", \"Brief assessment for match 2\"]\n"
       << "}\n\n"
       << "Focus on:\n"
       << "1. Whether the claims cover the same technical subject matter\n"
       << "2. Whether one claim would literally or equivalently infringe the other\n"
       << "3. Key differences that might avoid infringement\n\n"
       << "Be precise and technical.";
    return ss.str();
}

std::string PromptCatalog::GetPriorArtPrompt(const std::string& invention,
                                             const std::vector<domain::BlockingDocument>& documents) {
    std::ostringstream ss;
    ss << "You are a patent attorney AI. Analyze the freedom to operate for this invention.\n\n"
       << "INVENTION DESCRIPTION:\n" << Clip(invention, 1500) << "\n\n"
       << "POTENTIALLY BLOCKING PRIOR ART:\n";
    for (const auto& doc : documents) {
        ss << "PATENT: " << (doc.patentNumber.empty() ? "Unknown" : doc.patentNumber) << " - " << doc.title << "\n"
           << "Highest similarity: " << Percent(doc.highestSimilarity) << "\n";
        if (!doc.blockingClaims.empty()) {
            const auto& top = doc.blockingClaims.front().hit.claim;
            ss << "Top blocking claim (Claim " << top.number << "): " << Clip(top.text, 400) << "...\n";
        }
        ss << "\n";
    }
    ss << "Analyze and respond in JSON format:\n"
       << "{\n"
       << "    \"freedom_to_operate\": \"likely|uncertain|unlikely\",\n"
       << "    \"key_risks\": [\"risk 1\", \"risk 2\"],\n"
       << "    \"design_around_suggestions\": [\"suggestion 1\", \"suggestion 2\"],\n"
       << "    \"recommendation\": \"Brief recommendation for next steps\"\n"
       << "}\n\n"
       << "Consider:\n"
       << "1. How similar are the blocking claims to the invention?\n"
       << "2. Are there clear differences that could avoid infringement?\n"
       << "3. What modifications could help design around the prior art?\n\n"
       << "Be practical and specific.";
    return ss.str();
}

} // namespace patentlens::infrastructure
