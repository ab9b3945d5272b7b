/**
 * @file JsonMapping.cpp
 * @brief Implementation of JsonMapping.
 */

#include "infrastructure/JsonMapping.hpp"

using json = nlohmann::json;

namespace patentlens::infrastructure {

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string StringOr(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // namespace

json JsonMapping::ToJson(const domain::Document& document, bool withEmbedding) {
    json j = {
        {"id", document.id},
        {"title", document.title},
        {"abstract", document.abstract},
        {"claims", OptionalString(document.claimsText)},
        {"patent_number", document.patentNumber},
        {"applicant", document.applicant},
        {"classification", document.classification},
        {"filing_date", document.filingDate},
        {"publication_date", document.publicationDate}
    };
    if (withEmbedding && document.hasEmbedding()) {
        j["embedding"] = document.embedding;
    }
    return j;
}

domain::Document JsonMapping::DocumentFromJson(const json& j) {
    domain::Document document;
    document.id = StringOr(j, "id");
    document.title = StringOr(j, "title");
    document.abstract = StringOr(j, "abstract");
    if (j.contains("claims") && j["claims"].is_string()) {
        document.claimsText = j["claims"].get<std::string>();
    }
    document.patentNumber = StringOr(j, "patent_number");
    document.applicant = StringOr(j, "applicant");
    document.classification = StringOr(j, "classification");
    document.filingDate = StringOr(j, "filing_date");
    document.publicationDate = StringOr(j, "publication_date");
    if (j.contains("embedding") && j["embedding"].is_array()) {
        document.embedding = j["embedding"].get<std::vector<float>>();
    }
    return document;
}

json JsonMapping::ToJson(const domain::Claim& claim, bool withEmbedding) {
    json j = {
        {"patent_id", claim.documentId},
        {"claim_number", claim.number},
        {"claim_text", claim.text},
        {"is_independent", claim.isIndependent},
        {"parent_claim_number", claim.parentNumber ? json(*claim.parentNumber) : json(nullptr)},
        {"claim_type", claim.type ? json(domain::ClaimTypeToString(*claim.type)) : json(nullptr)},
        {"key_elements", claim.keyElements}
    };
    if (withEmbedding && claim.hasEmbedding()) {
        j["embedding"] = claim.embedding;
    }
    return j;
}

domain::Claim JsonMapping::ClaimFromJson(const json& j) {
    domain::Claim claim;
    claim.documentId = StringOr(j, "patent_id");
    claim.number = j.at("claim_number").get<int>();
    claim.text = j.at("claim_text").get<std::string>();
    claim.isIndependent = j.value("is_independent", true);
    if (j.contains("parent_claim_number") && j["parent_claim_number"].is_number_integer()) {
        claim.parentNumber = j["parent_claim_number"].get<int>();
    }
    if (j.contains("claim_type") && j["claim_type"].is_string()) {
        claim.type = domain::ClaimTypeFromString(j["claim_type"].get<std::string>());
    }
    claim.keyElements = StringList(j, "key_elements");
    if (j.contains("embedding") && j["embedding"].is_array()) {
        claim.embedding = j["embedding"].get<std::vector<float>>();
    }
    return claim;
}

json JsonMapping::ToJson(const domain::SearchResult& result) {
    return {
        {"patent", ToJson(result.document)},
        {"vector_score", result.vectorScore},
        {"fuzzy_score", result.fuzzyScore},
        {"combined_score", result.combinedScore},
        {"match_type", domain::MatchTypeToString(result.matchType)}
    };
}

json JsonMapping::ToJson(const domain::SimilarityMatch& match) {
    return {
        {"source_claim", ToJson(match.source)},
        {"target_claim", ToJson(match.target)},
        {"similarity", match.similarity},
        {"risk_level", domain::RiskLevelToString(match.risk)},
        {"overlap_assessment", OptionalString(match.overlapAssessment)}
    };
}

json JsonMapping::ToJson(const domain::ClaimComparisonResult& result) {
    json j = {
        {"source_patent_id", result.sourceDocumentId},
        {"target_patent_id", result.targetDocumentId},
        {"source_claims_count", result.sourceClaimsCount},
        {"target_claims_count", result.targetClaimsCount},
        {"total_matches", result.totalMatches},
        {"top_matches", ToJsonArray(result.topMatches)},
        {"highest_similarity", result.highestSimilarity},
        {"average_similarity", result.averageSimilarity},
        {"independent_claims_at_risk", result.independentClaimsAtRisk},
        {"overall_risk", domain::RiskLevelToString(result.overallRisk)},
        {"summary", result.summary},
        {"recommendation", result.recommendation}
    };
    if (result.message) j["message"] = *result.message;
    return j;
}

json JsonMapping::ToJson(const domain::ClaimHit& hit) {
    return {
        {"patent_id", hit.claim.documentId},
        {"patent_title", hit.documentTitle},
        {"patent_number", hit.patentNumber},
        {"claim_number", hit.claim.number},
        {"claim_text", hit.claim.text},
        {"is_independent", hit.claim.isIndependent},
        {"claim_type", hit.claim.type ? json(domain::ClaimTypeToString(*hit.claim.type)) : json(nullptr)},
        {"similarity", hit.similarity}
    };
}

json JsonMapping::ToJson(const domain::InventionClaimComparison& comparison) {
    json entries = json::array();
    for (const auto& entry : comparison.comparisons) {
        json e = ToJson(entry.claim);
        e["similarity"] = entry.similarity;
        e["risk_level"] = domain::RiskLevelToString(entry.risk);
        entries.push_back(std::move(e));
    }
    return {
        {"patent", ToJson(comparison.document)},
        {"total_claims", comparison.totalClaims},
        {"high_risk_claims", comparison.highRiskClaims},
        {"claim_comparisons", entries}
    };
}

json JsonMapping::ToJson(const domain::BlockingDocument& document) {
    json claims = json::array();
    for (const auto& blocking : document.blockingClaims) {
        json c = ToJson(blocking.hit);
        c["risk_level"] = domain::RiskLevelToString(blocking.risk);
        claims.push_back(std::move(c));
    }
    return {
        {"patent_id", document.documentId},
        {"patent_number", document.patentNumber},
        {"title", document.title},
        {"abstract", document.abstract},
        {"applicant", document.applicant},
        {"publication_date", document.publicationDate},
        {"blocking_claims", claims},
        {"highest_similarity", document.highestSimilarity},
        {"overall_risk", domain::RiskLevelToString(document.overallRisk)}
    };
}

json JsonMapping::ToJson(const domain::PriorArtNarrative& narrative) {
    return {
        {"freedom_to_operate", narrative.freedomToOperate},
        {"key_risks", narrative.keyRisks},
        {"design_around_suggestions", narrative.designAroundSuggestions},
        {"recommendation", narrative.recommendation}
    };
}

json JsonMapping::ToJson(const domain::PriorArtReport& report) {
    return {
        {"query_summary", report.querySummary},
        {"total_patents_searched", report.totalDocumentsSearched},
        {"blocking_patents_found", report.documents.size()},
        {"patents", ToJsonArray(report.documents)},
        {"analysis", report.analysis ? ToJson(*report.analysis) : json(nullptr)}
    };
}

json JsonMapping::ToJson(const domain::QueryRecord& record) {
    return {
        {"query_text", record.queryText},
        {"query_type", record.queryType},
        {"results_count", record.resultsCount},
        {"top_score", record.topScore ? json(*record.topScore) : json(nullptr)},
        {"latency_ms", record.latencyMs},
        {"created_at", record.createdAt}
    };
}

json JsonMapping::ToJson(const domain::InfringementNarrative& narrative) {
    return {
        {"risk_level", domain::RiskLevelToString(narrative.riskLevel)},
        {"confidence", narrative.confidence},
        {"key_overlaps", narrative.keyOverlaps},
        {"differences", narrative.differences},
        {"explanation", narrative.explanation},
        {"recommendation", narrative.recommendation}
    };
}

domain::InfringementNarrative JsonMapping::InfringementNarrativeFromJson(const json& j) {
    domain::InfringementNarrative narrative;
    narrative.riskLevel = domain::RiskLevelFromString(StringOr(j, "risk_level", "unknown"));
    if (j.contains("confidence") && j["confidence"].is_number()) {
        narrative.confidence = j["confidence"].get<double>();
    }
    narrative.keyOverlaps = StringList(j, "key_overlaps");
    narrative.differences = StringList(j, "differences");
    narrative.explanation = StringOr(j, "explanation");
    narrative.recommendation = StringOr(j, "recommendation");
    return narrative;
}

json JsonMapping::ToJson(const domain::InfringementReport& report) {
    return {
        {"source_patent", ToJson(report.source)},
        {"target_patent", ToJson(report.target)},
        {"vector_similarity", report.vectorSimilarity},
        {"fuzzy_similarity", report.fuzzySimilarity},
        {"combined_score", report.combinedScore},
        {"assessment", ToJson(report.assessment)}
    };
}

domain::InfringementReport JsonMapping::InfringementReportFromJson(const json& j) {
    domain::InfringementReport report;
    report.source = DocumentFromJson(j.at("source_patent"));
    report.target = DocumentFromJson(j.at("target_patent"));
    report.vectorSimilarity = j.at("vector_similarity").get<double>();
    report.fuzzySimilarity = j.at("fuzzy_similarity").get<double>();
    report.combinedScore = j.at("combined_score").get<double>();
    report.assessment = InfringementNarrativeFromJson(j.at("assessment"));
    return report;
}

std::vector<std::string> JsonMapping::StringList(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace patentlens::infrastructure
