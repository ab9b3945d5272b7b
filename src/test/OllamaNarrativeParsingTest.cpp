#include <cassert>
#include <iostream>
#include <memory>

#include "domain/Errors.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/PromptCatalog.hpp"

using namespace patentlens;
using infrastructure::OllamaNarrativeAdapter;

int main() {
    std::cout << "[Test] Starting OllamaNarrativeParsing Test..." << std::endl;

    auto fenced = OllamaNarrativeAdapter::ExtractJsonObject("Here you go:\n```json\n{\"summary\": \"ok\"}\n```\nThanks");
    assert(fenced && (*fenced)["summary"] == "ok");

    auto bare = OllamaNarrativeAdapter::ExtractJsonObject("```\n{\"a\": 1}\n```");
    assert(bare && (*bare)["a"] == 1);

    auto prose = OllamaNarrativeAdapter::ExtractJsonObject("Sure! {\"risk_level\": \"high\"} Hope this helps.");
    assert(prose && (*prose)["risk_level"] == "high");

    assert(!OllamaNarrativeAdapter::ExtractJsonObject("I cannot answer that."));
    assert(!OllamaNarrativeAdapter::ExtractJsonObject("[1, 2, 3]"));
    assert(!OllamaNarrativeAdapter::ExtractJsonObject("{broken json"));
    std::cout << "[PASS] JSON extraction from model answers." << std::endl;

    auto infringement = OllamaNarrativeAdapter::ParseInfringement(
        "{\"risk_level\": \"medium\", \"key_overlaps\": [\"hinge\"], \"explanation\": \"similar hinge\"}", 0.66);
    assert(infringement);
    assert(infringement->riskLevel == domain::RiskLevel::Medium);
    assert(infringement->confidence == 0.66);
    assert(infringement->keyOverlaps.size() == 1);

    auto withConfidence = OllamaNarrativeAdapter::ParseInfringement("{\"risk_level\": \"low\", \"confidence\": 0.9}", 0.2);
    assert(withConfidence && withConfidence->confidence == 0.9);
    assert(!OllamaNarrativeAdapter::ParseInfringement("no json here", 0.5));

    auto matches = OllamaNarrativeAdapter::ParseClaimMatches(
        "```json\n{\"summary\": \"s\", \"recommendation\": \"r\", \"match_assessments\": [\"one\", 2, \"three\"]}\n```");
    assert(matches && matches->summary == "s" && matches->recommendation == "r");
    assert(matches->matchAssessments.size() == 2);

    auto priorArt = OllamaNarrativeAdapter::ParsePriorArt("{\"key_risks\": [\"claim 1\"]}");
    assert(priorArt);
    assert(priorArt->freedomToOperate == "uncertain");
    assert(priorArt->keyRisks.size() == 1);
    assert(priorArt->designAroundSuggestions.empty());
    std::cout << "[PASS] Narrative parsing with defaults." << std::endl;

    // Text that is not valid UTF-8 cannot be encoded; no request is sent.
    infrastructure::OllamaSettings unreachable;
    unreachable.host = "127.0.0.1";
    unreachable.port = 9;
    auto client = std::make_shared<infrastructure::OllamaClient>(unreachable);
    const std::string broken = std::string(40, 'x') + "\xC2";
    bool malformed = false;
    try {
        client->getEmbedding(broken);
    } catch (const domain::ProviderError& e) {
        malformed = e.kind() == domain::ProviderErrorKind::MalformedResponse;
    }
    assert(malformed);

    OllamaNarrativeAdapter narrative(client);
    domain::SimilarityMatch match;
    match.source.text = broken;
    match.target.text = broken;
    assert(!narrative.analyzeClaimMatches({match}));
    std::cout << "[PASS] Unencodable request text degrades to a provider error." << std::endl;

    domain::SimilarityMatch accented;
    accented.source.text = std::string(499, 'a') + "\xC3\xA9" + std::string(40, 'b');
    accented.target.text = accented.source.text;
    const std::string prompt = infrastructure::PromptCatalog::GetClaimMatchPrompt({accented});
    assert(prompt.find(std::string(499, 'a') + "...") != std::string::npos);
    assert(!nlohmann::json(prompt).dump().empty());
    std::cout << "[PASS] Prompt clipping keeps multi-byte characters whole." << std::endl;

    std::cout << "[PASS] OllamaNarrativeParsing Test." << std::endl;
    return 0;
}
