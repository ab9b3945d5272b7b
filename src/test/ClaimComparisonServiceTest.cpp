#include <cassert>
#include <iostream>
#include <memory>

#include "application/ClaimComparisonService.hpp"
#include "infrastructure/InMemoryPatentRepository.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using application::ClaimComparisonService;
using application::ClaimIndexingService;
using application::EmbeddingPipeline;
using application::EmbeddingSettings;
using domain::Document;
using domain::RiskLevel;

namespace {

struct Fixture {
    std::shared_ptr<infrastructure::InMemoryPatentRepository> repo = std::make_shared<infrastructure::InMemoryPatentRepository>();
    std::shared_ptr<test::FakeEmbeddingService> embedder = std::make_shared<test::FakeEmbeddingService>(26);
    std::shared_ptr<test::FakeNarrative> narrative = std::make_shared<test::FakeNarrative>();
    std::shared_ptr<EmbeddingPipeline> pipeline;
    std::shared_ptr<ClaimIndexingService> indexing;
    std::unique_ptr<ClaimComparisonService> service;

    Fixture() {
        EmbeddingSettings settings;
        settings.dimensions = 26;
        pipeline = std::make_shared<EmbeddingPipeline>(embedder, settings);
        indexing = std::make_shared<ClaimIndexingService>(repo, pipeline, 2);
        service = std::make_unique<ClaimComparisonService>(repo, indexing, pipeline, narrative,
                                                           application::ClaimComparisonSettings{});

        add("US100", "Coffee brewer",
            "1. A method for brewing coffee, comprising: heating water; passing the water through ground beans.\n"
            "2. The method of claim 1, wherein the water is heated to ninety degrees.\n");
        add("US200", "Bicycle frame",
            "1. A bicycle frame comprising a titanium tube and a carbon fork.\n");
        add("US300", "Unstructured", "nothing parseable here");
    }

    void add(const std::string& id, const std::string& title, const std::string& claims) {
        Document doc;
        doc.id = id;
        doc.patentNumber = id;
        doc.title = title;
        doc.abstract = title + " abstract";
        doc.claimsText = claims;
        repo->saveDocument(doc);
    }
};

void TestCompareDocuments() {
    Fixture f;

    auto result = f.service->compareDocuments("US100", "US100");
    assert(result.sourceDocumentId == "US100");
    assert(result.sourceClaimsCount == 2);
    assert(result.overallRisk == RiskLevel::High);
    assert(test::Near(result.highestSimilarity, 1.0));
    assert(result.summary == "LLM analysis unavailable.");
    assert(result.recommendation == "Manual review recommended.");
    assert(f.repo->claimsFor("US100").size() == 2);

    f.narrative->claimMatches = domain::ClaimMatchNarrative{"Claims overlap", "Seek counsel", {"identical wording"}};
    auto analysed = f.service->compareDocuments("US100", "US100");
    assert(analysed.summary == "Claims overlap");
    assert(analysed.recommendation == "Seek counsel");
    assert(analysed.topMatches[0].overlapAssessment == std::string("identical wording"));
    assert(f.narrative->lastMatchCount == analysed.topMatches.size());

    auto plain = f.service->compareDocuments("US100", "US200", false);
    assert(plain.summary.empty());
    for (const auto& match : plain.topMatches) assert(!match.overlapAssessment);
    std::cout << "[PASS] Document comparison with and without narrative." << std::endl;
}

void TestUnparsedClaims() {
    Fixture f;
    auto result = f.service->compareDocuments("US100", "US300");
    assert(result.overallRisk == RiskLevel::Unknown);
    assert(result.message.has_value());
    assert(result.targetDocumentId == "US300");
    assert(result.topMatches.empty());

    bool threw = false;
    try {
        f.service->compareDocuments("US100", "US999");
    } catch (const domain::InvalidInputError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unparsed and unknown documents." << std::endl;
}

void TestSimilarClaims() {
    Fixture f;
    f.indexing->ensureClaims("US100");
    f.indexing->ensureClaims("US200");

    auto hits = f.service->findSimilarClaims("brewing coffee with hot water", 10);
    assert(hits.size() == 3);
    for (size_t i = 1; i < hits.size(); ++i) assert(hits[i - 1].similarity >= hits[i].similarity);
    for (const auto& hit : hits) assert(!hit.documentTitle.empty());

    auto excluded = f.service->findSimilarClaims("brewing coffee with hot water", 10, std::string("US100"));
    assert(excluded.size() == 1);
    assert(excluded[0].claim.documentId == "US200");

    int rejected = 0;
    try { f.service->findSimilarClaims("short"); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->findSimilarClaims("a long enough claim text", 0); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->findSimilarClaims("a long enough claim text", 51); } catch (const domain::InvalidInputError&) { ++rejected; }
    assert(rejected == 3);
    std::cout << "[PASS] Similar claims search." << std::endl;
}

void TestInventionAgainstClaims() {
    Fixture f;
    auto comparison = f.service->compareInventionToClaims("A coffee brewing method using hot water", "US100");
    assert(comparison.document.id == "US100");
    assert(comparison.totalClaims == 2);
    assert(comparison.comparisons.size() == 2);
    assert(comparison.comparisons[0].similarity >= comparison.comparisons[1].similarity);

    int rejected = 0;
    try { f.service->compareInventionToClaims("too short", "US100"); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->compareInventionToClaims("A coffee brewing method using hot water", "US999"); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->compareInventionToClaims("A coffee brewing method using hot water", "US300"); } catch (const domain::InvalidInputError&) { ++rejected; }
    assert(rejected == 3);
    std::cout << "[PASS] Invention against claims." << std::endl;
}

void TestPartialEmbeddingFailure() {
    Fixture f;
    f.embedder->failWhenContains("Patent Claim 2:");

    auto claims = f.indexing->processClaims("US100");
    assert(claims.size() == 2);
    assert(claims[0].hasEmbedding());
    assert(!claims[1].hasEmbedding());
    assert(claims[0].documentId == "US100");
    assert(!claims[0].keyElements.empty());

    auto comparison = f.service->compareInventionToClaims("A coffee brewing method using hot water", "US100");
    assert(comparison.comparisons.back().claim.number == 2);
    assert(comparison.comparisons.back().similarity == 0.0);

    f.embedder->failWhenContains("Patent Claim");
    bool threw = false;
    try {
        f.indexing->processClaims("US200");
    } catch (const domain::ProviderError& e) {
        threw = e.isRetryable();
    }
    assert(threw);
    assert(f.repo->claimsFor("US200").empty());
    std::cout << "[PASS] Claims survive partial embedding failures." << std::endl;
}

void TestRewrittenClaimsDropOldSet() {
    Fixture f;
    f.add("US400", "Kettle", "1. A method comprising heating water quickly.\n");
    assert(f.indexing->processClaims("US400").size() == 1);
    assert(f.repo->claimsFor("US400").size() == 1);

    f.add("US400", "Kettle", "Heating water quickly, without any numbered claims.");
    assert(f.indexing->processClaims("US400").empty());
    assert(f.repo->claimsFor("US400").empty());
    assert(f.indexing->ensureClaims("US400").empty());

    f.add("US400", "Kettle", "1. A method comprising heating water quickly.\n");
    assert(f.indexing->processClaims("US400").size() == 1);
    auto doc = f.repo->findDocument("US400");
    doc->claimsText.reset();
    f.repo->saveDocument(*doc);
    assert(f.indexing->processClaims("US400").empty());
    assert(f.repo->claimsFor("US400").empty());
    std::cout << "[PASS] Rewritten claims text drops the previous claim set." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClaimComparisonService Test..." << std::endl;
    TestCompareDocuments();
    TestUnparsedClaims();
    TestSimilarClaims();
    TestInventionAgainstClaims();
    TestPartialEmbeddingFailure();
    TestRewrittenClaimsDropOldSet();
    std::cout << "[PASS] ClaimComparisonService Test." << std::endl;
    return 0;
}
