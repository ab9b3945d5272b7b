#include <cassert>
#include <iostream>
#include <memory>

#include "application/PriorArtService.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/InMemoryPatentRepository.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using application::PriorArtService;
using domain::Claim;
using domain::Document;
using domain::RiskLevel;
using test::Near;

namespace {

const std::string kInvention =
    "A foldable drone frame with carbon arms that lock into place using a magnetic latch.";

struct Fixture {
    std::shared_ptr<infrastructure::InMemoryPatentRepository> repo = std::make_shared<infrastructure::InMemoryPatentRepository>();
    std::shared_ptr<test::FakeEmbeddingService> embedder = std::make_shared<test::FakeEmbeddingService>(2);
    std::shared_ptr<test::FakeNarrative> narrative = std::make_shared<test::FakeNarrative>();
    std::unique_ptr<PriorArtService> service;

    Fixture() {
        embedder->set(kInvention, {1.0f, 0.0f});

        addDocument("EP1", "Folding quadcopter", "Acme Robotics");
        addClaims("EP1", {{1, {1.0f, 0.0f}}, {2, {0.6f, 0.8f}}});
        addDocument("EP2", "Garden hose reel", "Hose Co");
        addClaims("EP2", {{1, {0.3f, 0.954f}}});

        application::EmbeddingSettings embedding;
        embedding.dimensions = 2;
        auto pipeline = std::make_shared<application::EmbeddingPipeline>(embedder, embedding);
        service = std::make_unique<PriorArtService>(repo, pipeline, narrative, application::PriorArtSettings{});
    }

    void addDocument(const std::string& id, const std::string& title, const std::string& applicant) {
        Document doc;
        doc.id = id;
        doc.patentNumber = id;
        doc.title = title;
        doc.abstract = title + " abstract";
        doc.applicant = applicant;
        doc.publicationDate = "2020-01-01";
        repo->saveDocument(doc);
    }

    void addClaims(const std::string& id, const std::vector<std::pair<int, std::vector<float>>>& specs) {
        std::vector<Claim> claims;
        for (const auto& [number, embedding] : specs) {
            Claim claim;
            claim.documentId = id;
            claim.number = number;
            claim.text = std::string(400, 'c');
            claim.embedding = embedding;
            claims.push_back(claim);
        }
        repo->replaceClaims(id, claims);
    }
};

void TestLocate() {
    Fixture f;
    auto report = f.service->locate(kInvention, 20, true);

    assert(report.totalDocumentsSearched == 2);
    assert(report.querySummary == kInvention);
    assert(report.documents.size() == 1);

    const auto& doc = report.documents.front();
    assert(doc.documentId == "EP1");
    assert(doc.applicant == "Acme Robotics");
    assert(doc.publicationDate == "2020-01-01");
    assert(doc.overallRisk == RiskLevel::High);
    assert(Near(doc.highestSimilarity, 1.0));
    assert(doc.blockingClaims.size() == 2);
    assert(doc.blockingClaims[0].hit.claim.number == 1);
    assert(doc.blockingClaims[1].risk == RiskLevel::Medium);

    assert(report.analysis.has_value());
    assert(report.analysis->freedomToOperate == "uncertain");
    assert(report.analysis->recommendation == PriorArtService::DefaultNarrative().recommendation);
    assert(f.narrative->lastDocumentCount == 1);

    f.narrative->priorArt = domain::PriorArtNarrative{"unlikely", {"Latch claimed"}, {"Use a friction hinge"}, "File later"};
    auto analysed = f.service->locate(kInvention);
    assert(analysed.analysis->freedomToOperate == "unlikely");
    assert(analysed.analysis->designAroundSuggestions.size() == 1);

    auto plain = f.service->locate(kInvention, 20, false);
    assert(!plain.analysis);
    std::cout << "[PASS] Prior art grouped by document." << std::endl;
}

void TestNoiseFloor() {
    Fixture f;
    domain::ClaimHit weak;
    weak.claim.documentId = "EP2";
    weak.claim.number = 1;
    weak.similarity = 0.3;
    assert(f.service->groupByDocument({weak}, 10).empty());

    domain::ClaimHit strong = weak;
    strong.claim.documentId = "EP1";
    strong.similarity = 0.45;
    auto groups = f.service->groupByDocument({weak, strong}, 10);
    assert(groups.size() == 1);
    assert(groups[0].documentId == "EP1");
    assert(groups[0].overallRisk == RiskLevel::Low);
    std::cout << "[PASS] Weak documents are dropped." << std::endl;
}

void TestValidationAndQuickCheck() {
    Fixture f;
    int rejected = 0;
    try { f.service->locate("too short to search"); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->locate(kInvention, 0); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->locate(kInvention, 51); } catch (const domain::InvalidInputError&) { ++rejected; }
    try { f.service->quickCheck("tiny"); } catch (const domain::InvalidInputError&) { ++rejected; }
    assert(rejected == 4);

    auto hits = f.service->quickCheck(kInvention);
    assert(hits.size() == 3);
    assert(hits[0].claim.documentId == "EP1");
    assert(hits[0].documentTitle == "Folding quadcopter");
    assert(hits[0].claim.text.size() == PriorArtService::kQuickCheckClaimChars + 3);
    std::cout << "[PASS] Validation and quick check." << std::endl;
}

void TestMultiByteSummary() {
    Fixture f;
    const std::string accented = std::string(199, 'a') + "\xC3\xA9" + std::string(40, 'b');
    auto report = f.service->locate(accented, 5, false);
    assert(report.querySummary == std::string(199, 'a') + "...");
    assert(!infrastructure::JsonMapping::ToJson(report).dump(2).empty());
    std::cout << "[PASS] Query summary keeps multi-byte characters whole." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PriorArt Test..." << std::endl;
    TestLocate();
    TestNoiseFloor();
    TestValidationAndQuickCheck();
    TestMultiByteSummary();
    std::cout << "[PASS] PriorArt Test." << std::endl;
    return 0;
}
