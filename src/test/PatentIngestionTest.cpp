#include <cassert>
#include <iostream>
#include <memory>

#include "application/PatentIngestionService.hpp"
#include "infrastructure/InMemoryPatentRepository.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using application::PatentIngestionService;

namespace {

domain::Document MakeDocument(const std::string& number, const std::string& claims) {
    domain::Document doc;
    doc.patentNumber = number;
    doc.title = "Valve " + number;
    doc.abstract = "A pressure valve.";
    if (!claims.empty()) doc.claimsText = claims;
    return doc;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PatentIngestion Test..." << std::endl;

    auto repo = std::make_shared<infrastructure::InMemoryPatentRepository>();
    auto embedder = std::make_shared<test::FakeEmbeddingService>(26);
    application::EmbeddingSettings settings;
    settings.dimensions = 26;
    auto pipeline = std::make_shared<application::EmbeddingPipeline>(embedder, settings);
    auto indexing = std::make_shared<application::ClaimIndexingService>(repo, pipeline);
    PatentIngestionService ingestion(repo, pipeline, indexing);

    int indexed = ingestion.ingest(MakeDocument("EP1",
        "1. A valve comprising a spring and a seat.\n2. The valve of claim 1, wherein the seat is brass.\n"));
    assert(indexed == 2);
    auto stored = repo->findDocument("EP1");
    assert(stored);
    assert(stored->embedding.size() == 26);
    assert(repo->claimsFor("EP1").size() == 2);
    std::cout << "[PASS] Document stored under its patent number with claims." << std::endl;

    auto precomputed = MakeDocument("EP2", "");
    precomputed.id = "custom-id";
    precomputed.embedding.assign(26, 0.5f);
    const int callsBefore = embedder->calls;
    assert(ingestion.ingest(precomputed) == 0);
    assert(embedder->calls == callsBefore);
    assert(repo->findDocument("custom-id")->embedding[0] == 0.5f);

    int rejected = 0;
    auto noTitle = MakeDocument("EP3", "");
    noTitle.title = "  ";
    try { ingestion.ingest(noTitle); } catch (const domain::InvalidInputError&) { ++rejected; }
    auto noId = MakeDocument("", "");
    try { ingestion.ingest(noId); } catch (const domain::InvalidInputError&) { ++rejected; }
    assert(rejected == 2);
    std::cout << "[PASS] Ingest validation." << std::endl;

    embedder->failWhenContains("Patent Claim");
    std::vector<std::string> statuses;
    auto result = ingestion.ingestAll({
        MakeDocument("EP1", "1. Duplicate claim text here."),
        MakeDocument("EP4", "1. A valve with a ceramic disc inside."),
        MakeDocument("", "")
    }, [&statuses](const std::string& status) { statuses.push_back(status); });

    assert(result.documentsReceived == 3);
    assert(result.documentsStored == 1);
    assert(result.claimsIndexed == 0);
    assert(result.errors.size() == 2);
    assert(result.errors[0] == "EP1: Already imported");
    assert(statuses.size() == 3);
    assert(repo->findDocument("EP4"));
    assert(repo->claimsFor("EP4").empty());
    std::cout << "[PASS] Batch import reports duplicates and failures." << std::endl;

    std::cout << "[PASS] PatentIngestion Test." << std::endl;
    return 0;
}
