#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/CorpusFile.hpp"
#include "infrastructure/InMemoryPatentRepository.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using infrastructure::InMemoryPatentRepository;

namespace {

domain::Document MakeDocument(const std::string& id, std::vector<float> embedding) {
    domain::Document doc;
    doc.id = id;
    doc.patentNumber = id;
    doc.title = "Title " + id;
    doc.abstract = "Abstract " + id;
    doc.embedding = std::move(embedding);
    return doc;
}

domain::Claim MakeClaim(const std::string& id, int number, std::vector<float> embedding) {
    domain::Claim claim;
    claim.documentId = id;
    claim.number = number;
    claim.text = "claim " + std::to_string(number) + " of " + id;
    claim.isIndependent = number == 1;
    if (number != 1) claim.parentNumber = 1;
    claim.type = domain::ClaimType::Method;
    claim.keyElements = {"rotor", "stator"};
    claim.embedding = std::move(embedding);
    return claim;
}

void TestQueries() {
    InMemoryPatentRepository repo;
    repo.saveDocument(MakeDocument("A", {1, 0}));
    repo.saveDocument(MakeDocument("B", {0, 1}));
    repo.saveDocument(MakeDocument("C", {}));
    repo.saveDocument(MakeDocument("D", {1, 0, 0}));

    auto updated = MakeDocument("A", {0.8f, 0.6f});
    updated.title = "Renamed";
    repo.saveDocument(updated);
    assert(repo.documentCount() == 4);
    assert(repo.findDocument("A")->title == "Renamed");
    assert(repo.listDocuments(10).front().id == "A");
    assert(repo.listDocuments(2, 1).size() == 2);
    assert(repo.listDocuments(2, 1)[0].id == "B");
    assert(!repo.findDocument("Z"));

    auto nearest = repo.nearestDocuments({0, 1}, 10);
    assert(nearest.size() == 2);
    assert(nearest[0].id == "B");
    assert(test::Near(nearest[0].distance, 0.0));
    assert(repo.nearestDocuments({0, 1}, 1).size() == 1);

    repo.replaceClaims("A", {MakeClaim("A", 2, {0, 1}), MakeClaim("A", 1, {1, 0})});
    repo.replaceClaims("B", {MakeClaim("B", 1, {0.6f, 0.8f})});
    auto claims = repo.claimsFor("A");
    assert(claims.size() == 2 && claims[0].number == 1);

    auto hits = repo.nearestClaims({0, 1}, 10);
    assert(hits.size() == 3);
    assert(hits[0].documentId == "A" && hits[0].claimNumber == 2);
    auto excluded = repo.nearestClaims({0, 1}, 10, std::string("A"));
    assert(excluded.size() == 1 && excluded[0].documentId == "B");

    repo.replaceClaims("A", {});
    assert(repo.claimsFor("A").empty());
    std::cout << "[PASS] Repository queries." << std::endl;
}

void TestSnapshot() {
    InMemoryPatentRepository repo;
    auto doc = MakeDocument("US7", {0.5f, 0.5f});
    doc.claimsText = std::string("1. A method of spinning.");
    doc.classification = "H02K";
    repo.saveDocument(doc);
    repo.replaceClaims("US7", {MakeClaim("US7", 1, {1, 0}), MakeClaim("US7", 2, {0, 1})});

    InMemoryPatentRepository copy;
    copy.loadJson(repo.toJson());
    auto restored = copy.findDocument("US7");
    assert(restored);
    assert(restored->classification == "H02K");
    assert(restored->claimsText == std::string("1. A method of spinning."));
    assert(restored->embedding.size() == 2);

    auto claims = copy.claimsFor("US7");
    assert(claims.size() == 2);
    assert(claims[1].parentNumber == 1);
    assert(claims[1].type == domain::ClaimType::Method);
    assert(claims[1].keyElements.size() == 2);
    assert(claims[1].embedding.size() == 2);

    assert(!copy.loadFile("does/not/exist.json"));
    std::cout << "[PASS] Snapshot round trip." << std::endl;
}

void TestCorpusFile() {
    const std::string dir = "test_corpus_file";
    std::filesystem::create_directories(dir);
    {
        std::ofstream(dir + "/wrapped.json") << R"({"patents": [{"title": "T", "abstract": "A", "patent_number": "EP9", "claims": "1. X"}, 7]})";
        std::ofstream(dir + "/array.json") << R"([{"id": "a", "title": "T", "abstract": "A"}])";
        std::ofstream(dir + "/broken.json") << R"({"patents": )";
        std::ofstream(dir + "/scalar.json") << R"({"count": 3})";
    }

    auto wrapped = infrastructure::CorpusFile::Load(dir + "/wrapped.json");
    assert(wrapped.size() == 1);
    assert(wrapped[0].patentNumber == "EP9");
    assert(wrapped[0].claimsText == std::string("1. X"));
    assert(infrastructure::CorpusFile::Load(dir + "/array.json")[0].id == "a");

    int failures = 0;
    try { infrastructure::CorpusFile::Load(dir + "/broken.json"); } catch (const std::runtime_error&) { ++failures; }
    try { infrastructure::CorpusFile::Load(dir + "/scalar.json"); } catch (const std::runtime_error&) { ++failures; }
    try { infrastructure::CorpusFile::Load(dir + "/missing.json"); } catch (const std::runtime_error&) { ++failures; }
    assert(failures == 3);

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] Corpus file formats." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PatentRepository Test..." << std::endl;
    TestQueries();
    TestSnapshot();
    TestCorpusFile();
    std::cout << "[PASS] PatentRepository Test." << std::endl;
    return 0;
}
