#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "application/EmbeddingPipeline.hpp"
#include <nlohmann/json.hpp>
#include "TestFakes.hpp"

using namespace patentlens;
using application::EmbeddingPipeline;
using application::EmbeddingSettings;

namespace {

EmbeddingSettings Settings(size_t dimensions) {
    EmbeddingSettings settings;
    settings.dimensions = dimensions;
    return settings;
}

void TestChunking() {
    assert(EmbeddingPipeline::ChunkText("short text", 2000, 200).size() == 1);

    std::string prose;
    for (int i = 0; prose.size() < 5000; ++i) {
        prose += "Sentence number " + std::to_string(i) + " describes the apparatus. ";
    }
    auto chunks = EmbeddingPipeline::ChunkText(prose, 2000, 200);
    assert(chunks.size() >= 3);
    for (size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].size() <= 2000);
        if (i + 1 < chunks.size()) {
            assert(chunks[i].back() == '.');
            assert(chunks[i].find(chunks[i + 1].substr(0, 40)) != std::string::npos);
        }
    }
    assert(chunks.back().size() >= 10);
    assert(prose.find(chunks.back()) + chunks.back().size() + 1 == prose.size());

    auto hard = EmbeddingPipeline::ChunkText(std::string(4500, 'x'), 2000, 200);
    assert(hard.size() == 3);
    assert(hard[0].size() == 2000 && hard[1].size() == 2000 && hard[2].size() == 900);
    std::cout << "[PASS] Chunking prefers sentence boundaries and stops at the end." << std::endl;

    // Hard cuts and overlap starts back off to a character boundary.
    const std::string micro = std::string(1999, 'x') + "\xC2\xB5" + std::string(600, 'y');
    auto wide = EmbeddingPipeline::ChunkText(micro, 2000, 200);
    assert(wide.size() == 2);
    assert(wide[0] == std::string(1999, 'x'));
    assert(wide[1].rfind(std::string(200, 'x') + "\xC2\xB5", 0) == 0);
    for (const auto& chunk : wide) {
        assert(!nlohmann::json(chunk).dump().empty());
    }
    std::cout << "[PASS] Chunking keeps multi-byte characters whole." << std::endl;
}

void TestEmbedText() {
    auto fake = std::make_shared<test::FakeEmbeddingService>(4);
    EmbeddingPipeline pipeline(fake, Settings(4));

    auto zero = pipeline.embedText("  \n ");
    assert(zero.size() == 4);
    for (float v : zero) assert(v == 0.0f);
    assert(fake->calls == 0);

    fake->set("trimmed", {1, 2, 3, 4});
    assert(pipeline.embedText("  trimmed \n") == std::vector<float>({1, 2, 3, 4}));

    EmbeddingPipeline mismatched(fake, Settings(3));
    bool threw = false;
    try {
        mismatched.embedText("abc");
    } catch (const domain::ProviderError& e) {
        threw = e.kind() == domain::ProviderErrorKind::MalformedResponse && !e.isRetryable();
    }
    assert(threw);
    std::cout << "[PASS] Text embedding validates dimensions." << std::endl;
}

void TestClaimAndDocumentText() {
    auto fake = std::make_shared<test::FakeEmbeddingService>(4);
    auto settings = Settings(4);
    settings.documentClaimsChars = 10;
    EmbeddingPipeline pipeline(fake, settings);

    fake->set("Patent Claim 3: A widget.", {0, 0, 1, 0});
    assert(pipeline.embedClaim(3, "A widget.") == std::vector<float>({0, 0, 1, 0}));

    domain::Document doc;
    doc.title = "Widget";
    doc.abstract = "A small widget.";
    doc.claimsText = std::string("1. A widget comprising a spring.");
    fake->set("Title: Widget\n\nAbstract: A small widget.\n\nClaims: 1. A widge", {0, 1, 0, 0});
    assert(pipeline.embedDocument(doc) == std::vector<float>({0, 1, 0, 0}));
    std::cout << "[PASS] Claim and document embedding text." << std::endl;
}

void TestChunkedMean() {
    auto fake = std::make_shared<test::FakeEmbeddingService>(4);
    EmbeddingPipeline pipeline(fake, Settings(4));

    std::string longClaim;
    while (longClaim.size() < 4500) longClaim += "a rotor coupled to a shaft; ";
    auto vec = pipeline.embedClaim(1, longClaim);
    assert(vec.size() == 4);

    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    assert(test::Near(std::sqrt(norm), 1.0));
    assert(fake->calls > 1);
    std::cout << "[PASS] Long claims are chunked, averaged and normalized." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EmbeddingPipeline Test..." << std::endl;
    TestChunking();
    TestEmbedText();
    TestClaimAndDocumentText();
    TestChunkedMean();
    std::cout << "[PASS] EmbeddingPipeline Test." << std::endl;
    return 0;
}
