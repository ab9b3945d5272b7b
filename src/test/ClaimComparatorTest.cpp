#include <cassert>
#include <iostream>
#include <limits>

#include "application/ClaimComparator.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using application::ClaimComparator;
using application::ClaimComparisonSettings;
using domain::Claim;
using domain::RiskLevel;
using test::Near;

static Claim MakeClaim(const std::string& documentId, int number, std::vector<float> embedding, bool independent = true) {
    Claim claim;
    claim.documentId = documentId;
    claim.number = number;
    claim.text = "Claim text " + std::to_string(number);
    claim.isIndependent = independent;
    if (!independent) claim.parentNumber = 1;
    claim.embedding = std::move(embedding);
    return claim;
}

static void TestSelfComparison() {
    std::vector<Claim> claims = {
        MakeClaim("US1", 1, {1, 0, 0}),
        MakeClaim("US1", 2, {0, 1, 0}),
        MakeClaim("US1", 3, {0, 0, 1})
    };
    ClaimComparator comparator{ClaimComparisonSettings{}};

    auto result = comparator.compare(claims, claims);
    assert(!result.message);
    assert(result.sourceClaimsCount == 3 && result.targetClaimsCount == 3);
    assert(result.totalMatches == 3);
    assert(Near(result.highestSimilarity, 1.0));
    assert(Near(result.averageSimilarity, 1.0));
    assert(result.independentClaimsAtRisk == 3);
    assert(result.overallRisk == RiskLevel::High);
    assert(result.topMatches.size() == 3);
    for (const auto& match : result.topMatches) {
        assert(match.source.number == match.target.number);
        assert(match.risk == RiskLevel::High);
    }

    auto again = comparator.compare(claims, claims);
    assert(again.totalMatches == result.totalMatches);
    for (size_t i = 0; i < again.topMatches.size(); ++i) {
        assert(again.topMatches[i].source.number == result.topMatches[i].source.number);
        assert(again.topMatches[i].target.number == result.topMatches[i].target.number);
    }
    std::cout << "[PASS] Self comparison is high risk and repeatable." << std::endl;
}

static void TestEmptySide() {
    ClaimComparator comparator{ClaimComparisonSettings{}};
    std::vector<Claim> source = {MakeClaim("US1", 1, {1, 0})};

    auto result = comparator.compare(source, {});
    assert(result.overallRisk == RiskLevel::Unknown);
    assert(result.message && *result.message == ClaimComparator::kUnparsedMessage);
    assert(result.recommendation == ClaimComparator::kUnparsedRecommendation);
    assert(result.totalMatches == 0);
    assert(result.topMatches.empty());
    std::cout << "[PASS] Empty side reports unparsed claims." << std::endl;
}

static void TestFiltering() {
    ClaimComparisonSettings settings;
    settings.topMatches = 2;
    ClaimComparator comparator{settings};

    std::vector<Claim> source = {
        MakeClaim("A", 1, {1, 0}),
        MakeClaim("A", 2, {0.7f, 0.714f}, false),
        MakeClaim("A", 3, {}),
        MakeClaim("A", 4, {1, 0, 0})
    };
    std::vector<Claim> target = {
        MakeClaim("B", 1, {1, 0}),
        MakeClaim("B", 2, {0, 1})
    };

    auto result = comparator.compare(source, target);
    // 1-1 (1.0), 2-1 (~0.7), 2-2 (~0.714); claims 3 and 4 are not comparable.
    assert(result.totalMatches == 3);
    assert(result.topMatches.size() == 2);
    assert(result.topMatches[0].source.number == 1);
    assert(result.topMatches[1].source.number == 2 && result.topMatches[1].target.number == 2);
    assert(result.independentClaimsAtRisk == 1);
    assert(result.averageSimilarity < result.highestSimilarity);

    std::vector<Claim> unrelatedSource = {MakeClaim("A", 1, {1, 0})};
    std::vector<Claim> unrelatedTarget = {MakeClaim("B", 1, {0, 1})};
    auto none = comparator.compare(unrelatedSource, unrelatedTarget);
    assert(none.totalMatches == 0);
    assert(none.overallRisk == RiskLevel::Low);
    assert(!none.message);
    std::cout << "[PASS] Pairs below the minimum or without embeddings are skipped." << std::endl;
}

static void TestParallelMatchesSerial() {
    std::vector<Claim> source;
    std::vector<Claim> target;
    for (int i = 0; i < 80; ++i) {
        source.push_back(MakeClaim("S", i + 1, {1.0f + i % 7, 1.0f + (i * 3) % 5, 1.0f + (i * 5) % 11}));
        target.push_back(MakeClaim("T", i + 1, {1.0f + (i * 2) % 9, 1.0f + i % 4, 1.0f + (i * 7) % 6}));
    }

    ClaimComparisonSettings parallel;
    parallel.parallelPairThreshold = 4096;
    ClaimComparisonSettings serial;
    serial.parallelPairThreshold = std::numeric_limits<size_t>::max();

    auto a = ClaimComparator{parallel}.compare(source, target);
    auto b = ClaimComparator{serial}.compare(source, target);

    assert(a.totalMatches == b.totalMatches);
    assert(a.topMatches.size() == b.topMatches.size());
    assert(a.highestSimilarity == b.highestSimilarity);
    assert(a.independentClaimsAtRisk == b.independentClaimsAtRisk);
    for (size_t i = 0; i < a.topMatches.size(); ++i) {
        assert(a.topMatches[i].source.number == b.topMatches[i].source.number);
        assert(a.topMatches[i].target.number == b.topMatches[i].target.number);
        assert(a.topMatches[i].similarity == b.topMatches[i].similarity);
    }
    std::cout << "[PASS] Parallel scoring matches serial ordering." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ClaimComparator Test..." << std::endl;
    TestSelfComparison();
    TestEmptySide();
    TestFiltering();
    TestParallelMatchesSerial();
    std::cout << "[PASS] ClaimComparator Test." << std::endl;
    return 0;
}
