#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "infrastructure/CachedEmbeddingService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ResultCache.hpp"
#include "TestFakes.hpp"

using namespace patentlens;
using infrastructure::ResultCache;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting ResultCache Test..." << std::endl;

    std::int64_t now = 1000;
    auto clock = [&now]() { return now; };

    ResultCache cache("", 60, clock);
    cache.put("short", json{{"v", 1}});
    cache.put("long", json{{"v", 2}}, 600);
    assert(cache.get("short") && (*cache.get("short"))["v"] == 1);

    now += 60;
    assert(!cache.get("short"));
    assert(cache.get("long"));
    assert(cache.size() == 1);

    now += 600;
    assert(cache.purgeExpired() == 1);
    assert(cache.size() == 0);
    std::cout << "[PASS] Entries expire by their own TTL." << std::endl;

    const std::string key = ResultCache::HashKey("embedding", "some text");
    assert(key == ResultCache::HashKey("embedding", "some text"));
    assert(key != ResultCache::HashKey("embedding", "some text!"));
    assert(key.rfind("embedding:", 0) == 0);

    // Persistence round trip keeps only live entries.
    const std::string path = "test_result_cache/results.json";
    std::filesystem::remove_all("test_result_cache");
    std::filesystem::create_directories("test_result_cache");
    {
        std::ofstream stale(path);
        stale << "{\"stale\": {\"value\": 1, \"expires_at\": 99999999999}, \"padding\": \"" << std::string(4096, 'p') << "\"}";
    }
    {
        infrastructure::PersistenceService persistence;
        ResultCache writer(path, 60, clock);
        writer.put("live", json::array({1, 2, 3}), 3600);
        writer.put("dying", json("x"), 10);
        writer.put("text", json(std::string("caf\xC3")), 3600); // truncated UTF-8 sequence
        writer.persist(persistence);
        persistence.flush();
        assert(persistence.failedWrites() == 0);
    }
    size_t leftovers = 0;
    for (const auto& entry : std::filesystem::directory_iterator("test_result_cache")) {
        if (entry.path().extension() == ".tmp") ++leftovers;
    }
    assert(leftovers == 0);
    now += 30;
    {
        ResultCache reader(path, 60, clock);
        reader.load();
        assert(reader.size() == 2);
        assert(reader.get("live")->size() == 3);
        assert(!reader.get("stale"));
        assert(reader.get("text")->get<std::string>().rfind("caf", 0) == 0);
    }
    std::cout << "[PASS] Cache file round trip." << std::endl;

    auto inner = std::make_shared<test::FakeEmbeddingService>(3);
    auto shared = std::make_shared<ResultCache>("", 60, clock);
    infrastructure::CachedEmbeddingService cached(inner, shared, 60 * 24);

    auto first = cached.embed("a claim about gears");
    auto second = cached.embed("a claim about gears");
    assert(first == second);
    assert(inner->calls == 1);
    assert(cached.dimensions() == 3);

    shared->put(ResultCache::HashKey("embedding", "bad entry"), json::array({1.0}));
    auto repaired = cached.embed("bad entry");
    assert(repaired.size() == 3);
    assert(inner->calls == 2);

    now += 60 * 24;
    cached.embed("a claim about gears");
    assert(inner->calls == 3);
    std::cout << "[PASS] Embedding cache hits, repairs and expiry." << std::endl;

    std::filesystem::remove_all("test_result_cache");
    std::cout << "[PASS] ResultCache Test." << std::endl;
    return 0;
}
