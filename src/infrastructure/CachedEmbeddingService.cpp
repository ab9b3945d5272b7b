/**
 * @file CachedEmbeddingService.cpp
 * @brief Implementation of CachedEmbeddingService.
 */

#include "infrastructure/CachedEmbeddingService.hpp"
#include <iostream>

namespace patentlens::infrastructure {

CachedEmbeddingService::CachedEmbeddingService(std::shared_ptr<domain::EmbeddingService> inner,
                                               std::shared_ptr<ResultCache> cache,
                                               std::int64_t ttlSeconds)
    : m_inner(std::move(inner)), m_cache(std::move(cache)), m_ttlSeconds(ttlSeconds) {}

std::vector<float> CachedEmbeddingService::embed(const std::string& text) {
    const std::string key = ResultCache::HashKey("embedding", text);

    if (auto cached = m_cache->get(key)) {
        if (cached->is_array() && cached->size() == m_inner->dimensions()) {
            try {
                return cached->get<std::vector<float>>();
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[EmbeddingCache] Discarding bad entry: " << e.what() << std::endl;
            }
        }
        m_cache->erase(key);
    }

    auto vec = m_inner->embed(text);
    m_cache->put(key, vec, m_ttlSeconds);
    return vec;
}

} // namespace patentlens::infrastructure
