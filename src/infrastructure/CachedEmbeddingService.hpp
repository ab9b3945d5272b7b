/**
 * @file CachedEmbeddingService.hpp
 * @brief EmbeddingService decorator backed by the ResultCache.
 */

#pragma once
#include <cstdint>
#include <memory>
#include "domain/EmbeddingService.hpp"
#include "infrastructure/ResultCache.hpp"

namespace patentlens::infrastructure {

/**
 * @class CachedEmbeddingService
 * @brief Serves repeated texts from the cache; only misses reach the provider.
 */
class CachedEmbeddingService : public domain::EmbeddingService {
public:
    CachedEmbeddingService(std::shared_ptr<domain::EmbeddingService> inner,
                           std::shared_ptr<ResultCache> cache,
                           std::int64_t ttlSeconds);

    std::vector<float> embed(const std::string& text) override;
    size_t dimensions() const override { return m_inner->dimensions(); }

private:
    std::shared_ptr<domain::EmbeddingService> m_inner;
    std::shared_ptr<ResultCache> m_cache;
    std::int64_t m_ttlSeconds;
};

} // namespace patentlens::infrastructure
