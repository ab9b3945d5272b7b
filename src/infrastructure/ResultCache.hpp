/**
 * @file ResultCache.hpp
 * @brief Expiring key/value store for embeddings and analysis results.
 */

#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace patentlens::infrastructure {

class PersistenceService;

/**
 * @class ResultCache
 * @brief Thread-safe JSON value cache with per-entry expiry.
 *
 * Values are deterministic functions of their keys, so concurrent writers of
 * the same key are harmless; the last write wins.
 */
class ResultCache {
public:
    /** @brief Seconds since the Unix epoch. */
    using Clock = std::function<std::int64_t()>;

    /**
     * @param filePath JSON file used by persist()/load(); empty disables persistence.
     * @param defaultTtlSeconds Lifetime for put() calls that pass no TTL.
     */
    explicit ResultCache(std::string filePath = "", std::int64_t defaultTtlSeconds = 3600, Clock clock = nullptr);

    void put(const std::string& key, const nlohmann::json& value, std::optional<std::int64_t> ttlSeconds = std::nullopt);

    /** @brief The value, unless missing or expired. Expired entries are evicted. */
    std::optional<nlohmann::json> get(const std::string& key);

    void erase(const std::string& key);

    /** @brief Drops expired entries; returns how many were removed. */
    size_t purgeExpired();

    size_t size() const;

    /**
     * @brief Queues the live entries as an atomic replacement of the backing
     *        file on @p persistence.
     */
    void persist(PersistenceService& persistence) const;

    /** @brief Replaces the contents with the backing file's live entries. */
    void load();

    std::int64_t defaultTtl() const { return m_defaultTtl; }

    /** @brief Stable hex digest of a text, for content-addressed keys. */
    static std::string HashKey(const std::string& prefix, const std::string& text);

private:
    struct CacheEntry {
        nlohmann::json value;
        std::int64_t expiresAt;
    };

    std::string m_filePath;
    std::int64_t m_defaultTtl;
    Clock m_clock;
    mutable std::mutex m_mutex;
    std::map<std::string, CacheEntry> m_entries;
};

} // namespace patentlens::infrastructure
