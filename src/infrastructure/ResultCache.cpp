/**
 * @file ResultCache.cpp
 * @brief Implementation of ResultCache.
 */

#include "infrastructure/ResultCache.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace patentlens::infrastructure {

ResultCache::ResultCache(std::string filePath, std::int64_t defaultTtlSeconds, Clock clock)
    : m_filePath(std::move(filePath)), m_defaultTtl(defaultTtlSeconds), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = []() {
            return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        };
    }
}

void ResultCache::put(const std::string& key, const json& value, std::optional<std::int64_t> ttlSeconds) {
    const std::int64_t expiresAt = m_clock() + ttlSeconds.value_or(m_defaultTtl);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[key] = {value, expiresAt};
}

std::optional<json> ResultCache::get(const std::string& key) {
    const std::int64_t now = m_clock();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    if (it->second.expiresAt <= now) {
        m_entries.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void ResultCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(key);
}

size_t ResultCache::purgeExpired() {
    const std::int64_t now = m_clock();
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expiresAt <= now) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void ResultCache::persist(PersistenceService& persistence) const {
    if (m_filePath.empty()) return;

    const std::int64_t now = m_clock();
    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, entry] : m_entries) {
            if (entry.expiresAt <= now) continue;
            j[key] = { {"value", entry.value}, {"expires_at", entry.expiresAt} };
        }
    }

    persistence.saveTextAsync(m_filePath, j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void ResultCache::load() {
    if (m_filePath.empty() || !fs::exists(m_filePath)) return;

    try {
        std::ifstream f(m_filePath);
        if (!f.is_open()) return;

        json j = json::parse(f);
        const std::int64_t now = m_clock();
        std::map<std::string, CacheEntry> loaded;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& node = it.value();
            if (!node.contains("value") || !node.contains("expires_at")) continue;
            std::int64_t expiresAt = node["expires_at"].get<std::int64_t>();
            if (expiresAt <= now) continue;
            loaded[it.key()] = {node["value"], expiresAt};
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(loaded);
    } catch (const json::exception& e) {
        std::cerr << "[ResultCache] Ignoring unreadable cache file " << m_filePath << ": " << e.what() << std::endl;
    }
}

std::string ResultCache::HashKey(const std::string& prefix, const std::string& text) {
    // FNV-1a, 64 bit.
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream ss;
    ss << prefix << ":" << std::hex << std::setw(16) << std::setfill('0') << hash << ":" << text.size();
    return ss.str();
}

} // namespace patentlens::infrastructure
