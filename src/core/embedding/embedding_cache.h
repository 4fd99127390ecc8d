#pragma once

#include <QString>

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace im {

struct EmbeddingCacheConfig {
    int maxEntries = 256;   // 0 disables caching
    int ttlSeconds = 3600;
};

// LRU + TTL cache of embeddings keyed by (provider identity, processed text).
// Safe to share between threads.
class EmbeddingCache {
public:
    explicit EmbeddingCache(EmbeddingCacheConfig config = {});

    // Returns the cached vector or nullopt. Lazily evicts expired entries.
    std::optional<std::vector<float>> get(const QString& providerId, const QString& text);
    void put(const QString& providerId, const QString& text, const std::vector<float>& embedding);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

    static QString cacheKey(const QString& providerId, const QString& text);

private:
    struct Entry {
        QString key;
        std::vector<float> value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    EmbeddingCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace im
