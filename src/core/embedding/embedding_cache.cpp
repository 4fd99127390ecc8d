#include "core/embedding/embedding_cache.h"

namespace im {

EmbeddingCache::EmbeddingCache(EmbeddingCacheConfig config)
    : m_config(config)
{
}

QString EmbeddingCache::cacheKey(const QString& providerId, const QString& text)
{
    return providerId + QLatin1Char('\n') + text;
}

std::optional<std::vector<float>> EmbeddingCache::get(const QString& providerId,
                                                      const QString& text)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(cacheKey(providerId, text));
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    const auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - it->second->insertedAt);
    if (age.count() >= m_config.ttlSeconds) {
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return std::nullopt;
    }

    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->value;
}

void EmbeddingCache::put(const QString& providerId, const QString& text,
                         const std::vector<float>& embedding)
{
    if (m_config.maxEntries <= 0 || embedding.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const QString key = cacheKey(providerId, text);

    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        m_index.erase(m_list.back().key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({key, embedding, std::chrono::steady_clock::now()});
    m_index[key] = m_list.begin();
}

void EmbeddingCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

EmbeddingCache::Stats EmbeddingCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace im
