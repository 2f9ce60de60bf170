#include "core/query/answer_cache.h"
#include "core/shared/logging.h"
#include "core/shared/vector_math.h"

namespace dq {

AnswerCache::AnswerCache(SQLiteStore& store)
    : m_store(store)
{
}

std::optional<CacheHit> AnswerCache::lookup(const std::vector<float>& questionVector,
                                            RoleTag role,
                                            float similarityThreshold)
{
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.lookups;
    }

    const QString roleName = roleTagToString(role);
    std::optional<int64_t> bestId;
    float bestSimilarity = 0.0f;
    for (const SQLiteStore::CacheRow& row : m_store.cacheEntriesForRole(roleName)) {
        const float similarity = cosineSimilarity(questionVector, row.embedding);
        if (similarity < similarityThreshold) {
            continue;
        }
        if (!bestId || similarity > bestSimilarity) {
            bestId = row.id;
            bestSimilarity = similarity;
        }
    }

    if (!bestId) {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.misses;
        LOG_DEBUG(dqCache, "Cache miss for role %s", qPrintable(roleName));
        return std::nullopt;
    }

    auto updated = m_store.recordCacheHit(*bestId);
    if (!updated) {
        // Pruned or deleted between the scan and the hit update
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.misses;
        LOG_WARN(dqCache, "Cache entry %lld vanished before its hit was recorded",
                 static_cast<long long>(*bestId));
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.hits;
    }
    LOG_DEBUG(dqCache, "Cache hit %lld (similarity %.3f, hits %d)",
              static_cast<long long>(updated->id), bestSimilarity, updated->hitCount);
    return CacheHit{std::move(*updated), bestSimilarity};
}

bool AnswerCache::save(const QString& question,
                       const std::vector<float>& questionVector,
                       const QString& answer,
                       const QJsonArray& sources,
                       RoleTag role)
{
    const bool ok = m_store.upsertCacheEntry(question, roleTagToString(role),
                                             normalizeVector(questionVector),
                                             answer, sources);
    std::lock_guard<std::mutex> lock(m_statsMutex);
    if (ok) {
        ++m_stats.saves;
    } else {
        ++m_stats.saveFailures;
    }
    return ok;
}

std::optional<int> AnswerCache::prune(const QDateTime& now, int retentionDays, int minHits)
{
    const QDateTime cutoff = now.addDays(-static_cast<qint64>(retentionDays));
    auto removed = m_store.pruneCacheEntries(cutoff, minHits);
    if (removed) {
        LOG_INFO(dqCache, "Pruned %d cache entries older than %d days with fewer than %d hits",
                 *removed, retentionDays, minHits);
    }
    return removed;
}

AnswerCache::Stats AnswerCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

} // namespace dq
