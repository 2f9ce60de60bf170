#pragma once

#include "core/index/sqlite_store.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonArray>
#include <QString>

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace dq {

struct CacheHit {
    SQLiteStore::CacheRow entry;   // already reflects the recorded hit
    float similarity = 0.0f;
};

// AnswerCache: semantic cache of generated answers, scoped per role.
//
// Lookup compares the question embedding against every entry of the role and
// returns the single closest one at or above the threshold. Save is keyed on
// the exact question text; a repeat save refreshes the answer and counts as
// a hit.
class AnswerCache {
public:
    static constexpr float kDefaultThreshold = 0.85f;

    explicit AnswerCache(SQLiteStore& store);

    std::optional<CacheHit> lookup(const std::vector<float>& questionVector,
                                   RoleTag role,
                                   float similarityThreshold = kDefaultThreshold);

    bool save(const QString& question,
              const std::vector<float>& questionVector,
              const QString& answer,
              const QJsonArray& sources,
              RoleTag role);

    // Deletes entries created more than retentionDays before now that have
    // fewer than minHits hits. Returns the number removed.
    std::optional<int> prune(const QDateTime& now, int retentionDays = 90, int minHits = 3);

    struct Stats {
        uint64_t lookups = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t saves = 0;
        uint64_t saveFailures = 0;
    };
    Stats stats() const;

private:
    SQLiteStore& m_store;

    mutable std::mutex m_statsMutex;
    Stats m_stats;
};

} // namespace dq
