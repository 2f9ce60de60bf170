#pragma once

#include "core/index/store_adapter.h"
#include "core/indexing/worker_pool.h"
#include "core/shared/deadline.h"
#include "core/shared/passage.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <vector>

namespace dq {

class SQLiteStore;

struct RankerConfig {
    float semanticWeight = 0.6f;
    float keywordWeight = 0.4f;
    int limit = 20;
    float semanticScoreFloor = 0.2f;
    int subSearchTimeoutMs = 2000;
};

struct HybridSearchResult {
    std::vector<RankedPassage> passages;
    bool semanticDegraded = false;
    bool keywordDegraded = false;

    bool degraded() const { return semanticDegraded || keywordDegraded; }
};

// HybridRanker: semantic and keyword retrieval fused into one ranked list.
//
// Both sub-searches run on the ranker's own pool and are joined with a
// per-side timeout. A side that throws or misses the timeout contributes
// nothing and is reported as degraded; the other side still ranks.
class HybridRanker {
public:
    HybridRanker(StoreAdapter& adapter, SQLiteStore& rows, RankerConfig config = {});
    ~HybridRanker();

    HybridRanker(const HybridRanker&) = delete;
    HybridRanker& operator=(const HybridRanker&) = delete;

    HybridSearchResult search(const QString& question,
                              const std::vector<float>& questionVector,
                              const std::vector<int64_t>& documentIds,
                              const Deadline& deadline = Deadline::never());

    // Full outer join on chunk id. Entries found by both sides score
    // s * semanticWeight + k * keywordWeight and are tagged Hybrid; single-side
    // entries keep their own side's weighted score. Stable descending sort,
    // semantic entries first on ties, truncated to config.limit. Content and
    // filename are left empty.
    static std::vector<RankedPassage> merge(const std::vector<ScoredChunk>& semantic,
                                            const std::vector<ScoredChunk>& keyword,
                                            const RankerConfig& config);

    const RankerConfig& config() const { return m_config; }

private:
    void hydrate(std::vector<RankedPassage>& passages);

    StoreAdapter& m_adapter;
    SQLiteStore& m_rows;
    RankerConfig m_config;

    // Declared last: joins late sub-searches before the references above go.
    std::unique_ptr<WorkerPool> m_pool;
};

} // namespace dq
