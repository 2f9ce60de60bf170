#include "core/ranking/hybrid_ranker.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_map>

namespace dq {

namespace {

constexpr int kSubSearchWorkers = 2;

struct FusionEntry {
    int64_t chunkId = 0;
    float semantic = 0.0f;
    float keyword = 0.0f;
    bool hasSemantic = false;
    bool hasKeyword = false;
};

// Waits for one side; empty on timeout or failure.
std::vector<ScoredChunk> collectSide(std::future<std::vector<ScoredChunk>>& future,
                                     const Deadline& sideDeadline,
                                     const char* side,
                                     bool& degraded)
{
    const auto wait = sideDeadline.remaining().value_or(std::chrono::milliseconds(0));
    if (sideDeadline.isCancelled()
        || future.wait_for(wait) != std::future_status::ready) {
        LOG_WARN(dqRanking, "%s search did not finish in time, ranking without it", side);
        degraded = true;
        return {};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        LOG_WARN(dqRanking, "%s search failed: %s", side, e.what());
        degraded = true;
        return {};
    }
}

} // namespace

HybridRanker::HybridRanker(StoreAdapter& adapter, SQLiteStore& rows, RankerConfig config)
    : m_adapter(adapter)
    , m_rows(rows)
    , m_config(config)
    , m_pool(std::make_unique<WorkerPool>(kSubSearchWorkers))
{
}

HybridRanker::~HybridRanker() = default;

// ── Fusion ──────────────────────────────────────────────────

std::vector<RankedPassage> HybridRanker::merge(const std::vector<ScoredChunk>& semantic,
                                               const std::vector<ScoredChunk>& keyword,
                                               const RankerConfig& config)
{
    // Insertion order doubles as the tie-break: semantic rank order first,
    // then keyword-only entries in keyword rank order.
    std::vector<FusionEntry> entries;
    std::unordered_map<int64_t, size_t> positionById;
    entries.reserve(semantic.size() + keyword.size());
    positionById.reserve(semantic.size() + keyword.size());

    for (const ScoredChunk& hit : semantic) {
        auto it = positionById.find(hit.chunkId);
        if (it != positionById.end()) {
            FusionEntry& entry = entries[it->second];
            entry.semantic = std::max(entry.semantic, hit.score);
            continue;
        }
        positionById.emplace(hit.chunkId, entries.size());
        FusionEntry entry;
        entry.chunkId = hit.chunkId;
        entry.semantic = hit.score;
        entry.hasSemantic = true;
        entries.push_back(entry);
    }

    for (const ScoredChunk& hit : keyword) {
        auto it = positionById.find(hit.chunkId);
        if (it != positionById.end()) {
            FusionEntry& entry = entries[it->second];
            entry.keyword = entry.hasKeyword ? std::max(entry.keyword, hit.score) : hit.score;
            entry.hasKeyword = true;
            continue;
        }
        positionById.emplace(hit.chunkId, entries.size());
        FusionEntry entry;
        entry.chunkId = hit.chunkId;
        entry.keyword = hit.score;
        entry.hasKeyword = true;
        entries.push_back(entry);
    }

    std::vector<RankedPassage> merged;
    merged.reserve(entries.size());
    for (const FusionEntry& entry : entries) {
        RankedPassage passage;
        passage.chunkId = entry.chunkId;
        passage.semanticScore = entry.semantic;
        passage.keywordScore = entry.keyword;
        if (entry.hasSemantic && entry.hasKeyword) {
            passage.source = MatchSource::Hybrid;
            passage.score = entry.semantic * config.semanticWeight
                          + entry.keyword * config.keywordWeight;
        } else if (entry.hasSemantic) {
            passage.source = MatchSource::Semantic;
            passage.score = entry.semantic * config.semanticWeight;
        } else {
            passage.source = MatchSource::Keyword;
            passage.score = entry.keyword * config.keywordWeight;
        }
        merged.push_back(std::move(passage));
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const RankedPassage& lhs, const RankedPassage& rhs) {
                         return lhs.score > rhs.score;
                     });

    const size_t limit = static_cast<size_t>(std::max(config.limit, 0));
    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

// ── Search ──────────────────────────────────────────────────

HybridSearchResult HybridRanker::search(const QString& question,
                                        const std::vector<float>& questionVector,
                                        const std::vector<int64_t>& documentIds,
                                        const Deadline& deadline)
{
    HybridSearchResult result;
    if (documentIds.empty()) {
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    StoreAdapter& adapter = m_adapter;
    const float floor = m_config.semanticScoreFloor;

    // Jobs own copies of their inputs; a late job may outlive this call.
    auto semanticFuture = m_pool->run(
        [&adapter, questionVector, documentIds, floor]() {
            return adapter.semanticSearch(questionVector, documentIds, floor);
        });
    auto keywordFuture = m_pool->run(
        [&adapter, question, documentIds]() {
            return adapter.keywordSearch(question, documentIds);
        });

    const Deadline sideDeadline =
        deadline.narrowed(std::chrono::milliseconds(m_config.subSearchTimeoutMs));

    const std::vector<ScoredChunk> semantic =
        collectSide(semanticFuture, sideDeadline, "semantic", result.semanticDegraded);
    const std::vector<ScoredChunk> keyword =
        collectSide(keywordFuture, sideDeadline, "keyword", result.keywordDegraded);

    result.passages = merge(semantic, keyword, m_config);
    hydrate(result.passages);

    LOG_DEBUG(dqRanking, "Hybrid search: %zu semantic, %zu keyword -> %zu passages in %lld ms",
              semantic.size(), keyword.size(), result.passages.size(),
              static_cast<long long>(timer.elapsed()));
    return result;
}

void HybridRanker::hydrate(std::vector<RankedPassage>& passages)
{
    if (passages.empty()) {
        return;
    }

    std::vector<int64_t> ids;
    ids.reserve(passages.size());
    for (const RankedPassage& passage : passages) {
        ids.push_back(passage.chunkId);
    }

    std::unordered_map<int64_t, Chunk> chunksById;
    for (Chunk& chunk : m_rows.getChunks(ids)) {
        const int64_t id = chunk.id;
        chunksById.emplace(id, std::move(chunk));
    }

    std::unordered_map<int64_t, QString> filenames;
    std::vector<RankedPassage> hydrated;
    hydrated.reserve(passages.size());
    for (RankedPassage& passage : passages) {
        auto chunkIt = chunksById.find(passage.chunkId);
        if (chunkIt == chunksById.end()) {
            // Deleted between search and hydration
            continue;
        }
        const Chunk& chunk = chunkIt->second;
        passage.documentId = chunk.documentId;
        passage.chunkIndex = chunk.chunkIndex;
        passage.content = chunk.content;

        auto nameIt = filenames.find(chunk.documentId);
        if (nameIt == filenames.end()) {
            const auto document = m_rows.getDocument(chunk.documentId);
            nameIt = filenames.emplace(chunk.documentId,
                                       document ? document->filename : QString()).first;
        }
        passage.filename = nameIt->second;
        hydrated.push_back(std::move(passage));
    }
    passages = std::move(hydrated);
}

} // namespace dq
