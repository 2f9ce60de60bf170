#pragma once

#include "core/index/sqlite_store.h"
#include "core/index/store_adapter.h"
#include "core/vector/vector_index.h"

#include <memory>

namespace dq {

struct RetrievalConfig {
    int dimensions = 384;
    // Caps on each side's result list; 0 returns every match in scope.
    int semanticCandidates = 0;
    int keywordCandidates = 0;
    double keywordRankScale = 2.0;
};

// StoreAdapter over SQLite rows plus an in-memory HNSW index of the
// embeddings table. The index is rebuilt from SQLite by open(); writes go to
// SQLite first and then to the index.
class RetrievalStore : public StoreAdapter {
public:
    RetrievalStore(SQLiteStore& store, RetrievalConfig config = {});
    ~RetrievalStore() override;

    RetrievalStore(const RetrievalStore&) = delete;
    RetrievalStore& operator=(const RetrievalStore&) = delete;

    // Creates the vector index and loads every stored embedding into it.
    bool open();
    bool rebuildVectorIndex();

    std::optional<std::vector<int64_t>> putChunks(int64_t documentId,
                                                  const std::vector<Chunk>& chunks) override;
    bool putEmbedding(int64_t chunkId, const std::vector<float>& vector) override;
    std::vector<int64_t> chunksMissingEmbedding(int64_t documentId) override;
    std::vector<ScoredChunk> semanticSearch(const std::vector<float>& queryVector,
                                            const std::vector<int64_t>& documentIds,
                                            float scoreFloor) override;
    std::vector<ScoredChunk> keywordSearch(const QString& queryText,
                                           const std::vector<int64_t>& documentIds) override;

    // Removes the document's vectors from the index, then its rows.
    bool deleteDocument(int64_t documentId) override;

    // Term-frequency rank of one chunk: each query term contributes
    // 0.1 * (1 + 1/2^2 + ... + 1/tf^2) / (pi^2 / 6), averaged over the query
    // terms, so a term present once gives 0.0608 and the ceiling is 0.1.
    // Independent of collection statistics.
    static double termFrequencyRank(const std::vector<int>& termFrequencies);

    // rank * rankScale, capped at 1.
    static float keywordScore(const std::vector<int>& termFrequencies, double rankScale);

    SQLiteStore& sqlite() { return m_store; }
    const VectorIndex& vectorIndex() const { return *m_index; }
    const RetrievalConfig& config() const { return m_config; }

private:
    SQLiteStore& m_store;
    RetrievalConfig m_config;
    std::unique_ptr<VectorIndex> m_index;
};

} // namespace dq
