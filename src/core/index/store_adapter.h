#pragma once

#include "core/shared/chunk.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace dq {

struct ScoredChunk {
    int64_t chunkId = 0;
    float score = 0.0f;   // [0, 1], higher is better
};

// Storage seam used by ingestion and ranking. Every search is scoped to the
// caller-supplied document ids; implementations make no visibility decisions.
class StoreAdapter {
public:
    virtual ~StoreAdapter() = default;

    // Atomic batch. Returns new chunk ids in input order, or nullopt with
    // nothing written.
    virtual std::optional<std::vector<int64_t>> putChunks(int64_t documentId,
                                                          const std::vector<Chunk>& chunks) = 0;

    // Stores or replaces the embedding of one chunk.
    virtual bool putEmbedding(int64_t chunkId, const std::vector<float>& vector) = 0;

    // Chunks of the document without an embedding, read fresh.
    virtual std::vector<int64_t> chunksMissingEmbedding(int64_t documentId) = 0;

    // Cosine similarity ranking, only entries with score > scoreFloor.
    virtual std::vector<ScoredChunk> semanticSearch(const std::vector<float>& queryVector,
                                                    const std::vector<int64_t>& documentIds,
                                                    float scoreFloor) = 0;

    // Full-text ranking with scores saturated into [0, 1].
    virtual std::vector<ScoredChunk> keywordSearch(const QString& queryText,
                                                   const std::vector<int64_t>& documentIds) = 0;

    // Removes the document with its chunks and embeddings from every index.
    virtual bool deleteDocument(int64_t documentId) = 0;
};

} // namespace dq
