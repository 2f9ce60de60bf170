#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/hashing_embedding_provider.h"
#include "core/extraction/extractor.h"
#include "core/generation/answer_generator.h"
#include "core/index/store_adapter.h"

#include <QHash>
#include <QString>

#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

namespace dq::test {

// Hashing embedder that counts calls, fails on demand and can be slowed.
class ScriptedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit ScriptedEmbeddingProvider(int dimensions = 64);

    EmbeddingResult embed(const QString& text, const Deadline& deadline) override;
    int dimensions() const override { return m_hashing.dimensions(); }
    QString modelId() const override { return QStringLiteral("scripted"); }

    // Texts containing the marker fail with Unavailable.
    void setFailureMarker(const QString& marker);
    // Every call fails.
    void setFailAll(bool failAll) { m_failAll.store(failAll); }
    // Each call sleeps this long, returning Cancelled if the deadline passes.
    void setDelay(std::chrono::milliseconds delay) { m_delayMs.store(static_cast<int>(delay.count())); }
    // Pin the vector returned for an exact text.
    void setVector(const QString& text, std::vector<float> vector);

    int calls() const { return m_calls.load(); }
    void resetCalls() { m_calls.store(0); }

private:
    HashingEmbeddingProvider m_hashing;
    std::atomic<int> m_calls{0};
    std::atomic<bool> m_failAll{false};
    std::atomic<int> m_delayMs{0};
    mutable std::mutex m_mutex;
    QString m_failureMarker;
    QHash<QString, std::vector<float>> m_pinned;
};

// Generator returning a canned answer, or failing.
class FakeAnswerGenerator : public AnswerGenerator {
public:
    GenerationResult answer(const QString& question,
                            const std::vector<RankedPassage>& passages,
                            const Deadline& deadline) override;

    void setAnswer(const QString& answer) { m_answer = answer; }
    void setUnavailable(bool unavailable) { m_unavailable = unavailable; }

    int calls() const { return m_calls.load(); }
    void resetCalls() { m_calls.store(0); }
    size_t lastPassageCount() const { return m_lastPassageCount.load(); }

private:
    QString m_answer = QStringLiteral("The answer is in the documents.");
    bool m_unavailable = false;
    std::atomic<int> m_calls{0};
    std::atomic<size_t> m_lastPassageCount{0};
};

// Extractor that never produces text.
class FailingExtractor : public ContentExtractor {
public:
    ExtractionResult extract(const QByteArray& rawBytes, const QString& mediaType) override;
    bool supports(const QString& mediaType) const override;
};

// StoreAdapter serving fixed result lists, for ranker tests.
class ScriptedStoreAdapter : public StoreAdapter {
public:
    std::vector<ScoredChunk> semanticResults;
    std::vector<ScoredChunk> keywordResults;
    std::chrono::milliseconds keywordDelay{0};
    bool semanticThrows = false;

    std::optional<std::vector<int64_t>> putChunks(int64_t documentId,
                                                  const std::vector<Chunk>& chunks) override;
    bool putEmbedding(int64_t chunkId, const std::vector<float>& vector) override;
    std::vector<int64_t> chunksMissingEmbedding(int64_t documentId) override;
    std::vector<ScoredChunk> semanticSearch(const std::vector<float>& queryVector,
                                            const std::vector<int64_t>& documentIds,
                                            float scoreFloor) override;
    std::vector<ScoredChunk> keywordSearch(const QString& queryText,
                                           const std::vector<int64_t>& documentIds) override;
    bool deleteDocument(int64_t documentId) override;
};

// Prose of roughly the requested length built from numbered sentences.
QString makeProse(int approximateLength);

} // namespace dq::test
