#include "fake_providers.h"

#include <stdexcept>
#include <thread>

namespace dq::test {

// ── ScriptedEmbeddingProvider ───────────────────────────────

ScriptedEmbeddingProvider::ScriptedEmbeddingProvider(int dimensions)
    : m_hashing(dimensions)
{
}

void ScriptedEmbeddingProvider::setFailureMarker(const QString& marker)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failureMarker = marker;
}

void ScriptedEmbeddingProvider::setVector(const QString& text, std::vector<float> vector)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pinned.insert(text, std::move(vector));
}

EmbeddingResult ScriptedEmbeddingProvider::embed(const QString& text, const Deadline& deadline)
{
    m_calls.fetch_add(1);

    const int delayMs = m_delayMs.load();
    if (delayMs > 0) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
        while (std::chrono::steady_clock::now() < until) {
            if (deadline.expired()) {
                return EmbeddingResult::failure(EmbeddingResult::Status::Cancelled,
                                                QStringLiteral("deadline expired"));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    if (m_failAll.load()) {
        return EmbeddingResult::failure(EmbeddingResult::Status::Unavailable,
                                        QStringLiteral("provider down"));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_failureMarker.isEmpty() && text.contains(m_failureMarker)) {
            return EmbeddingResult::failure(EmbeddingResult::Status::Unavailable,
                                            QStringLiteral("scripted failure"));
        }
        auto pinned = m_pinned.constFind(text);
        if (pinned != m_pinned.constEnd()) {
            return EmbeddingResult::success(*pinned);
        }
    }
    return m_hashing.embed(text, deadline);
}

// ── FakeAnswerGenerator ─────────────────────────────────────

GenerationResult FakeAnswerGenerator::answer(const QString& question,
                                             const std::vector<RankedPassage>& passages,
                                             const Deadline& deadline)
{
    Q_UNUSED(question);
    m_calls.fetch_add(1);
    m_lastPassageCount.store(passages.size());

    GenerationResult result;
    if (deadline.expired()) {
        result.status = GenerationResult::Status::Cancelled;
        result.errorMessage = QStringLiteral("deadline expired");
        return result;
    }
    if (m_unavailable) {
        result.status = GenerationResult::Status::Unavailable;
        result.errorMessage = QStringLiteral("generator down");
        return result;
    }
    result.status = GenerationResult::Status::Success;
    result.answer = m_answer;
    return result;
}

// ── FailingExtractor ────────────────────────────────────────

ExtractionResult FailingExtractor::extract(const QByteArray& rawBytes, const QString& mediaType)
{
    Q_UNUSED(rawBytes);
    Q_UNUSED(mediaType);
    ExtractionResult result;
    result.status = ExtractionResult::Status::ExtractionFailed;
    result.errorMessage = QStringLiteral("corrupt file");
    return result;
}

bool FailingExtractor::supports(const QString& mediaType) const
{
    Q_UNUSED(mediaType);
    return true;
}

// ── ScriptedStoreAdapter ────────────────────────────────────

std::optional<std::vector<int64_t>> ScriptedStoreAdapter::putChunks(
    int64_t documentId, const std::vector<Chunk>& chunks)
{
    Q_UNUSED(documentId);
    std::vector<int64_t> ids;
    for (size_t i = 0; i < chunks.size(); ++i) {
        ids.push_back(static_cast<int64_t>(i) + 1);
    }
    return ids;
}

bool ScriptedStoreAdapter::putEmbedding(int64_t chunkId, const std::vector<float>& vector)
{
    Q_UNUSED(chunkId);
    Q_UNUSED(vector);
    return true;
}

std::vector<int64_t> ScriptedStoreAdapter::chunksMissingEmbedding(int64_t documentId)
{
    Q_UNUSED(documentId);
    return {};
}

std::vector<ScoredChunk> ScriptedStoreAdapter::semanticSearch(
    const std::vector<float>& queryVector, const std::vector<int64_t>& documentIds,
    float scoreFloor)
{
    Q_UNUSED(queryVector);
    Q_UNUSED(documentIds);
    Q_UNUSED(scoreFloor);
    if (semanticThrows) {
        throw std::runtime_error("vector index unavailable");
    }
    return semanticResults;
}

std::vector<ScoredChunk> ScriptedStoreAdapter::keywordSearch(
    const QString& queryText, const std::vector<int64_t>& documentIds)
{
    Q_UNUSED(queryText);
    Q_UNUSED(documentIds);
    if (keywordDelay.count() > 0) {
        std::this_thread::sleep_for(keywordDelay);
    }
    return keywordResults;
}

bool ScriptedStoreAdapter::deleteDocument(int64_t documentId)
{
    Q_UNUSED(documentId);
    return true;
}

// ── Text helpers ────────────────────────────────────────────

QString makeProse(int approximateLength)
{
    QString text;
    int n = 0;
    while (text.size() < approximateLength) {
        if (!text.isEmpty()) {
            text += QLatin1Char(' ');
        }
        text += QStringLiteral("Sentence number %1 talks about shipping rates and returns.").arg(n++);
    }
    return text;
}

} // namespace dq::test
