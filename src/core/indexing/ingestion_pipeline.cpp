#include "core/indexing/ingestion_pipeline.h"
#include "core/embedding/embedding_client.h"
#include "core/extraction/extractor.h"
#include "core/index/sqlite_store.h"
#include "core/index/store_adapter.h"
#include "core/indexing/worker_pool.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <thread>
#include <vector>

namespace dq {

namespace {

QString baseMediaType(const QString& mediaType)
{
    return mediaType.section(QLatin1Char(';'), 0, 0).trimmed().toLower();
}

} // namespace

QString ingestStatusToString(IngestResult::Status status)
{
    switch (status) {
    case IngestResult::Status::Completed:        return QStringLiteral("completed");
    case IngestResult::Status::AlreadyCompleted: return QStringLiteral("already_completed");
    case IngestResult::Status::Failed:           return QStringLiteral("failed");
    case IngestResult::Status::Cancelled:        return QStringLiteral("cancelled");
    case IngestResult::Status::AlreadyRunning:   return QStringLiteral("already_running");
    case IngestResult::Status::NotFound:         return QStringLiteral("not_found");
    }
    return QStringLiteral("failed");
}

// ── DocumentLock ────────────────────────────────────────────

IngestionPipeline::DocumentLock::DocumentLock(IngestionPipeline& pipeline, int64_t documentId)
    : m_pipeline(pipeline)
    , m_documentId(documentId)
{
    std::lock_guard<std::mutex> lock(m_pipeline.m_activeMutex);
    m_acquired = m_pipeline.m_active.insert(documentId).second;
}

IngestionPipeline::DocumentLock::~DocumentLock()
{
    if (m_acquired) {
        std::lock_guard<std::mutex> lock(m_pipeline.m_activeMutex);
        m_pipeline.m_active.erase(m_documentId);
    }
}

// ── IngestionPipeline ───────────────────────────────────────

IngestionPipeline::IngestionPipeline(SQLiteStore& store,
                                     StoreAdapter& adapter,
                                     ContentExtractor& extractor,
                                     EmbeddingClient& embedder,
                                     IngestionConfig config)
    : m_store(store)
    , m_adapter(adapter)
    , m_extractor(extractor)
    , m_embedder(embedder)
    , m_config(config)
    , m_chunker(config.chunker)
    , m_pool(std::make_unique<WorkerPool>(std::max(1, config.embeddingWorkers),
                                         static_cast<size_t>(std::max(1, config.embeddingQueueCapacity))))
{
}

IngestionPipeline::~IngestionPipeline() = default;

const QStringList& IngestionPipeline::acceptedMediaTypes()
{
    static const QStringList types = {
        QStringLiteral("application/pdf"),
        QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document"),
        QStringLiteral("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"),
        QStringLiteral("application/vnd.ms-excel"),
        QStringLiteral("text/plain"),
        QStringLiteral("text/csv"),
        QStringLiteral("text/markdown"),
    };
    return types;
}

std::optional<Error> IngestionPipeline::validateUpload(const UploadRequest& upload,
                                                       int64_t maxUploadBytes)
{
    if (upload.filename.trimmed().isEmpty()) {
        return Error::validation(QStringLiteral("filename is required"));
    }
    if (upload.sizeBytes < 0) {
        return Error::validation(QStringLiteral("file size is negative"));
    }
    if (upload.sizeBytes > maxUploadBytes) {
        return Error::validation(QStringLiteral("file size must be at most %1 bytes")
                                     .arg(maxUploadBytes));
    }
    if (!acceptedMediaTypes().contains(baseMediaType(upload.mediaType))) {
        return Error::validation(QStringLiteral("unsupported media type '%1'")
                                     .arg(upload.mediaType));
    }
    return std::nullopt;
}

RegisterResult IngestionPipeline::registerDocument(const UploadRequest& upload)
{
    RegisterResult result;
    if (auto invalid = validateUpload(upload, m_config.maxUploadBytes)) {
        LOG_WARN(dqIngest, "Rejected upload '%s': %s",
                 qUtf8Printable(upload.filename), qUtf8Printable(invalid->message));
        result.error = invalid;
        return result;
    }

    result.documentId = m_store.insertDocument(upload);
    if (!result.documentId) {
        result.error = Error::storage(QStringLiteral("failed to register document"));
        return result;
    }
    LOG_INFO(dqIngest, "Registered document %lld (%s, %lld bytes)",
             static_cast<long long>(*result.documentId), qUtf8Printable(upload.filename),
             static_cast<long long>(upload.sizeBytes));
    return result;
}

bool IngestionPipeline::isRunning(int64_t documentId) const
{
    std::lock_guard<std::mutex> lock(m_activeMutex);
    return m_active.count(documentId) > 0;
}

// ── Status bookkeeping ──────────────────────────────────────

bool IngestionPipeline::transition(int64_t documentId, DocumentStatus& status,
                                   DocumentEvent event,
                                   const std::optional<QString>& errorMessage)
{
    const auto next = nextDocumentStatus(status, event);
    if (!next) {
        LOG_WARN(dqIngest, "Document %lld: rejected %s in state %s",
                 static_cast<long long>(documentId),
                 qUtf8Printable(documentEventToString(event)),
                 qUtf8Printable(documentStatusToString(status)));
        return false;
    }
    if (!m_store.updateDocumentStatus(documentId, *next, errorMessage)) {
        LOG_ERROR(dqIngest, "Document %lld: failed to record status %s",
                  static_cast<long long>(documentId),
                  qUtf8Printable(documentStatusToString(*next)));
        return false;
    }
    LOG_DEBUG(dqIngest, "Document %lld: %s -> %s", static_cast<long long>(documentId),
              qUtf8Printable(documentStatusToString(status)),
              qUtf8Printable(documentStatusToString(*next)));
    status = *next;
    return true;
}

void IngestionPipeline::fail(int64_t documentId, DocumentStatus& status, Error error,
                             IngestResult& result)
{
    LOG_ERROR(dqIngest, "Document %lld failed: %s", static_cast<long long>(documentId),
              qUtf8Printable(error.describe()));
    transition(documentId, status, DocumentEvent::Failed, error.message);
    result.status = IngestResult::Status::Failed;
    result.error = std::move(error);
}

void IngestionPipeline::cancel(IngestResult& result, const QString& stage)
{
    result.status = IngestResult::Status::Cancelled;
    result.error = Error::cancelled(QStringLiteral("cancelled before %1").arg(stage));
}

std::optional<Document> IngestionPipeline::prepare(int64_t documentId, IngestResult& result)
{
    auto document = m_store.getDocument(documentId);
    if (!document) {
        result.status = IngestResult::Status::NotFound;
        result.error = Error::notFound(QStringLiteral("document %1 not found").arg(documentId));
        return std::nullopt;
    }

    if (document->status == DocumentStatus::Completed) {
        LOG_DEBUG(dqIngest, "Document %lld already completed", static_cast<long long>(documentId));
        result.status = IngestResult::Status::AlreadyCompleted;
        return std::nullopt;
    }

    if (document->status == DocumentStatus::Failed) {
        LOG_INFO(dqIngest, "Retrying failed document %lld", static_cast<long long>(documentId));
        if (!transition(documentId, document->status, DocumentEvent::Resume)) {
            result.status = IngestResult::Status::Failed;
            result.error = Error::storage(QStringLiteral("could not reopen failed document"));
            return std::nullopt;
        }
    }
    return document;
}

// ── Stages ──────────────────────────────────────────────────

bool IngestionPipeline::persistChunks(const Document& document, DocumentStatus& status,
                                      const QString& text, IngestResult& result)
{
    const std::vector<Chunk> chunks = m_chunker.chunkDocument(document.id, text);
    if (chunks.empty()) {
        fail(document.id, status, Error::validation(QStringLiteral("document produced no chunks")),
             result);
        return false;
    }

    const auto ids = m_adapter.putChunks(document.id, chunks);
    if (!ids) {
        fail(document.id, status, Error::storage(QStringLiteral("failed to persist chunks")),
             result);
        return false;
    }
    result.chunksCreated = static_cast<int>(ids->size());
    LOG_INFO(dqIngest, "Document %lld: %d chunks persisted",
             static_cast<long long>(document.id), result.chunksCreated);

    if (!transition(document.id, status, DocumentEvent::ChunksPersisted)) {
        result.status = IngestResult::Status::Failed;
        result.error = Error::storage(QStringLiteral("could not record chunks_created"));
        return false;
    }
    return true;
}

void IngestionPipeline::embedMissing(const Document& document, DocumentStatus& status,
                                     const Deadline& deadline, IngestResult& result)
{
    // Chunks from an earlier run whose status update was lost
    if (status == DocumentStatus::Processing
        && !transition(document.id, status, DocumentEvent::ChunksPersisted)) {
        result.status = IngestResult::Status::Failed;
        result.error = Error::storage(QStringLiteral("could not record chunks_created"));
        return;
    }

    if (deadline.expired()) {
        cancel(result, QStringLiteral("embedding"));
        return;
    }

    const std::vector<Chunk> pending = m_store.getChunks(m_adapter.chunksMissingEmbedding(document.id));
    LOG_DEBUG(dqIngest, "Document %lld: %zu chunks need embeddings",
              static_cast<long long>(document.id), pending.size());

    std::atomic<bool> stop{false};
    std::atomic<int> stored{0};
    std::mutex errorMutex;
    std::optional<Error> firstError;

    auto recordError = [&](Error error) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError) {
            firstError = std::move(error);
        }
        stop.store(true);
    };

    auto embedOne = [&](const Chunk& chunk) {
        if (stop.load()) {
            return;
        }
        if (deadline.expired()) {
            recordError(Error::cancelled(QStringLiteral("cancelled during embedding")));
            return;
        }

        const EmbeddingResult embedded = m_embedder.embed(chunk.content, deadline);
        if (embedded.status == EmbeddingResult::Status::Cancelled) {
            recordError(Error::cancelled(QStringLiteral("cancelled during embedding")));
            return;
        }
        if (!embedded.ok()) {
            recordError(Error::upstream(QStringLiteral("embedding failed for chunk %1: %2")
                                            .arg(chunk.chunkIndex)
                                            .arg(embedded.errorMessage)));
            return;
        }
        if (!m_adapter.putEmbedding(chunk.id, embedded.vector)) {
            recordError(Error::storage(QStringLiteral("failed to store embedding for chunk %1")
                                           .arg(chunk.chunkIndex)));
            return;
        }
        stored.fetch_add(1);
    };

    // Bounded window over the pending chunks, refilled in chunk order
    const size_t window = static_cast<size_t>(std::max(1, std::min(m_config.maxEmbeddingsInFlight,
                                                                   static_cast<int>(m_pool->maxQueueSize()))));
    std::deque<std::future<void>> inFlight;
    auto awaitOldest = [&]() {
        std::future<void> job = std::move(inFlight.front());
        inFlight.pop_front();
        try {
            job.get();
        } catch (const std::exception& e) {
            recordError(Error::storage(QStringLiteral("embedding job failed: %1")
                                           .arg(QString::fromUtf8(e.what()))));
        }
    };

    size_t next = 0;
    while (next < pending.size() && !stop.load()) {
        if (inFlight.size() >= window) {
            awaitOldest();
            continue;
        }
        const Chunk& chunk = pending[next];
        auto queued = m_pool->tryRun([&embedOne, chunk]() { embedOne(chunk); });
        if (queued) {
            inFlight.push_back(std::move(*queued));
            ++next;
            continue;
        }
        // Pool queue full, shared with other documents
        if (m_pool->isShutdown()) {
            recordError(Error::storage(QStringLiteral("embedding pool shut down")));
            break;
        }
        if (!inFlight.empty()) {
            awaitOldest();
        } else if (deadline.expired()) {
            recordError(Error::cancelled(QStringLiteral("cancelled during embedding")));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    while (!inFlight.empty()) {
        awaitOldest();
    }
    result.embeddingsStored = stored.load();

    if (firstError) {
        if (firstError->kind == ErrorKind::Cancelled) {
            LOG_INFO(dqIngest, "Document %lld: embedding cancelled after %d vectors",
                     static_cast<long long>(document.id), result.embeddingsStored);
            result.status = IngestResult::Status::Cancelled;
            result.error = std::move(firstError);
            return;
        }
        fail(document.id, status, std::move(*firstError), result);
        return;
    }

    const size_t stillMissing = m_adapter.chunksMissingEmbedding(document.id).size();
    if (stillMissing > 0) {
        fail(document.id, status,
             Error::storage(QStringLiteral("%1 chunks still lack embeddings").arg(stillMissing)),
             result);
        return;
    }

    if (!transition(document.id, status, DocumentEvent::EmbeddingsStored)) {
        result.status = IngestResult::Status::Failed;
        result.error = Error::storage(QStringLiteral("could not record completed"));
        return;
    }
    result.status = IngestResult::Status::Completed;
}

// ── Entry points ────────────────────────────────────────────

IngestResult IngestionPipeline::ingestRaw(int64_t documentId, const QByteArray& rawBytes,
                                          const QString& mediaType, const Deadline& deadline)
{
    QElapsedTimer timer;
    timer.start();
    IngestResult result;

    DocumentLock lock(*this, documentId);
    if (!lock.acquired()) {
        result.status = IngestResult::Status::AlreadyRunning;
        return result;
    }

    auto document = prepare(documentId, result);
    if (!document) {
        result.durationMs = timer.elapsed();
        return result;
    }
    DocumentStatus status = document->status;

    if (m_store.countChunks(documentId) == 0) {
        if (deadline.expired()) {
            cancel(result, QStringLiteral("extraction"));
            result.durationMs = timer.elapsed();
            return result;
        }

        const QString type = mediaType.isEmpty() ? document->mediaType : mediaType;
        const ExtractionResult extracted = m_extractor.extract(rawBytes, type);
        if (extracted.status != ExtractionResult::Status::Success || !extracted.content) {
            const QString message = extracted.errorMessage.value_or(
                QStringLiteral("text extraction failed"));
            fail(documentId, status,
                 extracted.status == ExtractionResult::Status::UnsupportedMediaType
                     ? Error::validation(message)
                     : Error::upstream(message),
                 result);
            result.durationMs = timer.elapsed();
            return result;
        }
        LOG_DEBUG(dqIngest, "Document %lld: extracted %lld characters in %d ms",
                  static_cast<long long>(documentId),
                  static_cast<long long>(extracted.content->size()), extracted.durationMs);

        if (deadline.expired()) {
            cancel(result, QStringLiteral("chunking"));
            result.durationMs = timer.elapsed();
            return result;
        }
        if (!persistChunks(*document, status, *extracted.content, result)) {
            result.durationMs = timer.elapsed();
            return result;
        }
    }

    embedMissing(*document, status, deadline, result);
    result.durationMs = timer.elapsed();
    LOG_INFO(dqIngest, "Document %lld ingest %s in %lld ms", static_cast<long long>(documentId),
             qUtf8Printable(ingestStatusToString(result.status)),
             static_cast<long long>(result.durationMs));
    return result;
}

IngestResult IngestionPipeline::ingestText(int64_t documentId, const QString& text,
                                           const Deadline& deadline)
{
    QElapsedTimer timer;
    timer.start();
    IngestResult result;

    DocumentLock lock(*this, documentId);
    if (!lock.acquired()) {
        result.status = IngestResult::Status::AlreadyRunning;
        return result;
    }

    auto document = prepare(documentId, result);
    if (!document) {
        result.durationMs = timer.elapsed();
        return result;
    }
    DocumentStatus status = document->status;

    if (m_store.countChunks(documentId) == 0) {
        if (deadline.expired()) {
            cancel(result, QStringLiteral("chunking"));
            result.durationMs = timer.elapsed();
            return result;
        }
        if (!persistChunks(*document, status, text, result)) {
            result.durationMs = timer.elapsed();
            return result;
        }
    } else {
        LOG_DEBUG(dqIngest, "Document %lld already chunked, skipping chunking",
                  static_cast<long long>(documentId));
    }

    embedMissing(*document, status, deadline, result);
    result.durationMs = timer.elapsed();
    LOG_INFO(dqIngest, "Document %lld ingest %s in %lld ms", static_cast<long long>(documentId),
             qUtf8Printable(ingestStatusToString(result.status)),
             static_cast<long long>(result.durationMs));
    return result;
}

IngestResult IngestionPipeline::resume(int64_t documentId, const Deadline& deadline)
{
    QElapsedTimer timer;
    timer.start();
    IngestResult result;

    DocumentLock lock(*this, documentId);
    if (!lock.acquired()) {
        result.status = IngestResult::Status::AlreadyRunning;
        return result;
    }

    auto existing = m_store.getDocument(documentId);
    if (existing && existing->status != DocumentStatus::Completed
        && m_store.countChunks(documentId) == 0) {
        // Nothing to resume from; the caller must ingest the content again.
        result.status = IngestResult::Status::Failed;
        result.error = Error::validation(QStringLiteral("document %1 has no chunks to resume")
                                             .arg(documentId));
        return result;
    }

    auto document = prepare(documentId, result);
    if (!document) {
        result.durationMs = timer.elapsed();
        return result;
    }
    DocumentStatus status = document->status;

    embedMissing(*document, status, deadline, result);
    result.durationMs = timer.elapsed();
    LOG_INFO(dqIngest, "Document %lld resume %s in %lld ms", static_cast<long long>(documentId),
             qUtf8Printable(ingestStatusToString(result.status)),
             static_cast<long long>(result.durationMs));
    return result;
}

bool IngestionPipeline::deleteDocument(int64_t documentId)
{
    DocumentLock lock(*this, documentId);
    if (!lock.acquired()) {
        LOG_WARN(dqIngest, "Document %lld is being ingested, not deleting",
                 static_cast<long long>(documentId));
        return false;
    }
    const bool removed = m_adapter.deleteDocument(documentId);
    if (removed) {
        LOG_INFO(dqIngest, "Deleted document %lld", static_cast<long long>(documentId));
    }
    return removed;
}

} // namespace dq
