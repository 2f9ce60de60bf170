#pragma once

#include "core/indexing/chunker.h"
#include "core/indexing/document_state.h"
#include "core/shared/deadline.h"
#include "core/shared/document.h"
#include "core/shared/error.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace dq {

class ContentExtractor;
class EmbeddingClient;
class SQLiteStore;
class StoreAdapter;
class WorkerPool;

struct IngestionConfig {
    ChunkerConfig chunker;
    int embeddingWorkers = 4;
    // Queue bound of the embedding pool, and how many of one document's
    // embedding jobs may be queued or running at once.
    int embeddingQueueCapacity = 10000;
    int maxEmbeddingsInFlight = 256;
    int64_t maxUploadBytes = 10 * 1024 * 1024;
};

struct RegisterResult {
    std::optional<int64_t> documentId;
    std::optional<Error> error;

    bool ok() const { return documentId.has_value(); }
};

struct IngestResult {
    enum class Status {
        Completed,
        AlreadyCompleted,   // nothing to do, document untouched
        Failed,             // document marked failed with the error message
        Cancelled,          // deadline hit, status left where it was
        AlreadyRunning,     // another ingestion holds this document
        NotFound,
    };

    Status status = Status::Failed;
    int chunksCreated = 0;
    int embeddingsStored = 0;
    std::optional<Error> error;
    qint64 durationMs = 0;
};

QString ingestStatusToString(IngestResult::Status status);

// IngestionPipeline: drives one document from raw bytes to searchable
// chunks: extract, chunk, persist, embed.
//
// Status moves processing -> chunks_created -> completed through
// nextDocumentStatus(); any stage failure marks the document failed and
// stops, keeping whatever was already persisted. A later run (ingest or
// resume) skips chunking when chunks exist and embeds only the chunks that
// still lack a vector.
//
// Embedding calls for one document are fanned out to a bounded pool through
// a window of at most maxEmbeddingsInFlight jobs, refilled in chunk order as
// jobs finish. The first failed call stops the rest of that document's jobs.
class IngestionPipeline {
public:
    IngestionPipeline(SQLiteStore& store,
                      StoreAdapter& adapter,
                      ContentExtractor& extractor,
                      EmbeddingClient& embedder,
                      IngestionConfig config = {});
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    // Accepted upload media types (pdf, docx, xlsx, xls, plain text, csv,
    // markdown).
    static const QStringList& acceptedMediaTypes();
    static std::optional<Error> validateUpload(const UploadRequest& upload, int64_t maxUploadBytes);

    RegisterResult registerDocument(const UploadRequest& upload);

    // Extract text from the uploaded bytes, then continue as ingestText().
    // Extraction is skipped when the document already has chunks.
    IngestResult ingestRaw(int64_t documentId, const QByteArray& rawBytes,
                           const QString& mediaType,
                           const Deadline& deadline = Deadline::never());

    IngestResult ingestText(int64_t documentId, const QString& text,
                            const Deadline& deadline = Deadline::never());

    // Retry entry for documents whose chunks already exist: runs only the
    // embedding stage.
    IngestResult resume(int64_t documentId, const Deadline& deadline = Deadline::never());

    // Refused while the document is being ingested.
    bool deleteDocument(int64_t documentId);

    bool isRunning(int64_t documentId) const;
    const IngestionConfig& config() const { return m_config; }

private:
    // Advisory per-document lock, released on scope exit.
    class DocumentLock {
    public:
        DocumentLock(IngestionPipeline& pipeline, int64_t documentId);
        ~DocumentLock();
        DocumentLock(const DocumentLock&) = delete;
        DocumentLock& operator=(const DocumentLock&) = delete;

        bool acquired() const { return m_acquired; }

    private:
        IngestionPipeline& m_pipeline;
        int64_t m_documentId;
        bool m_acquired = false;
    };

    // Loads the document and readies it for another run. Returns nullopt
    // with result filled in when there is nothing to run.
    std::optional<Document> prepare(int64_t documentId, IngestResult& result);

    bool persistChunks(const Document& document, DocumentStatus& status,
                       const QString& text, IngestResult& result);
    void embedMissing(const Document& document, DocumentStatus& status,
                      const Deadline& deadline, IngestResult& result);

    bool transition(int64_t documentId, DocumentStatus& status, DocumentEvent event,
                    const std::optional<QString>& errorMessage = std::nullopt);
    void fail(int64_t documentId, DocumentStatus& status, Error error, IngestResult& result);
    static void cancel(IngestResult& result, const QString& stage);

    SQLiteStore& m_store;
    StoreAdapter& m_adapter;
    ContentExtractor& m_extractor;
    EmbeddingClient& m_embedder;
    IngestionConfig m_config;
    Chunker m_chunker;

    mutable std::mutex m_activeMutex;
    std::unordered_set<int64_t> m_active;

    std::unique_ptr<WorkerPool> m_pool;
};

} // namespace dq
