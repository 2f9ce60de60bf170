#include <QtTest/QtTest>
#include "core/embedding/embedding_client.h"
#include "core/extraction/plain_text_extractor.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/vector/retrieval_store.h"
#include "fake_providers.h"

#include <QTemporaryDir>

#include <chrono>
#include <memory>

class TestIngestionPipeline : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Upload validation ────────────────────────────────────────
    void testAcceptedMediaTypes();
    void testRejectsOversizedUpload();
    void testRejectsUnsupportedMediaType();
    void testRejectsMissingFilename();
    void testRegisterStartsProcessing();

    // ── Ingestion ────────────────────────────────────────────────
    void testIngestRawCompletesDocument();
    void testIngestTextCompletesDocument();
    void testCompletedDocumentIsNotReprocessed();
    void testUnknownDocumentNotFound();
    void testExtractionFailureMarksFailed();
    void testUnsupportedTypeAtExtractionIsValidation();
    void testEmptyTextMarksFailed();
    void testExpiredDeadlineBeforeChunkingLeavesProcessing();
    void testMoreChunksThanEmbeddingQueueCapacity();

    // ── Deletion ─────────────────────────────────────────────────
    void testDeleteRemovesDocument();

private:
    int64_t registerText(const QString& filename = QStringLiteral("notes.txt"));

    static constexpr int kDims = 32;
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<dq::SQLiteStore> m_store;
    std::unique_ptr<dq::RetrievalStore> m_retrieval;
    std::unique_ptr<dq::test::ScriptedEmbeddingProvider> m_provider;
    std::unique_ptr<dq::EmbeddingClient> m_embedder;
    dq::PlainTextExtractor m_extractor;
    std::unique_ptr<dq::IngestionPipeline> m_pipeline;
};

void TestIngestionPipeline::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    auto store = dq::SQLiteStore::open(m_dir->path() + "/ingest.db");
    QVERIFY(store.has_value());
    m_store = std::make_unique<dq::SQLiteStore>(std::move(*store));

    dq::RetrievalConfig retrievalConfig;
    retrievalConfig.dimensions = kDims;
    m_retrieval = std::make_unique<dq::RetrievalStore>(*m_store, retrievalConfig);
    QVERIFY(m_retrieval->open());

    m_provider = std::make_unique<dq::test::ScriptedEmbeddingProvider>(kDims);
    m_embedder = std::make_unique<dq::EmbeddingClient>(*m_provider);

    dq::IngestionConfig config;
    config.chunker.maxSize = 300;
    config.chunker.overlap = 50;
    config.embeddingWorkers = 3;
    config.maxUploadBytes = 4096;
    m_pipeline = std::make_unique<dq::IngestionPipeline>(*m_store, *m_retrieval, m_extractor,
                                                         *m_embedder, config);
}

void TestIngestionPipeline::cleanup()
{
    m_pipeline.reset();
    m_embedder.reset();
    m_provider.reset();
    m_retrieval.reset();
    m_store.reset();
    m_dir.reset();
}

int64_t TestIngestionPipeline::registerText(const QString& filename)
{
    dq::UploadRequest upload;
    upload.filename = filename;
    upload.sizeBytes = 1000;
    upload.mediaType = QStringLiteral("text/plain");
    const dq::RegisterResult registered = m_pipeline->registerDocument(upload);
    return registered.documentId.value_or(0);
}

// ── Upload validation ────────────────────────────────────────────

void TestIngestionPipeline::testAcceptedMediaTypes()
{
    const QStringList& types = dq::IngestionPipeline::acceptedMediaTypes();
    QVERIFY(types.contains(QStringLiteral("application/pdf")));
    QVERIFY(types.contains(QStringLiteral("application/vnd.ms-excel")));
    QVERIFY(types.contains(QStringLiteral("text/csv")));
    QVERIFY(!types.contains(QStringLiteral("image/png")));
}

void TestIngestionPipeline::testRejectsOversizedUpload()
{
    dq::UploadRequest upload;
    upload.filename = QStringLiteral("big.pdf");
    upload.mediaType = QStringLiteral("application/pdf");
    upload.sizeBytes = 10 * 1024 * 1024;
    QVERIFY(!dq::IngestionPipeline::validateUpload(upload, 10 * 1024 * 1024).has_value());

    upload.sizeBytes += 1;
    const auto error = dq::IngestionPipeline::validateUpload(upload, 10 * 1024 * 1024);
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, dq::ErrorKind::Validation);

    // Configured limit applies at registration
    upload.sizeBytes = 5000;
    const dq::RegisterResult registered = m_pipeline->registerDocument(upload);
    QVERIFY(!registered.ok());
    QCOMPARE(registered.error->kind, dq::ErrorKind::Validation);
    QVERIFY(m_store->listDocuments().empty());
}

void TestIngestionPipeline::testRejectsUnsupportedMediaType()
{
    dq::UploadRequest upload;
    upload.filename = QStringLiteral("photo.png");
    upload.mediaType = QStringLiteral("image/png");
    upload.sizeBytes = 10;
    const dq::RegisterResult registered = m_pipeline->registerDocument(upload);
    QVERIFY(!registered.ok());
    QCOMPARE(registered.error->kind, dq::ErrorKind::Validation);

    upload.mediaType = QStringLiteral("Text/Plain; charset=utf-8");
    QVERIFY(!dq::IngestionPipeline::validateUpload(upload, 4096).has_value());
}

void TestIngestionPipeline::testRejectsMissingFilename()
{
    dq::UploadRequest upload;
    upload.filename = QStringLiteral("  ");
    upload.mediaType = QStringLiteral("text/plain");
    const auto error = dq::IngestionPipeline::validateUpload(upload, 4096);
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, dq::ErrorKind::Validation);
}

void TestIngestionPipeline::testRegisterStartsProcessing()
{
    const int64_t id = registerText();
    QVERIFY(id > 0);
    const auto document = m_store->getDocument(id);
    QVERIFY(document.has_value());
    QCOMPARE(document->status, dq::DocumentStatus::Processing);
    QVERIFY(document->visibleTo.contains(dq::RoleTag::Owner));
}

// ── Ingestion ────────────────────────────────────────────────────

void TestIngestionPipeline::testIngestRawCompletesDocument()
{
    const int64_t id = registerText();
    const QString text = dq::test::makeProse(1500);

    const dq::IngestResult result = m_pipeline->ingestRaw(id, text.toUtf8(),
                                                          QStringLiteral("text/plain"));
    QCOMPARE(result.status, dq::IngestResult::Status::Completed);
    QVERIFY(!result.error.has_value());
    QVERIFY(result.chunksCreated > 1);
    QCOMPARE(result.embeddingsStored, result.chunksCreated);

    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Completed);
    QCOMPARE(m_store->countChunks(id), result.chunksCreated);
    QCOMPARE(m_store->countEmbeddings(id), result.chunksCreated);
    QCOMPARE(m_retrieval->vectorIndex().totalElements(), result.chunksCreated);
    QCOMPARE(m_provider->calls(), result.chunksCreated);
    QVERIFY(!m_pipeline->isRunning(id));
}

void TestIngestionPipeline::testIngestTextCompletesDocument()
{
    const int64_t id = registerText();
    const dq::IngestResult result = m_pipeline->ingestText(
        id, QStringLiteral("Our shop is closed on public holidays."));
    QCOMPARE(result.status, dq::IngestResult::Status::Completed);
    QCOMPARE(result.chunksCreated, 1);
    QCOMPARE(dq::ingestStatusToString(result.status), QStringLiteral("completed"));
}

void TestIngestionPipeline::testCompletedDocumentIsNotReprocessed()
{
    const int64_t id = registerText();
    QCOMPARE(m_pipeline->ingestText(id, dq::test::makeProse(600)).status,
             dq::IngestResult::Status::Completed);
    const int chunks = m_store->countChunks(id);
    m_provider->resetCalls();

    const dq::IngestResult again = m_pipeline->ingestText(id, dq::test::makeProse(600));
    QCOMPARE(again.status, dq::IngestResult::Status::AlreadyCompleted);
    QCOMPARE(m_provider->calls(), 0);
    QCOMPARE(m_store->countChunks(id), chunks);

    QCOMPARE(m_pipeline->resume(id).status, dq::IngestResult::Status::AlreadyCompleted);
}

void TestIngestionPipeline::testUnknownDocumentNotFound()
{
    const dq::IngestResult result = m_pipeline->ingestText(424242, QStringLiteral("Text."));
    QCOMPARE(result.status, dq::IngestResult::Status::NotFound);
    QCOMPARE(result.error->kind, dq::ErrorKind::NotFound);
}

void TestIngestionPipeline::testExtractionFailureMarksFailed()
{
    dq::test::FailingExtractor failing;
    dq::IngestionPipeline pipeline(*m_store, *m_retrieval, failing, *m_embedder);

    const int64_t id = registerText();
    const dq::IngestResult result = pipeline.ingestRaw(id, QByteArray("garbage"),
                                                       QStringLiteral("text/plain"));
    QCOMPARE(result.status, dq::IngestResult::Status::Failed);
    QCOMPARE(result.error->kind, dq::ErrorKind::UpstreamUnavailable);

    const auto document = m_store->getDocument(id);
    QCOMPARE(document->status, dq::DocumentStatus::Failed);
    QCOMPARE(document->errorMessage.value_or(QString()), QStringLiteral("corrupt file"));
    QCOMPARE(m_store->countChunks(id), 0);
}

void TestIngestionPipeline::testUnsupportedTypeAtExtractionIsValidation()
{
    const int64_t id = registerText(QStringLiteral("report.pdf"));
    const dq::IngestResult result = m_pipeline->ingestRaw(id, QByteArray("%PDF-1.7"),
                                                          QStringLiteral("application/pdf"));
    QCOMPARE(result.status, dq::IngestResult::Status::Failed);
    QCOMPARE(result.error->kind, dq::ErrorKind::Validation);
    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Failed);
}

void TestIngestionPipeline::testEmptyTextMarksFailed()
{
    const int64_t id = registerText();
    const dq::IngestResult result = m_pipeline->ingestText(id, QStringLiteral("   \n "));
    QCOMPARE(result.status, dq::IngestResult::Status::Failed);
    QCOMPARE(result.error->kind, dq::ErrorKind::Validation);
    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Failed);
}

void TestIngestionPipeline::testExpiredDeadlineBeforeChunkingLeavesProcessing()
{
    const int64_t id = registerText();
    dq::Deadline deadline;
    deadline.cancel();

    const dq::IngestResult result = m_pipeline->ingestText(id, dq::test::makeProse(500), deadline);
    QCOMPARE(result.status, dq::IngestResult::Status::Cancelled);
    QCOMPARE(result.error->kind, dq::ErrorKind::Cancelled);
    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Processing);
    QCOMPARE(m_store->countChunks(id), 0);
}

void TestIngestionPipeline::testMoreChunksThanEmbeddingQueueCapacity()
{
    dq::IngestionConfig config;
    config.chunker.maxSize = 100;
    config.chunker.overlap = 0;
    config.embeddingWorkers = 2;
    config.embeddingQueueCapacity = 2;
    config.maxEmbeddingsInFlight = 64;
    dq::IngestionPipeline pipeline(*m_store, *m_retrieval, m_extractor, *m_embedder, config);

    dq::UploadRequest upload;
    upload.filename = QStringLiteral("handbook.txt");
    upload.sizeBytes = 3000;
    upload.mediaType = QStringLiteral("text/plain");
    const int64_t id = pipeline.registerDocument(upload).documentId.value_or(0);
    QVERIFY(id > 0);

    m_provider->setDelay(std::chrono::milliseconds(2));
    const dq::IngestResult result = pipeline.ingestText(id, dq::test::makeProse(3000));
    QCOMPARE(result.status, dq::IngestResult::Status::Completed);

    const int chunks = m_store->countChunks(id);
    QVERIFY(chunks > 10 * config.embeddingQueueCapacity);
    QCOMPARE(result.embeddingsStored, chunks);
    QCOMPARE(m_store->countEmbeddings(id), chunks);
    QCOMPARE(m_provider->calls(), chunks);
    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Completed);
}

// ── Deletion ─────────────────────────────────────────────────────

void TestIngestionPipeline::testDeleteRemovesDocument()
{
    const int64_t id = registerText();
    QCOMPARE(m_pipeline->ingestText(id, dq::test::makeProse(800)).status,
             dq::IngestResult::Status::Completed);
    const int vectors = m_retrieval->vectorIndex().totalElements();
    QVERIFY(vectors > 0);

    QVERIFY(m_pipeline->deleteDocument(id));
    QVERIFY(!m_store->getDocument(id).has_value());
    QCOMPARE(m_retrieval->vectorIndex().deletedElements(), vectors);
    QVERIFY(!m_pipeline->deleteDocument(id));
}

QTEST_MAIN(TestIngestionPipeline)
#include "test_ingestion_pipeline.moc"
