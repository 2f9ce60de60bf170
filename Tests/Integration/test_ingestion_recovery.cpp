#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "core/embedding/embedding_client.h"
#include "core/extraction/plain_text_extractor.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/vector/retrieval_store.h"
#include "fake_providers.h"

#include <chrono>
#include <memory>
#include <thread>

class TestIngestionRecovery : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testEmbeddingFailureKeepsChunksAndMarksFailed();
    void testResumeEmbedsOnlyMissingChunks();
    void testIngestAgainAfterFailureSkipsChunking();
    void testResumeWithoutChunksIsRejected();
    void testCancelledEmbeddingLeavesChunksCreated();
    void testConcurrentIngestReportsAlreadyRunning();
    void testReopenedStoreResumesFromDisk();

private:
    void buildPipeline(int workers);
    int64_t registerDocument();

    static constexpr int kDims = 32;
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_dbPath;
    std::unique_ptr<dq::SQLiteStore> m_store;
    std::unique_ptr<dq::RetrievalStore> m_retrieval;
    dq::test::ScriptedEmbeddingProvider m_provider{kDims};
    std::unique_ptr<dq::EmbeddingClient> m_embedder;
    dq::PlainTextExtractor m_extractor;
    std::unique_ptr<dq::IngestionPipeline> m_pipeline;
};

namespace {

// Ten chunks at maxSize 120 / overlap 0, one sentence each; sentence 6
// carries the failure marker.
QString markedText()
{
    QStringList sentences;
    for (int i = 0; i < 10; ++i) {
        sentences << QStringLiteral("Section %1 explains the delivery terms and shipping conditions for "
                                       "customers in region %1%2.")
                         .arg(i)
                         .arg(i == 6 ? QStringLiteral(" POISON") : QString());
    }
    return sentences.join(QLatin1Char(' '));
}

} // namespace

void TestIngestionRecovery::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_dbPath = m_dir->path() + "/recovery.db";
    m_provider.setFailureMarker(QString());
    m_provider.setDelay(std::chrono::milliseconds(0));
    m_provider.setFailAll(false);
    m_provider.resetCalls();
    buildPipeline(1);
}

void TestIngestionRecovery::cleanup()
{
    m_pipeline.reset();
    m_embedder.reset();
    m_retrieval.reset();
    m_store.reset();
    m_dir.reset();
}

void TestIngestionRecovery::buildPipeline(int workers)
{
    m_pipeline.reset();
    m_embedder.reset();
    m_retrieval.reset();
    m_store.reset();

    auto store = dq::SQLiteStore::open(m_dbPath);
    QVERIFY(store.has_value());
    m_store = std::make_unique<dq::SQLiteStore>(std::move(*store));

    dq::RetrievalConfig retrievalConfig;
    retrievalConfig.dimensions = kDims;
    m_retrieval = std::make_unique<dq::RetrievalStore>(*m_store, retrievalConfig);
    QVERIFY(m_retrieval->open());
    m_embedder = std::make_unique<dq::EmbeddingClient>(m_provider);

    dq::IngestionConfig config;
    config.chunker.maxSize = 120;
    config.chunker.overlap = 0;
    config.embeddingWorkers = workers;
    m_pipeline = std::make_unique<dq::IngestionPipeline>(*m_store, *m_retrieval, m_extractor,
                                                         *m_embedder, config);
}

int64_t TestIngestionRecovery::registerDocument()
{
    dq::UploadRequest upload;
    upload.filename = QStringLiteral("terms.txt");
    upload.sizeBytes = 900;
    upload.mediaType = QStringLiteral("text/plain");
    return m_pipeline->registerDocument(upload).documentId.value_or(0);
}

void TestIngestionRecovery::testEmbeddingFailureKeepsChunksAndMarksFailed()
{
    m_provider.setFailureMarker(QStringLiteral("POISON"));
    const int64_t id = registerDocument();

    const dq::IngestResult result = m_pipeline->ingestText(id, markedText());
    QCOMPARE(result.status, dq::IngestResult::Status::Failed);
    QCOMPARE(result.error->kind, dq::ErrorKind::UpstreamUnavailable);
    QCOMPARE(result.chunksCreated, 10);

    const auto document = m_store->getDocument(id);
    QCOMPARE(document->status, dq::DocumentStatus::Failed);
    QVERIFY(document->errorMessage->contains(QStringLiteral("embedding failed")));
    QCOMPARE(m_store->countChunks(id), 10);

    // One worker, in chunk order: the six chunks before the marked one landed
    QCOMPARE(m_store->countEmbeddings(id), 6);
    QCOMPARE(result.embeddingsStored, 6);
}

void TestIngestionRecovery::testResumeEmbedsOnlyMissingChunks()
{
    m_provider.setFailureMarker(QStringLiteral("POISON"));
    const int64_t id = registerDocument();
    QCOMPARE(m_pipeline->ingestText(id, markedText()).status, dq::IngestResult::Status::Failed);

    const int missing = static_cast<int>(m_store->chunksMissingEmbedding(id).size());
    QCOMPARE(missing, 4);

    m_provider.setFailureMarker(QString());
    m_provider.resetCalls();
    const dq::IngestResult resumed = m_pipeline->resume(id);
    QCOMPARE(resumed.status, dq::IngestResult::Status::Completed);
    QCOMPARE(resumed.chunksCreated, 0);
    QCOMPARE(resumed.embeddingsStored, missing);
    QCOMPARE(m_provider.calls(), missing);

    const auto document = m_store->getDocument(id);
    QCOMPARE(document->status, dq::DocumentStatus::Completed);
    QVERIFY(!document->errorMessage.has_value());
    QCOMPARE(m_store->countEmbeddings(id), 10);
    QCOMPARE(m_retrieval->vectorIndex().totalElements(), 10);
}

void TestIngestionRecovery::testIngestAgainAfterFailureSkipsChunking()
{
    m_provider.setFailureMarker(QStringLiteral("POISON"));
    const int64_t id = registerDocument();
    QCOMPARE(m_pipeline->ingestText(id, markedText()).status, dq::IngestResult::Status::Failed);
    const std::vector<dq::Chunk> before = m_store->getChunksForDocument(id);

    m_provider.setFailureMarker(QString());
    const dq::IngestResult again = m_pipeline->ingestRaw(id, markedText().toUtf8(),
                                                         QStringLiteral("text/plain"));
    QCOMPARE(again.status, dq::IngestResult::Status::Completed);
    QCOMPARE(again.chunksCreated, 0);

    const std::vector<dq::Chunk> after = m_store->getChunksForDocument(id);
    QCOMPARE(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        QCOMPARE(after[i].id, before[i].id);
        QCOMPARE(after[i].contentHash, before[i].contentHash);
    }
}

void TestIngestionRecovery::testResumeWithoutChunksIsRejected()
{
    const int64_t id = registerDocument();
    const dq::IngestResult result = m_pipeline->resume(id);
    QCOMPARE(result.status, dq::IngestResult::Status::Failed);
    QCOMPARE(result.error->kind, dq::ErrorKind::Validation);
    QCOMPARE(m_store->getDocument(id)->status, dq::DocumentStatus::Processing);

    QCOMPARE(m_pipeline->resume(777777).status, dq::IngestResult::Status::NotFound);
}

void TestIngestionRecovery::testCancelledEmbeddingLeavesChunksCreated()
{
    m_provider.setDelay(std::chrono::milliseconds(40));
    const int64_t id = registerDocument();

    const dq::IngestResult result = m_pipeline->ingestText(
        id, markedText(), dq::Deadline::after(std::chrono::milliseconds(100)));
    QCOMPARE(result.status, dq::IngestResult::Status::Cancelled);
    QCOMPARE(result.error->kind, dq::ErrorKind::Cancelled);
    QVERIFY(result.embeddingsStored < 10);

    const auto document = m_store->getDocument(id);
    QCOMPARE(document->status, dq::DocumentStatus::ChunksCreated);
    QVERIFY(!document->errorMessage.has_value());
    QCOMPARE(m_store->countChunks(id), 10);

    // Cancellation is not a provider failure
    QVERIFY(!m_embedder->circuitBreaker().isOpen());

    m_provider.setDelay(std::chrono::milliseconds(0));
    QCOMPARE(m_pipeline->resume(id).status, dq::IngestResult::Status::Completed);
    QCOMPARE(m_store->countEmbeddings(id), 10);
}

void TestIngestionRecovery::testConcurrentIngestReportsAlreadyRunning()
{
    m_provider.setDelay(std::chrono::milliseconds(30));
    const int64_t id = registerDocument();

    dq::IngestResult background;
    std::thread worker([&]() { background = m_pipeline->ingestText(id, markedText()); });

    QTRY_VERIFY_WITH_TIMEOUT(m_pipeline->isRunning(id), 2000);
    QCOMPARE(m_pipeline->ingestText(id, markedText()).status,
             dq::IngestResult::Status::AlreadyRunning);
    QCOMPARE(m_pipeline->resume(id).status, dq::IngestResult::Status::AlreadyRunning);
    QVERIFY(!m_pipeline->deleteDocument(id));

    worker.join();
    QCOMPARE(background.status, dq::IngestResult::Status::Completed);
    QVERIFY(!m_pipeline->isRunning(id));
    QCOMPARE(m_store->countChunks(id), 10);
}

void TestIngestionRecovery::testReopenedStoreResumesFromDisk()
{
    m_provider.setFailureMarker(QStringLiteral("POISON"));
    const int64_t id = registerDocument();
    QCOMPARE(m_pipeline->ingestText(id, markedText()).status, dq::IngestResult::Status::Failed);

    // Fresh process: store, vector index and pipeline rebuilt from the file
    buildPipeline(4);
    QCOMPARE(m_retrieval->vectorIndex().totalElements(), 6);

    m_provider.setFailureMarker(QString());
    m_provider.resetCalls();
    QCOMPARE(m_pipeline->resume(id).status, dq::IngestResult::Status::Completed);
    QCOMPARE(m_provider.calls(), 4);
    QCOMPARE(m_retrieval->vectorIndex().totalElements(), 10);
}

QTEST_MAIN(TestIngestionRecovery)
#include "test_ingestion_recovery.moc"
