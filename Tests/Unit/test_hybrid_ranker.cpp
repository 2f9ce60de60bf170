#include <QtTest/QtTest>
#include "core/ranking/hybrid_ranker.h"
#include "core/index/sqlite_store.h"
#include "core/shared/chunk.h"
#include "fake_providers.h"

#include <chrono>
#include <memory>

class TestHybridRanker : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Merge ────────────────────────────────────────────────────
    void testBothSidesWeightedAndTaggedHybrid();
    void testSingleSideKeepsOwnWeight();
    void testMergeSortedDescendingWithStableTies();
    void testMergeTruncatesToLimit();
    void testMergeOfNothingIsEmpty();

    // ── Search ───────────────────────────────────────────────────
    void testSearchHydratesPassages();
    void testNoDocumentsSkipsSearch();
    void testSlowKeywordSideDegrades();
    void testThrowingSemanticSideDegrades();
    void testDeletedChunkDroppedDuringHydration();

private:
    std::unique_ptr<dq::SQLiteStore> m_store;
    int64_t m_documentId = 0;
    std::vector<int64_t> m_chunkIds;
};

namespace {

dq::ScoredChunk scored(int64_t id, float score)
{
    return dq::ScoredChunk{id, score};
}

} // namespace

void TestHybridRanker::init()
{
    auto store = dq::SQLiteStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    m_store = std::make_unique<dq::SQLiteStore>(std::move(*store));

    dq::UploadRequest upload;
    upload.filename = QStringLiteral("handbook.txt");
    upload.mediaType = QStringLiteral("text/plain");
    m_documentId = m_store->insertDocument(upload).value_or(0);
    QVERIFY(m_documentId > 0);

    std::vector<dq::Chunk> chunks;
    const QStringList contents = {
        QStringLiteral("Opening hours are nine to five."),
        QStringLiteral("Refunds take fourteen days."),
        QStringLiteral("Parking is behind the store."),
    };
    for (int i = 0; i < contents.size(); ++i) {
        dq::Chunk chunk;
        chunk.documentId = m_documentId;
        chunk.chunkIndex = i;
        chunk.content = contents.at(i);
        chunk.contentHash = dq::computeChunkHash(m_documentId, i, chunk.content);
        chunks.push_back(chunk);
    }
    const auto ids = m_store->insertChunks(m_documentId, chunks);
    QVERIFY(ids.has_value());
    m_chunkIds = *ids;
}

void TestHybridRanker::cleanup()
{
    m_store.reset();
    m_chunkIds.clear();
}

// ── Merge ────────────────────────────────────────────────────────

void TestHybridRanker::testBothSidesWeightedAndTaggedHybrid()
{
    const dq::RankerConfig config;
    const auto merged = dq::HybridRanker::merge({scored(7, 0.9f)}, {scored(7, 0.5f)}, config);
    QCOMPARE(static_cast<int>(merged.size()), 1);
    QCOMPARE(merged.front().chunkId, static_cast<int64_t>(7));
    QCOMPARE(merged.front().source, dq::MatchSource::Hybrid);
    QVERIFY(qAbs(merged.front().score - (0.9f * 0.6f + 0.5f * 0.4f)) < 1e-6f);
    QCOMPARE(merged.front().semanticScore, 0.9f);
    QCOMPARE(merged.front().keywordScore, 0.5f);
}

void TestHybridRanker::testSingleSideKeepsOwnWeight()
{
    const dq::RankerConfig config;
    const auto merged = dq::HybridRanker::merge({scored(1, 0.8f)}, {scored(2, 1.0f)}, config);
    QCOMPARE(static_cast<int>(merged.size()), 2);

    // 0.8 * 0.6 = 0.48 beats 1.0 * 0.4 = 0.4
    QCOMPARE(merged[0].chunkId, static_cast<int64_t>(1));
    QCOMPARE(merged[0].source, dq::MatchSource::Semantic);
    QVERIFY(qAbs(merged[0].score - 0.48f) < 1e-6f);
    QCOMPARE(merged[1].chunkId, static_cast<int64_t>(2));
    QCOMPARE(merged[1].source, dq::MatchSource::Keyword);
    QVERIFY(qAbs(merged[1].score - 0.4f) < 1e-6f);
    QCOMPARE(merged[1].semanticScore, 0.0f);
}

void TestHybridRanker::testMergeSortedDescendingWithStableTies()
{
    dq::RankerConfig config;
    config.semanticWeight = 0.5f;
    config.keywordWeight = 0.5f;

    const auto merged = dq::HybridRanker::merge(
        {scored(1, 0.4f), scored(2, 0.6f)},
        {scored(3, 0.4f), scored(4, 0.9f)},
        config);
    QCOMPARE(static_cast<int>(merged.size()), 4);
    QCOMPARE(merged[0].chunkId, static_cast<int64_t>(4));
    QCOMPARE(merged[1].chunkId, static_cast<int64_t>(2));
    // 1 and 3 tie at 0.2: semantic entry first
    QCOMPARE(merged[2].chunkId, static_cast<int64_t>(1));
    QCOMPARE(merged[3].chunkId, static_cast<int64_t>(3));
    for (size_t i = 1; i < merged.size(); ++i) {
        QVERIFY(merged[i - 1].score >= merged[i].score);
    }
}

void TestHybridRanker::testMergeTruncatesToLimit()
{
    dq::RankerConfig config;
    config.limit = 3;

    std::vector<dq::ScoredChunk> semantic;
    for (int i = 0; i < 10; ++i) {
        semantic.push_back(scored(i + 1, 0.3f + 0.05f * static_cast<float>(i)));
    }
    const auto merged = dq::HybridRanker::merge(semantic, {}, config);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[0].chunkId, static_cast<int64_t>(10));
    QCOMPARE(merged[2].chunkId, static_cast<int64_t>(8));
}

void TestHybridRanker::testMergeOfNothingIsEmpty()
{
    QVERIFY(dq::HybridRanker::merge({}, {}, dq::RankerConfig()).empty());
}

// ── Search ───────────────────────────────────────────────────────

void TestHybridRanker::testSearchHydratesPassages()
{
    dq::test::ScriptedStoreAdapter adapter;
    adapter.semanticResults = {scored(m_chunkIds[1], 0.9f), scored(m_chunkIds[0], 0.3f)};
    adapter.keywordResults = {scored(m_chunkIds[1], 0.8f)};

    dq::HybridRanker ranker(adapter, *m_store);
    const dq::HybridSearchResult result = ranker.search(
        QStringLiteral("refund time"), {1.0f, 0.0f}, {m_documentId});

    QVERIFY(!result.degraded());
    QCOMPARE(static_cast<int>(result.passages.size()), 2);
    const dq::RankedPassage& top = result.passages.front();
    QCOMPARE(top.chunkId, m_chunkIds[1]);
    QCOMPARE(top.source, dq::MatchSource::Hybrid);
    QCOMPARE(top.documentId, m_documentId);
    QCOMPARE(top.chunkIndex, 1);
    QCOMPARE(top.content, QStringLiteral("Refunds take fourteen days."));
    QCOMPARE(top.filename, QStringLiteral("handbook.txt"));
    QCOMPARE(result.passages[1].source, dq::MatchSource::Semantic);
}

void TestHybridRanker::testNoDocumentsSkipsSearch()
{
    dq::test::ScriptedStoreAdapter adapter;
    adapter.semanticResults = {scored(m_chunkIds[0], 0.9f)};

    dq::HybridRanker ranker(adapter, *m_store);
    const dq::HybridSearchResult result = ranker.search(QStringLiteral("hours"), {1.0f}, {});
    QVERIFY(result.passages.empty());
    QVERIFY(!result.degraded());
}

void TestHybridRanker::testSlowKeywordSideDegrades()
{
    dq::test::ScriptedStoreAdapter adapter;
    adapter.semanticResults = {scored(m_chunkIds[2], 0.7f)};
    adapter.keywordResults = {scored(m_chunkIds[0], 1.0f)};
    adapter.keywordDelay = std::chrono::milliseconds(400);

    dq::RankerConfig config;
    config.subSearchTimeoutMs = 50;
    dq::HybridRanker ranker(adapter, *m_store, config);

    const dq::HybridSearchResult result = ranker.search(
        QStringLiteral("parking"), {1.0f}, {m_documentId});
    QVERIFY(result.keywordDegraded);
    QVERIFY(!result.semanticDegraded);
    QCOMPARE(static_cast<int>(result.passages.size()), 1);
    QCOMPARE(result.passages.front().chunkId, m_chunkIds[2]);
    QCOMPARE(result.passages.front().source, dq::MatchSource::Semantic);
}

void TestHybridRanker::testThrowingSemanticSideDegrades()
{
    dq::test::ScriptedStoreAdapter adapter;
    adapter.semanticThrows = true;
    adapter.keywordResults = {scored(m_chunkIds[0], 0.5f)};

    dq::HybridRanker ranker(adapter, *m_store);
    const dq::HybridSearchResult result = ranker.search(
        QStringLiteral("opening hours"), {1.0f}, {m_documentId});
    QVERIFY(result.semanticDegraded);
    QVERIFY(!result.keywordDegraded);
    QCOMPARE(static_cast<int>(result.passages.size()), 1);
    QCOMPARE(result.passages.front().source, dq::MatchSource::Keyword);
    QVERIFY(qAbs(result.passages.front().score - 0.2f) < 1e-6f);
}

void TestHybridRanker::testDeletedChunkDroppedDuringHydration()
{
    dq::test::ScriptedStoreAdapter adapter;
    adapter.semanticResults = {scored(999999, 0.95f), scored(m_chunkIds[1], 0.5f)};

    dq::HybridRanker ranker(adapter, *m_store);
    const dq::HybridSearchResult result = ranker.search(
        QStringLiteral("refund"), {1.0f}, {m_documentId});
    QCOMPARE(static_cast<int>(result.passages.size()), 1);
    QCOMPARE(result.passages.front().chunkId, m_chunkIds[1]);
}

QTEST_MAIN(TestHybridRanker)
#include "test_hybrid_ranker.moc"
