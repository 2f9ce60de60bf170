#include "core/engine/qa_engine.h"
#include "core/access/document_access_filter.h"
#include "core/embedding/embedding_client.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/query/answer_cache.h"
#include "core/query/answer_service.h"
#include "core/ranking/hybrid_ranker.h"
#include "core/shared/logging.h"
#include "core/vector/retrieval_store.h"

namespace dq {

QaEngine::QaEngine(PrivateTag, const Settings& settings)
    : m_settings(sanitizedSettings(settings))
{
}

QaEngine::~QaEngine() = default;

std::unique_ptr<QaEngine> QaEngine::open(const Settings& settings,
                                         EmbeddingProvider& provider,
                                         AnswerGenerator& generator,
                                         ContentExtractor& extractor)
{
    auto engine = std::make_unique<QaEngine>(PrivateTag{}, settings);
    const Settings& s = engine->m_settings;

    auto store = SQLiteStore::open(s.dbPath);
    if (!store) {
        LOG_ERROR(dqCore, "Cannot open database %s", qUtf8Printable(s.dbPath));
        return nullptr;
    }
    engine->m_store = std::make_unique<SQLiteStore>(std::move(*store));

    if (provider.dimensions() != s.embeddingDimensions) {
        LOG_ERROR(dqCore, "Embedding provider has %d dimensions, settings expect %d",
                  provider.dimensions(), s.embeddingDimensions);
        return nullptr;
    }

    RetrievalConfig retrievalConfig;
    retrievalConfig.dimensions = s.embeddingDimensions;
    retrievalConfig.semanticCandidates = s.semanticCandidates;
    retrievalConfig.keywordCandidates = s.keywordCandidates;
    retrievalConfig.keywordRankScale = s.keywordRankScale;
    engine->m_retrieval = std::make_unique<RetrievalStore>(*engine->m_store, retrievalConfig);
    if (!engine->m_retrieval->open()) {
        LOG_ERROR(dqCore, "Cannot build the vector index");
        return nullptr;
    }

    engine->m_embedder = std::make_unique<EmbeddingClient>(provider);
    engine->m_access = std::make_unique<DocumentAccessFilter>(*engine->m_store);
    engine->m_cache = std::make_unique<AnswerCache>(*engine->m_store);

    RankerConfig rankerConfig;
    rankerConfig.semanticWeight = static_cast<float>(s.semanticWeight);
    rankerConfig.keywordWeight = static_cast<float>(s.keywordWeight);
    rankerConfig.limit = s.searchLimit;
    rankerConfig.semanticScoreFloor = static_cast<float>(s.semanticScoreFloor);
    rankerConfig.subSearchTimeoutMs = s.subSearchTimeoutMs;
    engine->m_ranker = std::make_unique<HybridRanker>(*engine->m_retrieval, *engine->m_store,
                                                      rankerConfig);

    IngestionConfig ingestionConfig;
    ingestionConfig.chunker.maxSize = s.chunkMaxSize;
    ingestionConfig.chunker.overlap = s.chunkOverlap;
    ingestionConfig.embeddingWorkers = s.embeddingWorkers;
    ingestionConfig.maxUploadBytes = s.maxUploadBytes;
    engine->m_pipeline = std::make_unique<IngestionPipeline>(
        *engine->m_store, *engine->m_retrieval, extractor, *engine->m_embedder, ingestionConfig);

    AnswerServiceConfig answerConfig;
    answerConfig.maxQuestionLength = s.maxQuestionLength;
    answerConfig.cacheSimilarityThreshold = static_cast<float>(s.cacheSimilarityThreshold);
    answerConfig.passageLimit = s.searchLimit;
    engine->m_answers = std::make_unique<AnswerService>(
        *engine->m_embedder, *engine->m_cache, *engine->m_access, *engine->m_ranker,
        generator, *engine->m_store, answerConfig);

    LOG_INFO(dqCore, "Engine ready on %s (%s)", qUtf8Printable(s.dbPath),
             qUtf8Printable(provider.modelId()));
    return engine;
}

std::optional<int> QaEngine::pruneCache(const QDateTime& now)
{
    return m_cache->prune(now, m_settings.cacheRetentionDays, m_settings.cacheMinHits);
}

} // namespace dq
