#pragma once

#include "core/shared/settings.h"

#include <QDateTime>

#include <memory>
#include <optional>

namespace dq {

class AnswerCache;
class AnswerGenerator;
class AnswerService;
class ContentExtractor;
class DocumentAccessFilter;
class EmbeddingClient;
class EmbeddingProvider;
class HybridRanker;
class IngestionPipeline;
class RetrievalStore;
class SQLiteStore;

// QaEngine: the ingestion and query components wired together over one
// database, configured from Settings. Providers are owned by the caller and
// must outlive the engine.
class QaEngine {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Construction goes through open(); the tag keeps it there.
    QaEngine(PrivateTag, const Settings& settings);
    ~QaEngine();

    QaEngine(const QaEngine&) = delete;
    QaEngine& operator=(const QaEngine&) = delete;

    // Opens (or creates) settings.dbPath and rebuilds the vector index.
    static std::unique_ptr<QaEngine> open(const Settings& settings,
                                          EmbeddingProvider& provider,
                                          AnswerGenerator& generator,
                                          ContentExtractor& extractor);

    SQLiteStore& store() { return *m_store; }
    RetrievalStore& retrieval() { return *m_retrieval; }
    EmbeddingClient& embedder() { return *m_embedder; }
    AnswerCache& cache() { return *m_cache; }
    HybridRanker& ranker() { return *m_ranker; }
    IngestionPipeline& pipeline() { return *m_pipeline; }
    AnswerService& answers() { return *m_answers; }
    const Settings& settings() const { return m_settings; }

    // Cache maintenance with the configured retention and hit floor.
    std::optional<int> pruneCache(const QDateTime& now = QDateTime::currentDateTimeUtc());

private:
    Settings m_settings;
    std::unique_ptr<SQLiteStore> m_store;
    std::unique_ptr<RetrievalStore> m_retrieval;
    std::unique_ptr<EmbeddingClient> m_embedder;
    std::unique_ptr<DocumentAccessFilter> m_access;
    std::unique_ptr<AnswerCache> m_cache;
    std::unique_ptr<HybridRanker> m_ranker;
    std::unique_ptr<IngestionPipeline> m_pipeline;
    std::unique_ptr<AnswerService> m_answers;
};

} // namespace dq
