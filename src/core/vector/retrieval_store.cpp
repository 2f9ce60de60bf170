#include "core/vector/retrieval_store.h"
#include "core/shared/logging.h"
#include "core/shared/vector_math.h"

#include <QElapsedTimer>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace dq {

RetrievalStore::RetrievalStore(SQLiteStore& store, RetrievalConfig config)
    : m_store(store)
    , m_config(config)
    , m_index(std::make_unique<VectorIndex>(config.dimensions))
{
}

RetrievalStore::~RetrievalStore() = default;

// ── Index lifecycle ─────────────────────────────────────────

bool RetrievalStore::open()
{
    return rebuildVectorIndex();
}

bool RetrievalStore::rebuildVectorIndex()
{
    QElapsedTimer timer;
    timer.start();

    const std::vector<SQLiteStore::EmbeddingRow> rows = m_store.loadAllEmbeddings();
    const int capacity = std::max(VectorIndex::kInitialCapacity,
                                  static_cast<int>(rows.size()) * 2);
    if (!m_index->create(capacity)) {
        return false;
    }

    int loaded = 0;
    int skipped = 0;
    for (const SQLiteStore::EmbeddingRow& row : rows) {
        if (static_cast<int>(row.vector.size()) != m_config.dimensions) {
            ++skipped;
            continue;
        }
        if (m_index->addVector(row.chunkId, normalizeVector(row.vector))) {
            ++loaded;
        } else {
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARN(dqStore, "Vector index rebuild skipped %d embeddings (dimension %d expected)",
                 skipped, m_config.dimensions);
    }
    LOG_INFO(dqStore, "Vector index rebuilt: %d vectors in %lld ms",
             loaded, static_cast<long long>(timer.elapsed()));
    return true;
}

// ── Writes ──────────────────────────────────────────────────

std::optional<std::vector<int64_t>> RetrievalStore::putChunks(int64_t documentId,
                                                              const std::vector<Chunk>& chunks)
{
    return m_store.insertChunks(documentId, chunks);
}

bool RetrievalStore::putEmbedding(int64_t chunkId, const std::vector<float>& vector)
{
    if (static_cast<int>(vector.size()) != m_config.dimensions) {
        LOG_ERROR(dqStore, "Embedding for chunk %lld has %d dimensions, expected %d",
                  static_cast<long long>(chunkId),
                  static_cast<int>(vector.size()), m_config.dimensions);
        return false;
    }

    if (!m_store.upsertEmbedding(chunkId, vector)) {
        return false;
    }
    if (!m_index->addVector(chunkId, normalizeVector(vector))) {
        LOG_ERROR(dqStore, "Embedding for chunk %lld stored but not indexed",
                  static_cast<long long>(chunkId));
        return false;
    }
    return true;
}

std::vector<int64_t> RetrievalStore::chunksMissingEmbedding(int64_t documentId)
{
    return m_store.chunksMissingEmbedding(documentId);
}

bool RetrievalStore::deleteDocument(int64_t documentId)
{
    for (const int64_t chunkId : m_store.chunkIdsForDocuments({documentId})) {
        m_index->deleteVector(chunkId);
    }
    return m_store.deleteDocument(documentId);
}

// ── Searches ────────────────────────────────────────────────

std::vector<ScoredChunk> RetrievalStore::semanticSearch(const std::vector<float>& queryVector,
                                                        const std::vector<int64_t>& documentIds,
                                                        float scoreFloor)
{
    if (documentIds.empty() || queryVector.empty()) {
        return {};
    }

    const std::vector<int64_t> chunkIds = m_store.chunkIdsForDocuments(documentIds);
    if (chunkIds.empty()) {
        return {};
    }
    const std::unordered_set<int64_t> allowed(chunkIds.begin(), chunkIds.end());

    const int scopeSize = static_cast<int>(allowed.size());
    const int k = m_config.semanticCandidates > 0 ? std::min(m_config.semanticCandidates, scopeSize)
                                                   : scopeSize;
    const std::vector<VectorIndex::KnnResult> neighbours =
        m_index->search(normalizeVector(queryVector), k, &allowed);

    std::vector<ScoredChunk> results;
    results.reserve(neighbours.size());
    for (const VectorIndex::KnnResult& neighbour : neighbours) {
        const float score = 1.0f - neighbour.distance;
        if (score > scoreFloor) {
            results.push_back({neighbour.label, std::min(score, 1.0f)});
        }
    }

    LOG_DEBUG(dqRanking, "Semantic search: %d candidates, %d above floor %.2f",
              static_cast<int>(neighbours.size()), static_cast<int>(results.size()),
              static_cast<double>(scoreFloor));
    return results;
}

std::vector<ScoredChunk> RetrievalStore::keywordSearch(const QString& queryText,
                                                       const std::vector<int64_t>& documentIds)
{
    if (documentIds.empty()) {
        return {};
    }

    std::vector<SQLiteStore::KeywordHit> hits;
    QStringList terms = SQLiteStore::strictTermExpressions(queryText);
    if (!terms.isEmpty()) {
        hits = m_store.searchChunks(terms.join(QLatin1Char(' ')), documentIds,
                                    m_config.keywordCandidates);
    }
    if (hits.empty()) {
        terms = SQLiteStore::relaxedTermExpressions(queryText);
        if (!terms.isEmpty()) {
            hits = m_store.searchChunks(terms.join(QStringLiteral(" OR ")), documentIds,
                                        m_config.keywordCandidates);
        }
    }
    if (hits.empty()) {
        return {};
    }

    std::vector<int64_t> hitIds;
    hitIds.reserve(hits.size());
    for (const SQLiteStore::KeywordHit& hit : hits) {
        hitIds.push_back(hit.chunkId);
    }

    // One frequency row per query term, each holding a count per hit
    std::vector<std::unordered_map<int64_t, int>> perTerm;
    perTerm.reserve(static_cast<size_t>(terms.size()));
    for (const QString& term : terms) {
        perTerm.push_back(m_store.termFrequencies(term, hitIds));
    }

    std::vector<ScoredChunk> results;
    results.reserve(hits.size());
    std::vector<int> frequencies(perTerm.size(), 0);
    for (const int64_t chunkId : hitIds) {
        for (size_t t = 0; t < perTerm.size(); ++t) {
            const auto it = perTerm[t].find(chunkId);
            frequencies[t] = it == perTerm[t].end() ? 0 : it->second;
        }
        results.push_back({chunkId, keywordScore(frequencies, m_config.keywordRankScale)});
    }

    // bm25 order breaks ties
    std::stable_sort(results.begin(), results.end(),
                     [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });
    return results;
}

double RetrievalStore::termFrequencyRank(const std::vector<int>& termFrequencies)
{
    if (termFrequencies.empty()) {
        return 0.0;
    }
    constexpr double kTermWeight = 0.1;
    constexpr double kZeta2 = 1.64493406685;   // pi^2 / 6

    double rank = 0.0;
    for (const int tf : termFrequencies) {
        double harmonic = 0.0;
        for (int k = 1; k <= std::min(tf, 1000); ++k) {
            harmonic += 1.0 / (static_cast<double>(k) * k);
        }
        rank += kTermWeight * harmonic / kZeta2;
    }
    return rank / static_cast<double>(termFrequencies.size());
}

float RetrievalStore::keywordScore(const std::vector<int>& termFrequencies, double rankScale)
{
    return static_cast<float>(std::min(1.0, rankScale * termFrequencyRank(termFrequencies)));
}

} // namespace dq
