#pragma once

#include "core/shared/chunk.h"
#include "core/shared/document.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonArray>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace dq {

// SQLiteStore: owner of the SQLite database.
// Rows for documents, chunks, embeddings, the answer cache and customer
// queries, plus the chunk_search FTS5 index. All public methods serialize
// on one recursive mutex, so a store may be shared across worker threads.
//
// Every insertChunks() call writes chunk rows and their chunk_search rows
// inside one SAVEPOINT; there is no path where one lands without the other.
class SQLiteStore {
public:
    ~SQLiteStore();

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept
        : m_db(other.m_db)
        , m_mutex(std::move(other.m_mutex))
    {
        other.m_db = nullptr;
    }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            m_mutex = std::move(other.m_mutex);
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path (":memory:" works).
    // Creates schema and sets pragmas on first open, then migrates.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── Documents ───────────────────────────────────────────

    // New documents start in processing. The owner role is always visible.
    std::optional<int64_t> insertDocument(const UploadRequest& upload);
    std::optional<Document> getDocument(int64_t documentId);
    std::vector<Document> listDocuments();

    // Non-failed statuses clear error_message.
    bool updateDocumentStatus(int64_t documentId, DocumentStatus status,
                              const std::optional<QString>& errorMessage = std::nullopt);
    bool updateDocumentVisibility(int64_t documentId, const VisibilitySet& visibleTo);

    // Cascades to chunks and embeddings, and clears chunk_search rows.
    bool deleteDocument(int64_t documentId);

    std::vector<int64_t> completedDocumentIdsVisibleTo(RoleTag role);

    // ── Chunks + FTS5 ───────────────────────────────────────

    // Atomic batch insert. Returns the new chunk ids in input order, or
    // nullopt with nothing written (e.g. a chunk_index already exists).
    std::optional<std::vector<int64_t>> insertChunks(int64_t documentId,
                                                     const std::vector<Chunk>& chunks);
    int countChunks(int64_t documentId);
    std::vector<Chunk> getChunksForDocument(int64_t documentId);
    std::vector<Chunk> getChunks(const std::vector<int64_t>& chunkIds);
    std::vector<int64_t> chunkIdsForDocuments(const std::vector<int64_t>& documentIds);

    // ── Embeddings ──────────────────────────────────────────

    // INSERT OR REPLACE keyed on chunk_id.
    bool upsertEmbedding(int64_t chunkId, const std::vector<float>& vector);
    std::vector<int64_t> chunksMissingEmbedding(int64_t documentId);
    int countEmbeddings(int64_t documentId);

    struct EmbeddingRow {
        int64_t chunkId = 0;
        int64_t documentId = 0;
        std::vector<float> vector;
    };
    std::vector<EmbeddingRow> loadAllEmbeddings();

    // ── Keyword search ──────────────────────────────────────

    struct KeywordHit {
        int64_t chunkId = 0;
        double bm25 = 0.0;   // FTS5 bm25(), negative; more negative is better
    };

    // Scoped to documentIds; an empty set yields nothing. limit <= 0 returns
    // every match.
    std::vector<KeywordHit> searchChunks(const QString& ftsQuery,
                                         const std::vector<int64_t>& documentIds,
                                         int limit);

    // Occurrences of one term expression ("refund" or "refund"*) in each of
    // chunkIds, counted with the chunk_search tokenizer. Chunks without the
    // term are absent from the map.
    std::unordered_map<int64_t, int> termFrequencies(const QString& termExpression,
                                                     const std::vector<int64_t>& chunkIds);

    // Question text -> FTS5 MATCH expression. Stop words and one-character
    // tokens are dropped. Strict requires every term; relaxed any term, with
    // prefix matching for terms of four or more characters.
    static QString buildStrictQuery(const QString& question);
    static QString buildRelaxedQuery(const QString& question);
    static QStringList strictTermExpressions(const QString& question);
    static QStringList relaxedTermExpressions(const QString& question);
    static QStringList searchTerms(const QString& question);

    // ── Answer cache rows ───────────────────────────────────

    struct CacheRow {
        int64_t id = 0;
        QString question;
        QString role;
        std::vector<float> embedding;
        QString answer;
        QJsonArray sources;
        int hitCount = 0;
        QDateTime lastHitAt;
        QDateTime createdAt;
        QDateTime updatedAt;
    };

    std::vector<CacheRow> cacheEntriesForRole(const QString& role);
    std::optional<CacheRow> getCacheEntry(const QString& question, const QString& role);
    std::optional<CacheRow> getCacheEntryById(int64_t id);

    // hit_count + 1, last_hit_at = now. Returns the updated row.
    std::optional<CacheRow> recordCacheHit(int64_t id);

    // Insert with hit_count 1, or on (question, role) conflict refresh
    // answer/embedding/sources and bump hit_count.
    bool upsertCacheEntry(const QString& question, const QString& role,
                          const std::vector<float>& embedding,
                          const QString& answer, const QJsonArray& sources);

    // Deletes rows created before cutoff with hit_count < minHits.
    std::optional<int> pruneCacheEntries(const QDateTime& cutoff, int minHits);
    int countCacheEntries();

    // ── Customer queries ────────────────────────────────────

    std::optional<int64_t> insertCustomerQuery(const QString& question,
                                               const QString& customerName,
                                               const QString& customerEmail);
    bool updateCustomerQueryStatus(int64_t id, CustomerQueryStatus status);
    std::vector<CustomerQuery> listCustomerQueries(
        std::optional<CustomerQueryStatus> status = std::nullopt);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── Maintenance ─────────────────────────────────────────

    bool optimizeFts5();
    bool integrityCheck() const;

    // Raw handle for tests that need to inspect the schema directly.
    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore();
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    std::optional<CacheRow> selectCacheRow(const char* whereClause,
                                           const std::function<void(sqlite3_stmt*)>& bind);

    sqlite3* m_db = nullptr;
    std::unique_ptr<std::recursive_mutex> m_mutex;
};

} // namespace dq
