#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/index/migration.h"
#include "core/shared/logging.h"
#include "core/shared/vector_math.h"
#include <sqlite3.h>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

#include <cmath>
#include <cstring>
#include <unordered_map>

namespace dq {

namespace {

constexpr const char* kDocumentColumns =
    "id, filename, size_bytes, media_type, storage_path, status, error_message, "
    "visible_to, created_at, updated_at";

constexpr const char* kChunkColumns =
    "id, document_id, chunk_index, content, metadata, content_hash";

constexpr const char* kCacheColumns =
    "id, question, role, embedding, answer, sources, hit_count, last_hit_at, "
    "created_at, updated_at";

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

double toSeconds(const QDateTime& dt)
{
    return static_cast<double>(dt.toMSecsSinceEpoch()) / 1000.0;
}

QDateTime fromSeconds(double seconds)
{
    if (seconds <= 0.0) {
        return {};
    }
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(std::llround(seconds * 1000.0)));
}

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

// Integer ids are formatted inline so large scopes never run into
// SQLITE_MAX_VARIABLE_NUMBER.
QString idList(const std::vector<int64_t>& ids)
{
    QStringList parts;
    parts.reserve(static_cast<int>(ids.size()));
    for (const int64_t id : ids) {
        parts.append(QString::number(id));
    }
    return parts.join(QLatin1Char(','));
}

Document readDocument(sqlite3_stmt* stmt)
{
    Document doc;
    doc.id = sqlite3_column_int64(stmt, 0);
    doc.filename = columnText(stmt, 1);
    doc.sizeBytes = sqlite3_column_int64(stmt, 2);
    doc.mediaType = columnText(stmt, 3);
    doc.storagePath = columnText(stmt, 4);
    doc.status = documentStatusFromString(columnText(stmt, 5)).value_or(DocumentStatus::Failed);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        doc.errorMessage = columnText(stmt, 6);
    }
    doc.visibleTo = VisibilitySet::fromBits(sqlite3_column_int(stmt, 7));
    doc.createdAt = fromSeconds(sqlite3_column_double(stmt, 8));
    doc.updatedAt = fromSeconds(sqlite3_column_double(stmt, 9));
    return doc;
}

Chunk readChunk(sqlite3_stmt* stmt)
{
    Chunk chunk;
    chunk.id = sqlite3_column_int64(stmt, 0);
    chunk.documentId = sqlite3_column_int64(stmt, 1);
    chunk.chunkIndex = sqlite3_column_int(stmt, 2);
    chunk.content = columnText(stmt, 3);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        chunk.metadata = QJsonDocument::fromJson(columnText(stmt, 4).toUtf8()).object();
    }
    chunk.contentHash = columnText(stmt, 5);
    return chunk;
}

SQLiteStore::CacheRow readCacheRow(sqlite3_stmt* stmt)
{
    SQLiteStore::CacheRow row;
    row.id = sqlite3_column_int64(stmt, 0);
    row.question = columnText(stmt, 1);
    row.role = columnText(stmt, 2);
    row.embedding = decodeVectorBlob(sqlite3_column_blob(stmt, 3), sqlite3_column_bytes(stmt, 3));
    row.answer = columnText(stmt, 4);
    row.sources = QJsonDocument::fromJson(columnText(stmt, 5).toUtf8()).array();
    row.hitCount = sqlite3_column_int(stmt, 6);
    row.lastHitAt = fromSeconds(sqlite3_column_double(stmt, 7));
    row.createdAt = fromSeconds(sqlite3_column_double(stmt, 8));
    row.updatedAt = fromSeconds(sqlite3_column_double(stmt, 9));
    return row;
}

} // namespace

// ── Open / close ────────────────────────────────────────────

SQLiteStore::SQLiteStore()
    : m_mutex(std::make_unique<std::recursive_mutex>())
{
}

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(dqStore, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(dqStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='documents'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(dqStore, "Failed to set database pragmas");
            return false;
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(dqStore, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings)) {
            LOG_ERROR(dqStore, "Failed to insert default settings");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(dqStore, "Migration failed");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        // Restrict database file permissions to owner-only (0600)
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(dqStore, "Database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(dqStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Documents ───────────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertDocument(const UploadRequest& upload)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        INSERT INTO documents (filename, size_bytes, media_type, storage_path,
                               status, visible_to, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, 'processing', ?5, ?6, ?6)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "insertDocument prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    VisibilitySet visibleTo = upload.visibleTo;
    visibleTo.insert(RoleTag::Owner);

    const QByteArray nameUtf8 = upload.filename.toUtf8();
    const QByteArray mediaUtf8 = upload.mediaType.toUtf8();
    const QByteArray pathUtf8 = upload.storagePath.toUtf8();
    sqlite3_bind_text(stmt, 1, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, upload.sizeBytes);
    sqlite3_bind_text(stmt, 3, mediaUtf8.constData(), -1, SQLITE_STATIC);
    if (upload.storagePath.isEmpty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, pathUtf8.constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 5, visibleTo.bits());
    sqlite3_bind_double(stmt, 6, nowSeconds());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqStore, "insertDocument failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
}

std::optional<Document> SQLiteStore::getDocument(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT %1 FROM documents WHERE id = ?1")
                               .arg(QLatin1String(kDocumentColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "getDocument prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, documentId);

    std::optional<Document> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readDocument(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Document> SQLiteStore::listDocuments()
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT %1 FROM documents ORDER BY id")
                               .arg(QLatin1String(kDocumentColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "listDocuments prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    std::vector<Document> documents;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        documents.push_back(readDocument(stmt));
    }
    sqlite3_finalize(stmt);
    return documents;
}

bool SQLiteStore::updateDocumentStatus(int64_t documentId, DocumentStatus status,
                                       const std::optional<QString>& errorMessage)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        UPDATE documents SET status = ?1, error_message = ?2, updated_at = ?3
        WHERE id = ?4
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "updateDocumentStatus prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray statusUtf8 = documentStatusToString(status).toUtf8();
    const QByteArray messageUtf8 = errorMessage.value_or(QString()).toUtf8();
    sqlite3_bind_text(stmt, 1, statusUtf8.constData(), -1, SQLITE_STATIC);
    if (status == DocumentStatus::Failed && errorMessage.has_value()) {
        sqlite3_bind_text(stmt, 2, messageUtf8.constData(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_double(stmt, 3, nowSeconds());
    sqlite3_bind_int64(stmt, 4, documentId);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqStore, "updateDocumentStatus failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

bool SQLiteStore::updateDocumentVisibility(int64_t documentId, const VisibilitySet& visibleTo)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    VisibilitySet effective = visibleTo;
    effective.insert(RoleTag::Owner);

    const char* sql = "UPDATE documents SET visible_to = ?1, updated_at = ?2 WHERE id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "updateDocumentVisibility prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int(stmt, 1, effective.bits());
    sqlite3_bind_double(stmt, 2, nowSeconds());
    sqlite3_bind_int64(stmt, 3, documentId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

bool SQLiteStore::deleteDocument(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    if (!execSql("SAVEPOINT delete_document")) return false;

    auto fail = [this](const char* what) {
        LOG_ERROR(dqStore, "deleteDocument %s: %s", what, sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT delete_document");
        execSql("RELEASE SAVEPOINT delete_document");
        return false;
    };

    // FTS5 rows first (no cascade on virtual tables)
    {
        const char* sql =
            "DELETE FROM chunk_search WHERE rowid IN (SELECT id FROM chunks WHERE document_id = ?1)";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("fts prepare");
        }
        sqlite3_bind_int64(stmt, 1, documentId);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail("fts delete");
        }
    }

    int removed = 0;
    {
        const char* sql = "DELETE FROM documents WHERE id = ?1";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("prepare");
        }
        sqlite3_bind_int64(stmt, 1, documentId);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail("delete");
        }
        removed = sqlite3_changes(m_db);
    }

    if (!execSql("RELEASE SAVEPOINT delete_document")) return false;
    return removed > 0;
}

std::vector<int64_t> SQLiteStore::completedDocumentIdsVisibleTo(RoleTag role)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        SELECT id FROM documents
        WHERE status = 'completed' AND (visible_to & ?1) != 0
        ORDER BY id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "completedDocumentIdsVisibleTo prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    sqlite3_bind_int(stmt, 1, VisibilitySet::bitFor(role));

    std::vector<int64_t> ids;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// ── Chunks + FTS5 (atomic) ──────────────────────────────────

std::optional<std::vector<int64_t>> SQLiteStore::insertChunks(
    int64_t documentId, const std::vector<Chunk>& chunks)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    // SAVEPOINT so this nests inside a caller's transaction as well.
    if (!execSql("SAVEPOINT insert_chunks")) return std::nullopt;

    const char* chunkSql = R"(
        INSERT INTO chunks (document_id, chunk_index, content, metadata, content_hash)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";
    const char* ftsSql = "INSERT INTO chunk_search (rowid, content) VALUES (?1, ?2)";

    sqlite3_stmt* chunkStmt = nullptr;
    sqlite3_stmt* ftsStmt = nullptr;

    auto fail = [&](const char* what) -> std::optional<std::vector<int64_t>> {
        LOG_ERROR(dqStore, "insertChunks %s: %s", what, sqlite3_errmsg(m_db));
        sqlite3_finalize(chunkStmt);
        sqlite3_finalize(ftsStmt);
        execSql("ROLLBACK TO SAVEPOINT insert_chunks");
        execSql("RELEASE SAVEPOINT insert_chunks");
        return std::nullopt;
    };

    if (sqlite3_prepare_v2(m_db, chunkSql, -1, &chunkStmt, nullptr) != SQLITE_OK) {
        return fail("chunk prepare");
    }
    if (sqlite3_prepare_v2(m_db, ftsSql, -1, &ftsStmt, nullptr) != SQLITE_OK) {
        return fail("fts prepare");
    }

    std::vector<int64_t> ids;
    ids.reserve(chunks.size());

    for (const Chunk& chunk : chunks) {
        const QByteArray textUtf8 = chunk.content.toUtf8();
        const QByteArray hashUtf8 = chunk.contentHash.toUtf8();
        const QByteArray metaUtf8 = chunk.metadata.isEmpty()
            ? QByteArray()
            : QJsonDocument(chunk.metadata).toJson(QJsonDocument::Compact);

        sqlite3_reset(chunkStmt);
        sqlite3_clear_bindings(chunkStmt);
        sqlite3_bind_int64(chunkStmt, 1, documentId);
        sqlite3_bind_int(chunkStmt, 2, chunk.chunkIndex);
        sqlite3_bind_text(chunkStmt, 3, textUtf8.constData(), -1, SQLITE_STATIC);
        if (metaUtf8.isEmpty()) {
            sqlite3_bind_null(chunkStmt, 4);
        } else {
            sqlite3_bind_text(chunkStmt, 4, metaUtf8.constData(), -1, SQLITE_STATIC);
        }
        sqlite3_bind_text(chunkStmt, 5, hashUtf8.constData(), -1, SQLITE_STATIC);
        if (sqlite3_step(chunkStmt) != SQLITE_DONE) {
            return fail("chunk insert");
        }

        const int64_t chunkId = sqlite3_last_insert_rowid(m_db);

        // chunk_search row MUST land with the chunk row
        sqlite3_reset(ftsStmt);
        sqlite3_clear_bindings(ftsStmt);
        sqlite3_bind_int64(ftsStmt, 1, chunkId);
        sqlite3_bind_text(ftsStmt, 2, textUtf8.constData(), -1, SQLITE_STATIC);
        if (sqlite3_step(ftsStmt) != SQLITE_DONE) {
            return fail("fts insert");
        }

        ids.push_back(chunkId);
    }

    sqlite3_finalize(chunkStmt);
    sqlite3_finalize(ftsStmt);
    if (!execSql("RELEASE SAVEPOINT insert_chunks")) {
        return std::nullopt;
    }
    return ids;
}

int SQLiteStore::countChunks(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM chunks WHERE document_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, documentId);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<Chunk> SQLiteStore::getChunksForDocument(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql =
        QStringLiteral("SELECT %1 FROM chunks WHERE document_id = ?1 ORDER BY chunk_index")
            .arg(QLatin1String(kChunkColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "getChunksForDocument prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    sqlite3_bind_int64(stmt, 1, documentId);

    std::vector<Chunk> chunks;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        chunks.push_back(readChunk(stmt));
    }
    sqlite3_finalize(stmt);
    return chunks;
}

std::vector<Chunk> SQLiteStore::getChunks(const std::vector<int64_t>& chunkIds)
{
    if (chunkIds.empty()) {
        return {};
    }
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT %1 FROM chunks WHERE id IN (%2)")
                               .arg(QLatin1String(kChunkColumns), idList(chunkIds))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "getChunks prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    std::unordered_map<int64_t, Chunk> byId;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Chunk chunk = readChunk(stmt);
        const int64_t id = chunk.id;
        byId.emplace(id, std::move(chunk));
    }
    sqlite3_finalize(stmt);

    // Preserve caller order; silently skip ids that no longer exist
    std::vector<Chunk> chunks;
    chunks.reserve(byId.size());
    for (const int64_t id : chunkIds) {
        auto it = byId.find(id);
        if (it != byId.end()) {
            chunks.push_back(it->second);
        }
    }
    return chunks;
}

std::vector<int64_t> SQLiteStore::chunkIdsForDocuments(const std::vector<int64_t>& documentIds)
{
    if (documentIds.empty()) {
        return {};
    }
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT id FROM chunks WHERE document_id IN (%1)")
                               .arg(idList(documentIds)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "chunkIdsForDocuments prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    std::vector<int64_t> ids;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// ── Embeddings ──────────────────────────────────────────────

bool SQLiteStore::upsertEmbedding(int64_t chunkId, const std::vector<float>& vector)
{
    if (vector.empty()) {
        LOG_WARN(dqStore, "upsertEmbedding: empty vector for chunk %lld",
                 static_cast<long long>(chunkId));
        return false;
    }
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        INSERT OR REPLACE INTO embeddings (chunk_id, dimensions, vector, created_at)
        VALUES (?1, ?2, ?3, ?4)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "upsertEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray blob = encodeVectorBlob(vector);
    sqlite3_bind_int64(stmt, 1, chunkId);
    sqlite3_bind_int(stmt, 2, static_cast<int>(vector.size()));
    sqlite3_bind_blob(stmt, 3, blob.constData(), blob.size(), SQLITE_STATIC);
    sqlite3_bind_double(stmt, 4, nowSeconds());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqStore, "upsertEmbedding failed for chunk %lld: %s",
                  static_cast<long long>(chunkId), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::vector<int64_t> SQLiteStore::chunksMissingEmbedding(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        SELECT c.id FROM chunks c
        LEFT JOIN embeddings e ON e.chunk_id = c.id
        WHERE c.document_id = ?1 AND e.id IS NULL
        ORDER BY c.chunk_index
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "chunksMissingEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    sqlite3_bind_int64(stmt, 1, documentId);

    std::vector<int64_t> ids;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

int SQLiteStore::countEmbeddings(int64_t documentId)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        SELECT COUNT(*) FROM embeddings e
        JOIN chunks c ON c.id = e.chunk_id
        WHERE c.document_id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, documentId);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<SQLiteStore::EmbeddingRow> SQLiteStore::loadAllEmbeddings()
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        SELECT e.chunk_id, c.document_id, e.vector
        FROM embeddings e
        JOIN chunks c ON c.id = e.chunk_id
        ORDER BY e.chunk_id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "loadAllEmbeddings prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    std::vector<EmbeddingRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        EmbeddingRow row;
        row.chunkId = sqlite3_column_int64(stmt, 0);
        row.documentId = sqlite3_column_int64(stmt, 1);
        row.vector = decodeVectorBlob(sqlite3_column_blob(stmt, 2), sqlite3_column_bytes(stmt, 2));
        rows.push_back(std::move(row));
    }
    sqlite3_finalize(stmt);
    return rows;
}

// ── Keyword search ──────────────────────────────────────────

QStringList SQLiteStore::searchTerms(const QString& question)
{
    const QString normalized = question.toLower().trimmed();
    if (normalized.isEmpty()) {
        return {};
    }

    static const QRegularExpression tokenRegex(
        QStringLiteral(R"([\p{L}\p{N}_]+)"),
        QRegularExpression::UseUnicodePropertiesOption);
    static const QSet<QString> stopwords = {
        QStringLiteral("a"),     QStringLiteral("about"), QStringLiteral("an"),
        QStringLiteral("and"),   QStringLiteral("any"),   QStringLiteral("are"),
        QStringLiteral("as"),    QStringLiteral("at"),    QStringLiteral("be"),
        QStringLiteral("by"),    QStringLiteral("can"),   QStringLiteral("do"),
        QStringLiteral("does"),  QStringLiteral("for"),   QStringLiteral("from"),
        QStringLiteral("how"),   QStringLiteral("in"),    QStringLiteral("is"),
        QStringLiteral("it"),    QStringLiteral("me"),    QStringLiteral("my"),
        QStringLiteral("of"),    QStringLiteral("on"),    QStringLiteral("or"),
        QStringLiteral("our"),   QStringLiteral("that"),  QStringLiteral("the"),
        QStringLiteral("there"), QStringLiteral("this"),  QStringLiteral("to"),
        QStringLiteral("was"),   QStringLiteral("we"),    QStringLiteral("what"),
        QStringLiteral("when"),  QStringLiteral("where"), QStringLiteral("which"),
        QStringLiteral("who"),   QStringLiteral("why"),   QStringLiteral("with"),
        QStringLiteral("you"),   QStringLiteral("your"),
    };

    QStringList terms;
    QSet<QString> seen;
    auto matchIt = tokenRegex.globalMatch(normalized);
    while (matchIt.hasNext()) {
        const QString token = matchIt.next().captured(0);
        if (token.size() < 2 || stopwords.contains(token) || seen.contains(token)) {
            continue;
        }
        seen.insert(token);
        terms.append(token);
        if (terms.size() >= 12) {
            break;
        }
    }
    return terms;
}

QStringList SQLiteStore::strictTermExpressions(const QString& question)
{
    QStringList quoted;
    for (const QString& term : searchTerms(question)) {
        quoted.append(QLatin1Char('"') + term + QLatin1Char('"'));
    }
    return quoted;
}

QStringList SQLiteStore::relaxedTermExpressions(const QString& question)
{
    QStringList quoted;
    for (const QString& term : searchTerms(question)) {
        QString expr = QLatin1Char('"') + term + QLatin1Char('"');
        if (term.size() >= 4) {
            expr += QLatin1Char('*');
        }
        quoted.append(expr);
    }
    return quoted;
}

QString SQLiteStore::buildStrictQuery(const QString& question)
{
    return strictTermExpressions(question).join(QLatin1Char(' '));
}

QString SQLiteStore::buildRelaxedQuery(const QString& question)
{
    return relaxedTermExpressions(question).join(QStringLiteral(" OR "));
}

std::vector<SQLiteStore::KeywordHit> SQLiteStore::searchChunks(
    const QString& ftsQuery, const std::vector<int64_t>& documentIds, int limit)
{
    if (ftsQuery.trimmed().isEmpty() || documentIds.empty()) {
        return {};
    }
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral(R"(
        SELECT c.id, bm25(chunk_search) AS score
        FROM chunk_search
        JOIN chunks c ON c.id = chunk_search.rowid
        WHERE chunk_search MATCH ?1 AND c.document_id IN (%1)
        ORDER BY score
        LIMIT ?2
    )").arg(idList(documentIds)).toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "FTS5 search prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    const QByteArray queryUtf8 = ftsQuery.toUtf8();
    sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);   // LIMIT -1 is unbounded

    std::vector<KeywordHit> hits;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        KeywordHit hit;
        hit.chunkId = sqlite3_column_int64(stmt, 0);
        hit.bm25 = sqlite3_column_double(stmt, 1);
        hits.push_back(hit);
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(dqStore, "FTS5 search '%s' failed: %s",
                 queryUtf8.constData(), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return hits;
}

std::unordered_map<int64_t, int> SQLiteStore::termFrequencies(const QString& termExpression,
                                                              const std::vector<int64_t>& chunkIds)
{
    std::unordered_map<int64_t, int> frequencies;
    if (termExpression.trimmed().isEmpty() || chunkIds.empty()) {
        return frequencies;
    }
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    // highlight() wraps every matched token in \x01 ... \x02
    const QByteArray sql = QStringLiteral(R"(
        SELECT rowid, highlight(chunk_search, 0, char(1), char(2))
        FROM chunk_search
        WHERE chunk_search MATCH ?1 AND rowid IN (%1)
    )").arg(idList(chunkIds)).toUtf8();

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "FTS5 term frequency prepare: %s", sqlite3_errmsg(m_db));
        return frequencies;
    }

    const QByteArray termUtf8 = termExpression.toUtf8();
    sqlite3_bind_text(stmt, 1, termUtf8.constData(), -1, SQLITE_STATIC);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* marked = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const int bytes = sqlite3_column_bytes(stmt, 1);
        int count = 0;
        for (int i = 0; marked != nullptr && i < bytes; ++i) {
            if (marked[i] == '\x01') {
                ++count;
            }
        }
        if (count > 0) {
            frequencies[sqlite3_column_int64(stmt, 0)] = count;
        }
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(dqStore, "FTS5 term frequency '%s' failed: %s",
                 termUtf8.constData(), sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return frequencies;
}

// ── Answer cache rows ───────────────────────────────────────

std::optional<SQLiteStore::CacheRow> SQLiteStore::selectCacheRow(
    const char* whereClause, const std::function<void(sqlite3_stmt*)>& bind)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT %1 FROM query_cache WHERE %2")
                               .arg(QLatin1String(kCacheColumns), QLatin1String(whereClause))
                               .toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqCache, "cache select prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bind(stmt);

    std::optional<CacheRow> row;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        row = readCacheRow(stmt);
    }
    sqlite3_finalize(stmt);
    return row;
}

std::vector<SQLiteStore::CacheRow> SQLiteStore::cacheEntriesForRole(const QString& role)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const QByteArray sql = QStringLiteral("SELECT %1 FROM query_cache WHERE role = ?1 ORDER BY id")
                               .arg(QLatin1String(kCacheColumns)).toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqCache, "cacheEntriesForRole prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    const QByteArray roleUtf8 = role.toUtf8();
    sqlite3_bind_text(stmt, 1, roleUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<CacheRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(readCacheRow(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::optional<SQLiteStore::CacheRow> SQLiteStore::getCacheEntry(const QString& question,
                                                                const QString& role)
{
    const QByteArray questionUtf8 = question.toUtf8();
    const QByteArray roleUtf8 = role.toUtf8();
    return selectCacheRow("question = ?1 AND role = ?2", [&](sqlite3_stmt* stmt) {
        sqlite3_bind_text(stmt, 1, questionUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, roleUtf8.constData(), -1, SQLITE_STATIC);
    });
}

std::optional<SQLiteStore::CacheRow> SQLiteStore::getCacheEntryById(int64_t id)
{
    return selectCacheRow("id = ?1", [id](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, id);
    });
}

std::optional<SQLiteStore::CacheRow> SQLiteStore::recordCacheHit(int64_t id)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        UPDATE query_cache SET hit_count = hit_count + 1, last_hit_at = ?1
        WHERE id = ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqCache, "recordCacheHit prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_double(stmt, 1, nowSeconds());
    sqlite3_bind_int64(stmt, 2, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE || sqlite3_changes(m_db) == 0) {
        LOG_WARN(dqCache, "recordCacheHit: entry %lld not updated", static_cast<long long>(id));
        return std::nullopt;
    }
    return getCacheEntryById(id);
}

bool SQLiteStore::upsertCacheEntry(const QString& question, const QString& role,
                                   const std::vector<float>& embedding,
                                   const QString& answer, const QJsonArray& sources)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        INSERT INTO query_cache (question, role, embedding, answer, sources,
                                 hit_count, last_hit_at, created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, 1, ?6, ?6, ?6)
        ON CONFLICT(question, role) DO UPDATE SET
            answer = excluded.answer,
            embedding = excluded.embedding,
            sources = excluded.sources,
            hit_count = query_cache.hit_count + 1,
            last_hit_at = excluded.last_hit_at,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqCache, "upsertCacheEntry prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray questionUtf8 = question.toUtf8();
    const QByteArray roleUtf8 = role.toUtf8();
    const QByteArray blob = encodeVectorBlob(embedding);
    const QByteArray answerUtf8 = answer.toUtf8();
    const QByteArray sourcesUtf8 = QJsonDocument(sources).toJson(QJsonDocument::Compact);

    sqlite3_bind_text(stmt, 1, questionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, roleUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 3, blob.constData(), blob.size(), SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, answerUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, sourcesUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 6, nowSeconds());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqCache, "upsertCacheEntry failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<int> SQLiteStore::pruneCacheEntries(const QDateTime& cutoff, int minHits)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = "DELETE FROM query_cache WHERE created_at < ?1 AND hit_count < ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqCache, "pruneCacheEntries prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_double(stmt, 1, toSeconds(cutoff));
    sqlite3_bind_int(stmt, 2, minHits);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqCache, "pruneCacheEntries failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_changes(m_db);
}

int SQLiteStore::countCacheEntries()
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM query_cache", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Customer queries ────────────────────────────────────────

std::optional<int64_t> SQLiteStore::insertCustomerQuery(const QString& question,
                                                        const QString& customerName,
                                                        const QString& customerEmail)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        INSERT INTO customer_queries (question, customer_name, customer_email, status, created_at)
        VALUES (?1, ?2, ?3, 'pending', ?4)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "insertCustomerQuery prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray questionUtf8 = question.toUtf8();
    const QByteArray nameUtf8 = customerName.toUtf8();
    const QByteArray emailUtf8 = customerEmail.toUtf8();
    sqlite3_bind_text(stmt, 1, questionUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, emailUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 4, nowSeconds());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(dqStore, "insertCustomerQuery failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
}

bool SQLiteStore::updateCustomerQueryStatus(int64_t id, CustomerQueryStatus status)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = "UPDATE customer_queries SET status = ?1 WHERE id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray statusUtf8 = customerQueryStatusToString(status).toUtf8();
    sqlite3_bind_text(stmt, 1, statusUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::vector<CustomerQuery> SQLiteStore::listCustomerQueries(
    std::optional<CustomerQueryStatus> status)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = status.has_value()
        ? "SELECT id, question, customer_name, customer_email, status, created_at "
          "FROM customer_queries WHERE status = ?1 ORDER BY created_at DESC, id DESC"
        : "SELECT id, question, customer_name, customer_email, status, created_at "
          "FROM customer_queries ORDER BY created_at DESC, id DESC";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(dqStore, "listCustomerQueries prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    QByteArray statusUtf8;
    if (status.has_value()) {
        statusUtf8 = customerQueryStatusToString(*status).toUtf8();
        sqlite3_bind_text(stmt, 1, statusUtf8.constData(), -1, SQLITE_STATIC);
    }

    std::vector<CustomerQuery> queries;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CustomerQuery query;
        query.id = sqlite3_column_int64(stmt, 0);
        query.question = columnText(stmt, 1);
        query.customerName = columnText(stmt, 2);
        query.customerEmail = columnText(stmt, 3);
        query.status = customerQueryStatusFromString(columnText(stmt, 4))
                           .value_or(CustomerQueryStatus::Pending);
        query.createdAt = fromSeconds(sqlite3_column_double(stmt, 5));
        queries.push_back(std::move(query));
    }
    sqlite3_finalize(stmt);
    return queries;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valUtf8.constData(), -1, SQLITE_STATIC);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── Maintenance ─────────────────────────────────────────────

bool SQLiteStore::optimizeFts5()
{
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);
    return execSql("INSERT INTO chunk_search(chunk_search) VALUES('optimize')");
}

bool SQLiteStore::integrityCheck() const
{
    if (!m_db) return false;
    std::lock_guard<std::recursive_mutex> lock(*m_mutex);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace dq
