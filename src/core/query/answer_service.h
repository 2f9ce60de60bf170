#pragma once

#include "core/shared/deadline.h"
#include "core/shared/error.h"
#include "core/shared/passage.h"
#include "core/shared/types.h"

#include <QJsonArray>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace dq {

class AccessFilter;
class AnswerCache;
class AnswerGenerator;
class EmbeddingClient;
class HybridRanker;
class SQLiteStore;

struct AnswerServiceConfig {
    int maxQuestionLength = 5000;
    float cacheSimilarityThreshold = 0.85f;
    int passageLimit = 20;
    bool splitMultiPartQuestions = true;
};

struct AnswerResult {
    QString answer;
    std::vector<RankedPassage> passages;   // empty for cache hits
    QJsonArray sources;
    bool fromCache = false;
    bool insufficientInformation = false;
    bool degraded = false;                 // a sub-search timed out or failed
    std::optional<int64_t> cacheEntryId;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

struct CustomerQueryResult {
    std::optional<int64_t> id;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

// AnswerService: the query path: validate, embed, consult the cache, rank
// the caller's visible passages, generate, and remember the answer.
//
// "No answer in the documents" is a successful result carrying the
// insufficient-information sentinel and is never cached.
class AnswerService {
public:
    AnswerService(EmbeddingClient& embedder,
                  AnswerCache& cache,
                  AccessFilter& access,
                  HybridRanker& ranker,
                  AnswerGenerator& generator,
                  SQLiteStore& store,
                  AnswerServiceConfig config = {});

    AnswerService(const AnswerService&) = delete;
    AnswerService& operator=(const AnswerService&) = delete;

    AnswerResult ask(const QString& question, RoleTag role,
                     const Deadline& deadline = Deadline::never());

    // Stores a pending follow-up request from an external caller.
    CustomerQueryResult captureCustomerQuery(const QString& question,
                                             const QString& customerName,
                                             const QString& customerEmail);
    CustomerQueryResult setCustomerQueryStatus(int64_t id, CustomerQueryStatus status);

    static QJsonArray sourcesToJson(const std::vector<RankedPassage>& passages);

private:
    std::optional<Error> validateQuestion(const QString& question) const;
    std::vector<RankedPassage> searchParts(const QString& question,
                                           std::vector<RankedPassage> passages,
                                           const std::vector<int64_t>& documentIds,
                                           const Deadline& deadline,
                                           bool& degraded);

    EmbeddingClient& m_embedder;
    AnswerCache& m_cache;
    AccessFilter& m_access;
    HybridRanker& m_ranker;
    AnswerGenerator& m_generator;
    SQLiteStore& m_store;
    AnswerServiceConfig m_config;
};

} // namespace dq
