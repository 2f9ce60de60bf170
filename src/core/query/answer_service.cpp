#include "core/query/answer_service.h"
#include "core/access/access_filter.h"
#include "core/embedding/embedding_client.h"
#include "core/generation/answer_generator.h"
#include "core/index/sqlite_store.h"
#include "core/query/answer_cache.h"
#include "core/query/question_splitter.h"
#include "core/ranking/hybrid_ranker.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QJsonObject>
#include <QRegularExpression>

#include <algorithm>
#include <unordered_map>

namespace dq {

namespace {

Error embeddingError(const EmbeddingResult& result)
{
    if (result.status == EmbeddingResult::Status::Cancelled) {
        return Error::cancelled(result.errorMessage);
    }
    return Error::upstream(QStringLiteral("embedding unavailable: %1").arg(result.errorMessage));
}

AnswerResult failed(Error error)
{
    AnswerResult result;
    result.error = std::move(error);
    return result;
}

} // namespace

AnswerService::AnswerService(EmbeddingClient& embedder,
                             AnswerCache& cache,
                             AccessFilter& access,
                             HybridRanker& ranker,
                             AnswerGenerator& generator,
                             SQLiteStore& store,
                             AnswerServiceConfig config)
    : m_embedder(embedder)
    , m_cache(cache)
    , m_access(access)
    , m_ranker(ranker)
    , m_generator(generator)
    , m_store(store)
    , m_config(config)
{
}

std::optional<Error> AnswerService::validateQuestion(const QString& question) const
{
    const QString trimmed = question.trimmed();
    if (trimmed.isEmpty()) {
        return Error::validation(QStringLiteral("question is empty"));
    }
    if (trimmed.size() > m_config.maxQuestionLength) {
        return Error::validation(QStringLiteral("question exceeds %1 characters")
                                     .arg(m_config.maxQuestionLength));
    }
    return std::nullopt;
}

// ── Ask ─────────────────────────────────────────────────────

AnswerResult AnswerService::ask(const QString& question, RoleTag role, const Deadline& deadline)
{
    if (auto invalid = validateQuestion(question)) {
        return failed(*invalid);
    }
    const QString trimmed = question.trimmed();

    QElapsedTimer timer;
    timer.start();

    const EmbeddingResult embedded = m_embedder.embed(trimmed, deadline);
    if (!embedded.ok()) {
        LOG_WARN(dqQuery, "Question embedding failed: %s", qUtf8Printable(embedded.errorMessage));
        return failed(embeddingError(embedded));
    }

    if (auto hit = m_cache.lookup(embedded.vector, role, m_config.cacheSimilarityThreshold)) {
        AnswerResult result;
        result.answer = hit->entry.answer;
        result.sources = hit->entry.sources;
        result.fromCache = true;
        result.cacheEntryId = hit->entry.id;
        result.insufficientInformation = containsInsufficientInformation(result.answer);
        LOG_INFO(dqQuery, "Answered from cache entry %lld in %lld ms",
                 static_cast<long long>(hit->entry.id),
                 static_cast<long long>(timer.elapsed()));
        return result;
    }

    const std::vector<int64_t> documentIds = m_access.documentIdsFor(role);
    if (documentIds.empty()) {
        return failed(Error::notFound(QStringLiteral("no documents available")));
    }

    if (deadline.expired()) {
        return failed(Error::cancelled(QStringLiteral("deadline expired before search")));
    }

    AnswerResult result;
    HybridSearchResult searched = m_ranker.search(trimmed, embedded.vector, documentIds, deadline);
    result.degraded = searched.degraded();
    result.passages = m_config.splitMultiPartQuestions
        ? searchParts(trimmed, std::move(searched.passages), documentIds, deadline, result.degraded)
        : std::move(searched.passages);

    if (result.passages.empty()) {
        result.answer = insufficientInformationAnswer();
        result.insufficientInformation = true;
        LOG_INFO(dqQuery, "No passages for question across %zu documents", documentIds.size());
        return result;
    }

    const GenerationResult generated = m_generator.answer(trimmed, result.passages, deadline);
    if (generated.status == GenerationResult::Status::Cancelled) {
        return failed(Error::cancelled(generated.errorMessage));
    }
    if (generated.status != GenerationResult::Status::Success) {
        LOG_WARN(dqQuery, "Answer generation failed: %s", qUtf8Printable(generated.errorMessage));
        return failed(Error::upstream(QStringLiteral("generation unavailable: %1")
                                          .arg(generated.errorMessage)));
    }

    result.answer = generated.answer;
    result.sources = sourcesToJson(result.passages);
    result.insufficientInformation = containsInsufficientInformation(result.answer);

    if (!result.insufficientInformation) {
        // Cache write failures never fail the answer
        if (!m_cache.save(trimmed, embedded.vector, result.answer, result.sources, role)) {
            LOG_WARN(dqQuery, "Failed to cache answer; returning it uncached");
        }
    }

    LOG_INFO(dqQuery, "Answered from %zu passages in %lld ms%s",
             result.passages.size(), static_cast<long long>(timer.elapsed()),
             result.degraded ? " (degraded)" : "");
    return result;
}

std::vector<RankedPassage> AnswerService::searchParts(const QString& question,
                                                      std::vector<RankedPassage> passages,
                                                      const std::vector<int64_t>& documentIds,
                                                      const Deadline& deadline,
                                                      bool& degraded)
{
    const QStringList parts = splitQuestion(question);
    if (parts.size() <= 1) {
        return passages;
    }

    std::unordered_map<int64_t, size_t> positionById;
    for (size_t i = 0; i < passages.size(); ++i) {
        positionById.emplace(passages[i].chunkId, i);
    }

    for (const QString& part : parts) {
        if (deadline.expired()) {
            degraded = true;
            break;
        }
        const EmbeddingResult embedded = m_embedder.embed(part, deadline);
        if (!embedded.ok()) {
            LOG_WARN(dqQuery, "Skipping question part, embedding failed: %s",
                     qUtf8Printable(embedded.errorMessage));
            degraded = true;
            continue;
        }

        HybridSearchResult partResult =
            m_ranker.search(part, embedded.vector, documentIds, deadline);
        degraded = degraded || partResult.degraded();
        for (RankedPassage& passage : partResult.passages) {
            auto it = positionById.find(passage.chunkId);
            if (it == positionById.end()) {
                positionById.emplace(passage.chunkId, passages.size());
                passages.push_back(std::move(passage));
            } else if (passage.score > passages[it->second].score) {
                passages[it->second] = std::move(passage);
            }
        }
    }

    std::stable_sort(passages.begin(), passages.end(),
                     [](const RankedPassage& lhs, const RankedPassage& rhs) {
                         return lhs.score > rhs.score;
                     });
    const size_t limit = static_cast<size_t>(std::max(m_config.passageLimit, 0));
    if (passages.size() > limit) {
        passages.resize(limit);
    }
    LOG_DEBUG(dqQuery, "Multi-part question: %lld parts, %zu passages",
              static_cast<long long>(parts.size()), passages.size());
    return passages;
}

QJsonArray AnswerService::sourcesToJson(const std::vector<RankedPassage>& passages)
{
    QJsonArray sources;
    for (const RankedPassage& passage : passages) {
        QJsonObject source;
        source[QStringLiteral("chunkId")] = static_cast<qint64>(passage.chunkId);
        source[QStringLiteral("documentId")] = static_cast<qint64>(passage.documentId);
        source[QStringLiteral("filename")] = passage.filename;
        source[QStringLiteral("chunkIndex")] = passage.chunkIndex;
        source[QStringLiteral("score")] = static_cast<double>(passage.score);
        source[QStringLiteral("source")] = matchSourceToString(passage.source);
        sources.append(source);
    }
    return sources;
}

// ── Customer queries ────────────────────────────────────────

CustomerQueryResult AnswerService::captureCustomerQuery(const QString& question,
                                                        const QString& customerName,
                                                        const QString& customerEmail)
{
    static const QRegularExpression emailPattern(QStringLiteral("^[^@\\s]+@[^@\\s]+$"));

    CustomerQueryResult result;
    if (auto invalid = validateQuestion(question)) {
        result.error = invalid;
        return result;
    }
    if (customerName.trimmed().isEmpty()) {
        result.error = Error::validation(QStringLiteral("customer name is required"));
        return result;
    }
    if (!emailPattern.match(customerEmail.trimmed()).hasMatch()) {
        result.error = Error::validation(QStringLiteral("customer email is invalid"));
        return result;
    }

    result.id = m_store.insertCustomerQuery(question.trimmed(), customerName.trimmed(),
                                            customerEmail.trimmed());
    if (!result.id) {
        result.error = Error::storage(QStringLiteral("failed to store customer query"));
        return result;
    }
    LOG_INFO(dqQuery, "Captured customer query %lld", static_cast<long long>(*result.id));
    return result;
}

CustomerQueryResult AnswerService::setCustomerQueryStatus(int64_t id, CustomerQueryStatus status)
{
    CustomerQueryResult result;
    if (status == CustomerQueryStatus::Pending) {
        result.error = Error::validation(QStringLiteral("a customer query cannot return to pending"));
        return result;
    }
    if (!m_store.updateCustomerQueryStatus(id, status)) {
        result.error = Error::notFound(QStringLiteral("customer query %1 not found").arg(id));
        return result;
    }
    result.id = id;
    return result;
}

} // namespace dq
