#include "core/embedding/embedding_client.h"
#include "core/shared/logging.h"
#include "core/shared/vector_math.h"

#include <chrono>
#include <cmath>

namespace dq {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::delayElapsed() const
{
    return steadyNowMs() - lastFailureTime.load() >= kHalfOpenDelayMs;
}

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    return !delayElapsed() || trialInFlight.load();
}

bool EmbeddingCircuitBreaker::tryAcquire(bool* trial)
{
    if (trial) {
        *trial = false;
    }
    if (consecutiveFailures.load() < kOpenThreshold) {
        return true;
    }
    if (!delayElapsed()) {
        return false;
    }
    // Half-open: the first caller to claim the slot runs the trial
    bool expected = false;
    if (!trialInFlight.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (trial) {
        *trial = true;
    }
    return true;
}

void EmbeddingCircuitBreaker::releaseTrial()
{
    trialInFlight.store(false);
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
    trialInFlight.store(false);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
    trialInFlight.store(false);
}

EmbeddingClient::EmbeddingClient(EmbeddingProvider& provider)
    : m_provider(provider)
{
}

int EmbeddingClient::dimensions() const
{
    return m_provider.dimensions();
}

QString EmbeddingClient::modelId() const
{
    return m_provider.modelId();
}

EmbeddingResult EmbeddingClient::embed(const QString& text, const Deadline& deadline)
{
    ++m_requests;

    if (deadline.expired()) {
        return EmbeddingResult::failure(EmbeddingResult::Status::Cancelled,
                                        QStringLiteral("deadline expired before embedding"));
    }

    bool trial = false;
    if (!m_circuitBreaker.tryAcquire(&trial)) {
        ++m_rejectedOpen;
        LOG_WARN(dqIngest, "Embedding circuit open (%d consecutive failures), request rejected",
                 m_circuitBreaker.consecutiveFailures.load());
        return EmbeddingResult::failure(EmbeddingResult::Status::Unavailable,
                                        QStringLiteral("embedding provider circuit open"));
    }

    EmbeddingResult result = m_provider.embed(text, deadline);
    if (result.status == EmbeddingResult::Status::Cancelled) {
        // Caller cancellation says nothing about provider health
        if (trial) {
            m_circuitBreaker.releaseTrial();
        }
        return result;
    }
    if (!result.ok()) {
        ++m_failures;
        m_circuitBreaker.recordFailure();
        if (result.errorMessage.isEmpty()) {
            result.errorMessage = QStringLiteral("embedding provider failed");
        }
        return result;
    }

    const int expected = m_provider.dimensions();
    if (static_cast<int>(result.vector.size()) != expected) {
        ++m_failures;
        m_circuitBreaker.recordFailure();
        return EmbeddingResult::failure(
            EmbeddingResult::Status::Unavailable,
            QStringLiteral("embedding has %1 dimensions, expected %2")
                .arg(result.vector.size())
                .arg(expected));
    }
    for (const float value : result.vector) {
        if (!std::isfinite(value)) {
            ++m_failures;
            m_circuitBreaker.recordFailure();
            return EmbeddingResult::failure(EmbeddingResult::Status::Unavailable,
                                            QStringLiteral("embedding contains non-finite values"));
        }
    }

    m_circuitBreaker.recordSuccess();
    result.vector = normalizeVector(std::move(result.vector));
    return result;
}

EmbeddingClient::Stats EmbeddingClient::stats() const
{
    return {m_requests.load(), m_failures.load(), m_rejectedOpen.load()};
}

} // namespace dq
