#pragma once

#include "core/embedding/embedding_provider.h"

#include <atomic>
#include <cstdint>

namespace dq {

// Closed below the threshold. Once open, requests are rejected until the
// delay has passed; then one trial request goes through at a time, and its
// outcome either closes the breaker or restarts the delay.
struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    std::atomic<bool> trialInFlight{false};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    // True while a new request would be rejected.
    bool isOpen() const;
    // Admits a request. In the half-open state only the caller that claims
    // the trial slot is admitted, with *trial set; that caller must finish
    // with recordSuccess(), recordFailure() or releaseTrial().
    bool tryAcquire(bool* trial = nullptr);
    void releaseTrial();
    void recordSuccess();
    void recordFailure();

private:
    bool delayElapsed() const;
};

// EmbeddingClient: guards an EmbeddingProvider with a circuit breaker,
// deadline checks and output validation, and returns unit-length vectors.
class EmbeddingClient {
public:
    explicit EmbeddingClient(EmbeddingProvider& provider);

    EmbeddingClient(const EmbeddingClient&) = delete;
    EmbeddingClient& operator=(const EmbeddingClient&) = delete;
    EmbeddingClient(EmbeddingClient&&) = delete;
    EmbeddingClient& operator=(EmbeddingClient&&) = delete;

    EmbeddingResult embed(const QString& text, const Deadline& deadline);

    int dimensions() const;
    QString modelId() const;
    const EmbeddingCircuitBreaker& circuitBreaker() const { return m_circuitBreaker; }

    struct Stats {
        uint64_t requests = 0;
        uint64_t failures = 0;
        uint64_t rejectedOpen = 0;
    };
    Stats stats() const;

private:
    EmbeddingProvider& m_provider;
    EmbeddingCircuitBreaker m_circuitBreaker;
    std::atomic<uint64_t> m_requests{0};
    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_rejectedOpen{0};
};

} // namespace dq
