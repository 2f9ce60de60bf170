#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace dq {

// Caller-supplied expiry plus an explicit cancel flag.
// Copies share the cancel flag, so a copy handed to a worker observes cancel()
// issued on the original.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    // Never expires unless cancelled.
    Deadline();

    static Deadline after(std::chrono::milliseconds timeout);
    static Deadline never() { return Deadline(); }

    void cancel();
    bool isCancelled() const;

    // True once cancelled or past the expiry time.
    bool expired() const;

    // Remaining time, clamped at zero. nullopt when there is no expiry.
    std::optional<std::chrono::milliseconds> remaining() const;

    // The earlier of this deadline's expiry and now + timeout, sharing the
    // cancel flag.
    Deadline narrowed(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<std::atomic<bool>> m_cancelled;
    std::optional<Clock::time_point> m_expiry;
};

} // namespace dq
