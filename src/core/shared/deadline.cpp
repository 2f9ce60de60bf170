#include "core/shared/deadline.h"

#include <algorithm>

namespace dq {

Deadline::Deadline()
    : m_cancelled(std::make_shared<std::atomic<bool>>(false))
{
}

Deadline Deadline::after(std::chrono::milliseconds timeout)
{
    Deadline deadline;
    deadline.m_expiry = Clock::now() + std::max(timeout, std::chrono::milliseconds(0));
    return deadline;
}

void Deadline::cancel()
{
    m_cancelled->store(true);
}

bool Deadline::isCancelled() const
{
    return m_cancelled->load();
}

bool Deadline::expired() const
{
    if (isCancelled()) {
        return true;
    }
    return m_expiry.has_value() && Clock::now() >= *m_expiry;
}

std::optional<std::chrono::milliseconds> Deadline::remaining() const
{
    if (!m_expiry) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *m_expiry - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

Deadline Deadline::narrowed(std::chrono::milliseconds timeout) const
{
    Deadline result = *this;
    const Clock::time_point candidate = Clock::now() + timeout;
    if (!result.m_expiry || candidate < *result.m_expiry) {
        result.m_expiry = candidate;
    }
    return result;
}

} // namespace dq
