#include "core/indexing/worker_pool.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <exception>

namespace dq {

// ── Construction / destruction ──────────────────────────────

WorkerPool::WorkerPool(int workerCount, size_t maxQueueSize)
    : m_maxQueueSize(std::max<size_t>(maxQueueSize, 1))
{
    const int count = std::max(workerCount, 1);
    m_workers.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool()
{
    shutdown();
    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ── Submit ──────────────────────────────────────────────────

bool WorkerPool::submit(std::function<void()> job)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        ++m_rejectedJobs;
        LOG_WARN(dqCore, "WorkerPool::submit() called after shutdown");
        return false;
    }

    if (m_queue.size() >= m_maxQueueSize) {
        ++m_rejectedJobs;
        LOG_WARN(dqCore, "WorkerPool at capacity (%d), job refused",
                 static_cast<int>(m_maxQueueSize));
        return false;
    }

    m_queue.push_back(std::move(job));
    m_cv.notify_one();
    return true;
}

// ── Worker loop ─────────────────────────────────────────────

void WorkerPool::workerLoop()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;   // shutdown with nothing left to drain
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
            ++m_activeJobs;
        }

        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERROR(dqCore, "WorkerPool job threw: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_activeJobs;
            ++m_completedJobs;
            if (m_queue.empty() && m_activeJobs == 0) {
                m_idleCv.notify_all();
            }
        }
    }
}

void WorkerPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && m_activeJobs == 0; });
}

// ── Shutdown ────────────────────────────────────────────────

void WorkerPool::shutdown()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_shutdown) {
        m_shutdown = true;
        LOG_DEBUG(dqCore, "WorkerPool shutting down (depth=%d, completed=%d)",
                  static_cast<int>(m_queue.size()),
                  static_cast<int>(m_completedJobs));
        m_cv.notify_all();
    }
}

// ── Size / stats ────────────────────────────────────────────

bool WorkerPool::isShutdown() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

size_t WorkerPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

PoolStats WorkerPool::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStats s;
    s.depth = m_queue.size();
    s.activeJobs = m_activeJobs;
    s.completedJobs = m_completedJobs;
    s.rejectedJobs = m_rejectedJobs;
    s.workerCount = static_cast<int>(m_workers.size());
    return s;
}

} // namespace dq
