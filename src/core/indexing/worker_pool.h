#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace dq {

struct PoolStats {
    size_t depth = 0;
    size_t activeJobs = 0;
    size_t completedJobs = 0;
    size_t rejectedJobs = 0;
    int workerCount = 0;
};

// WorkerPool: fixed set of std::thread workers draining a FIFO job queue.
//
// Used to bound concurrent embedding calls during ingestion and to run the
// two hybrid sub-searches side by side.
//
// Shutdown stops intake; workers finish every job already queued and then
// exit, so futures handed out by run() are always satisfied.
class WorkerPool {
public:
    static constexpr size_t kMaxQueueSize = 10000;

    explicit WorkerPool(int workerCount, size_t maxQueueSize = kMaxQueueSize);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Queue a job. Returns false after shutdown() or when the queue is full.
    bool submit(std::function<void()> job);

    // Queue a callable and return a future for its result, or nullopt when
    // the job is refused.
    template <typename Fn>
    auto tryRun(Fn&& fn) -> std::optional<std::future<std::invoke_result_t<Fn>>>
    {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        if (!submit([task]() { (*task)(); })) {
            return std::nullopt;
        }
        return std::optional<std::future<Result>>(std::move(future));
    }

    // As tryRun(), but a refused job yields a future holding
    // std::runtime_error.
    template <typename Fn>
    auto run(Fn&& fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using Result = std::invoke_result_t<Fn>;
        auto queued = tryRun(std::forward<Fn>(fn));
        if (!queued) {
            std::promise<Result> refused;
            refused.set_exception(std::make_exception_ptr(
                std::runtime_error("worker pool refused job")));
            return refused.get_future();
        }
        return std::move(*queued);
    }

    // Block until the queue is empty and no job is running.
    void waitIdle();

    void shutdown();

    int workerCount() const { return static_cast<int>(m_workers.size()); }
    size_t maxQueueSize() const { return m_maxQueueSize; }
    bool isShutdown() const;
    size_t pendingCount() const;
    PoolStats stats() const;

private:
    void workerLoop();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;

    std::deque<std::function<void()>> m_queue;
    std::vector<std::thread> m_workers;
    const size_t m_maxQueueSize;
    size_t m_activeJobs = 0;
    size_t m_completedJobs = 0;
    size_t m_rejectedJobs = 0;
    bool m_shutdown = false;
};

} // namespace dq
