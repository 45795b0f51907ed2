// =============================================================================
// qpx - Bounded Worker Pool
// =============================================================================
// Fixed set of worker threads fed through a bounded task queue.
//
// The archive parser is the single producer: it submits one task per data
// block and blocks in submit() while the queue is full. At most
// workerCount + queueCapacity tasks therefore hold block buffers at any
// time, which bounds memory for arbitrarily large archives.
//
// Tasks report failure through VoidResult. Failures are collected and
// handed back by drain(), which waits for every submitted task to finish.
//
// Usage:
// @code
// WorkerPool pool(WorkerPoolConfig{});
// pool.submit([] { return makeVoidSuccess(); });
// auto status = pool.drain();
// @endcode
// =============================================================================

#ifndef QPX_PIPELINE_WORKER_POOL_H
#define QPX_PIPELINE_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <tbb/concurrent_queue.h>

#include "qpx/common/error.h"
#include "qpx/common/types.h"

namespace qpx::pipeline {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Upper bound accepted for either pool dimension.
inline constexpr std::size_t kMaxPoolDimension = 4096;

struct WorkerPoolConfig {
    /// @brief Number of worker threads (0 = hardware concurrency).
    std::size_t workerCount = kDefaultWorkerCount;

    /// @brief Tasks that may wait in the queue before submit() blocks.
    std::size_t queueCapacity = kDefaultQueueCapacity;

    [[nodiscard]] VoidResult validate() const;

    /// @brief Worker count with 0 resolved to the hardware concurrency.
    [[nodiscard]] std::size_t effectiveWorkers() const noexcept;
};

// =============================================================================
// WorkerPool
// =============================================================================

class WorkerPool {
public:
    using Task = std::function<VoidResult()>;

    /// @throws UsageError if the configuration is invalid.
    explicit WorkerPool(WorkerPoolConfig config = {});

    /// @brief Stops and joins the workers after the queue empties.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// @brief Queue a task, blocking while the queue is at capacity.
    /// @note Must be called from a single producer thread.
    void submit(Task task);

    /// @brief Wait until every submitted task has finished.
    /// @return Success, or the first recorded failure with the failure
    ///         count appended. The failure record is cleared.
    [[nodiscard]] VoidResult drain();

    /// @brief True once any task since the last drain() has failed.
    [[nodiscard]] bool hasFailed() const noexcept { return failed_.load(std::memory_order_acquire); }

    /// @brief Tasks submitted but not yet finished.
    [[nodiscard]] std::size_t outstanding() const;

    [[nodiscard]] std::size_t workerCount() const noexcept { return workers_.size(); }

    [[nodiscard]] std::size_t queueCapacity() const noexcept { return config_.queueCapacity; }

    /// @brief Tasks finished over the pool's lifetime.
    [[nodiscard]] std::size_t completedTasks() const noexcept {
        return completed_.load(std::memory_order_relaxed);
    }

private:
    void workerLoop();
    void finishTask(VoidResult result);

    WorkerPoolConfig config_;
    tbb::concurrent_bounded_queue<Task> queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t outstanding_ = 0;
    std::vector<Error> failures_;

    std::atomic<bool> failed_{false};
    std::atomic<std::size_t> completed_{0};
};

}  // namespace qpx::pipeline

#endif  // QPX_PIPELINE_WORKER_POOL_H
