// =============================================================================
// qpx - Bounded Worker Pool Implementation
// =============================================================================

#include "qpx/pipeline/worker_pool.h"

#include <exception>
#include <fmt/format.h>
#include <utility>

#include "qpx/common/logger.h"

namespace qpx::pipeline {

// =============================================================================
// WorkerPoolConfig Implementation
// =============================================================================

VoidResult WorkerPoolConfig::validate() const {
    if (workerCount > kMaxPoolDimension) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("worker count must be <= {}", kMaxPoolDimension));
    }
    if (queueCapacity == 0 || queueCapacity > kMaxPoolDimension) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("queue capacity must be between 1 and {}",
                                         kMaxPoolDimension));
    }
    return {};
}

std::size_t WorkerPoolConfig::effectiveWorkers() const noexcept {
    if (workerCount > 0) {
        return workerCount;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

// =============================================================================
// WorkerPool Implementation
// =============================================================================

WorkerPool::WorkerPool(WorkerPoolConfig config) : config_(config) {
    unwrapOrThrow(config_.validate());

    queue_.set_capacity(static_cast<std::ptrdiff_t>(config_.queueCapacity));

    const std::size_t count = config_.effectiveWorkers();
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }

    QPX_LOG_DEBUG("Worker pool started: {} workers, queue capacity {}", count,
                  config_.queueCapacity);
}

WorkerPool::~WorkerPool() {
    // An empty task tells one worker to exit.
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        queue_.push(Task{});
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++outstanding_;
    }
    // The count is raised first so a fast worker never decrements below zero;
    // a push that throws leaves the task unqueued and must give it back.
    try {
        queue_.push(std::move(task));
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--outstanding_ == 0) {
            idle_.notify_all();
        }
        throw;
    }
}

VoidResult WorkerPool::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return outstanding_ == 0; });

    std::vector<Error> failures = std::move(failures_);
    failures_.clear();
    failed_.store(false, std::memory_order_release);
    lock.unlock();

    if (failures.empty()) {
        return {};
    }

    const Error& first = failures.front();
    if (failures.size() == 1) {
        return std::unexpected(first);
    }
    return makeVoidError(first.code(), fmt::format("{} (and {} more failed block(s))",
                                                   first.message(), failures.size() - 1));
}

std::size_t WorkerPool::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

void WorkerPool::workerLoop() {
    for (;;) {
        Task task;
        queue_.pop(task);
        if (!task) {
            return;
        }

        VoidResult result;
        try {
            result = task();
        } catch (const QPXException& e) {
            result = std::unexpected(Error(e));
        } catch (const std::exception& e) {
            result = makeVoidError(ErrorCode::kDecompressionFailed,
                                   fmt::format("block task failed: {}", e.what()));
        } catch (...) {
            result = makeVoidError(ErrorCode::kDecompressionFailed,
                                   "block task failed: unknown exception");
        }
        finishTask(std::move(result));
    }
}

void WorkerPool::finishTask(VoidResult result) {
    completed_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!result.has_value()) {
        failures_.push_back(std::move(result.error()));
        failed_.store(true, std::memory_order_release);
    }
    if (--outstanding_ == 0) {
        idle_.notify_all();
    }
}

}  // namespace qpx::pipeline
