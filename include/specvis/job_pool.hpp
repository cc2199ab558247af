#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace specvis {

/// Fixed-size worker pool for short, independent data-parallel jobs.
///
/// Jobs are plain closures; the pool never resizes. parallel_for() blocks the
/// caller until every item has run and executes one share of the work on the
/// calling thread, so a pool with zero workers degrades to a serial loop.
class JobPool {
public:
    explicit JobPool(std::size_t num_threads);
    ~JobPool();

    JobPool(const JobPool&) = delete;
    JobPool& operator=(const JobPool&) = delete;

    /// Queues a job. Jobs submitted after stop() are dropped.
    void submit(std::function<void()> job);

    /// Runs body(i) for every i in [0, count). Items are split into contiguous
    /// ranges, one per worker plus the caller. Exceptions thrown by body are
    /// rethrown on the calling thread after all ranges finish.
    void parallel_for(std::size_t count, const std::function<void(std::size_t)>& body);

    /// Joins all workers. Idempotent.
    void stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

    /// Jobs queued but not yet picked up by a worker.
    [[nodiscard]] std::size_t pending() const;

    /// Process-wide pool sized to hardware_concurrency() - 1.
    [[nodiscard]] static JobPool& shared();

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::vector<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

}  // namespace specvis
