#include "specvis/job_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <latch>
#include <utility>

namespace specvis {

JobPool::JobPool(std::size_t num_threads) {
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

JobPool::~JobPool() {
    stop();
}

void JobPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void JobPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

std::size_t JobPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void JobPool::parallel_for(std::size_t count, const std::function<void(std::size_t)>& body) {
    if (count == 0) {
        return;
    }

    const std::size_t ranges = std::min(count, workers_.size() + 1);
    const std::size_t per_range = (count + ranges - 1) / ranges;

    std::latch done{static_cast<std::ptrdiff_t>(ranges)};
    std::exception_ptr error;
    std::mutex error_mutex;

    auto run_range = [&](std::size_t begin, std::size_t end) {
        try {
            for (std::size_t i = begin; i < end; ++i) {
                body(i);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!error) {
                error = std::current_exception();
            }
        }
        done.count_down();
    };

    // Range 0 runs on the caller; the rest go to the workers.
    for (std::size_t r = 1; r < ranges; ++r) {
        const std::size_t begin = r * per_range;
        const std::size_t end = std::min(count, begin + per_range);
        bool queued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!stop_) {
                jobs_.emplace_back([&run_range, begin, end] { run_range(begin, end); });
                queued = true;
            }
        }
        if (queued) {
            cv_.notify_one();
        } else {
            run_range(begin, end);
        }
    }
    run_range(0, std::min(count, per_range));

    done.wait();
    if (error) {
        std::rethrow_exception(error);
    }
}

void JobPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.back());
            jobs_.pop_back();
        }
        job();
    }
}

JobPool& JobPool::shared() {
    static JobPool pool{std::max(1u, std::thread::hardware_concurrency()) - 1};
    return pool;
}

}  // namespace specvis
