#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace specvis {

class JobPool;

/// Turns one raw spectrum frame into a display-ready bar array.
///
/// Two stages: scale() reduces the spectrum to target_count bars by block
/// averaging, smooth() blends the result with the previous frame using an
/// exponential moving average. prepare() runs both behind a non-blocking
/// gate: at most one thread recomputes at a time, and a thread that finds
/// the gate taken gets the last committed frame instead of waiting.
///
/// One instance belongs to one renderer; the smoothing history is per
/// instance.
class SpectrumProcessor {
public:
    /// Bar counts at or above this are averaged as parallel work items.
    static constexpr std::size_t kParallelThreshold = 32;

    /// Lane count of the chunked smoothing loop.
    static constexpr std::size_t kSmoothingLanes = 8;

    static constexpr float kDefaultSmoothingFactor = 0.3f;
    static constexpr float kOverlaySmoothingFactor = 0.5f;

    /// @param pool Pool used for the parallel scale path. nullptr selects
    ///             JobPool::shared().
    explicit SpectrumProcessor(JobPool* pool = nullptr) noexcept;

    SpectrumProcessor(const SpectrumProcessor&) = delete;
    SpectrumProcessor& operator=(const SpectrumProcessor&) = delete;

    /// Block-averages spectrum[0, source_length) into target_count bars.
    ///
    /// Block i covers [floor(i*b), min(floor((i+1)*b), source_length)) with
    /// b = source_length / target_count. source_length is clamped to
    /// spectrum.size(). A block left empty because target_count exceeds
    /// source_length repeats the nearest source bin. An empty spectrum gives
    /// target_count zeros.
    [[nodiscard]] std::vector<float> scale(std::span<const float> spectrum,
                                           std::size_t target_count,
                                           std::size_t source_length) const;

    /// smoothed[i] = previous[i] * (1 - factor) + scaled[i] * factor, and the
    /// result becomes the new history. A history of the wrong length is
    /// replaced by zeros first. Only the first target_count values of scaled
    /// are read; missing values count as zero.
    ///
    /// Not synchronized; prepare() is the thread-safe entry point.
    [[nodiscard]] std::vector<float> smooth(std::span<const float> scaled,
                                            std::size_t target_count, float factor);

    /// scale() + smooth() with the current smoothing factor. Safe to call
    /// from several threads; never blocks on another caller's recompute.
    [[nodiscard]] std::vector<float> prepare(std::span<const float> spectrum,
                                             std::size_t target_count,
                                             std::size_t source_length);

    void set_smoothing_factor(float factor) noexcept {
        smoothing_factor_.store(factor, std::memory_order_relaxed);
    }

    [[nodiscard]] float smoothing_factor() const noexcept {
        return smoothing_factor_.load(std::memory_order_relaxed);
    }

    /// Drops smoothing history and the committed frame.
    void reset();

private:
    [[nodiscard]] static float block_average(std::span<const float> spectrum, std::size_t start,
                                             std::size_t end) noexcept;

    JobPool* pool_;
    std::atomic<float> smoothing_factor_{kDefaultSmoothingFactor};

    // Held (try_lock only) by the thread that is recomputing.
    std::mutex compute_mutex_;
    std::vector<float> previous_;

    // Guards committed_, the last fully written result.
    mutable std::mutex publish_mutex_;
    std::vector<float> committed_;
};

}  // namespace specvis
