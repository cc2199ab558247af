#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace specvis {

/// Rolling frame-rate estimate for the render loop.
///
/// Keeps the timestamps of the last kWindow frames and derives the rate from
/// the span they cover, then eases the displayed value towards it so the
/// readout does not flicker. Reports 0 until two frames have been seen.
class FrameRateMeter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kWindow = 120;
    static constexpr double kSmoothing = 0.1;
    static constexpr double kMaxRealisticFps = 1000.0;

    /// Records a frame presented at `now` and returns the updated estimate.
    double tick(Clock::time_point now) {
        stamps_.push_back(now);
        if (stamps_.size() > kWindow) {
            stamps_.pop_front();
        }
        if (stamps_.size() < 2) {
            return fps_;
        }

        const std::chrono::duration<double> span = stamps_.back() - stamps_.front();
        if (span.count() <= 1e-3) {
            return fps_;
        }
        const double raw = static_cast<double>(stamps_.size() - 1) / span.count();
        if (raw >= kMaxRealisticFps) {
            return fps_;
        }
        fps_ = fps_ > 0.0 ? fps_ + (raw - fps_) * kSmoothing : raw;
        return fps_;
    }

    [[nodiscard]] double fps() const noexcept { return fps_; }

    /// Forgets the history, e.g. after pacing changes.
    void reset() noexcept {
        stamps_.clear();
        fps_ = 0.0;
    }

private:
    std::deque<Clock::time_point> stamps_;
    double fps_ = 0.0;
};

/// Frame pacing that can be switched off to run as fast as frames render.
class FrameLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// fps below 1 is treated as 1.
    explicit FrameLimiter(int fps, bool enabled = true)
        : budget_{std::chrono::microseconds(1'000'000 / (fps < 1 ? 1 : fps))},
          enabled_{enabled} {}

    /// Time left to wait after a frame that took `elapsed`; zero when
    /// disabled or when the frame already used its budget.
    [[nodiscard]] Clock::duration remaining(Clock::duration elapsed) const noexcept {
        if (!enabled_ || elapsed >= budget_) {
            return Clock::duration::zero();
        }
        return budget_ - elapsed;
    }

    [[nodiscard]] bool is_enabled() const noexcept { return enabled_; }
    void set_enabled(bool enabled) noexcept { enabled_ = enabled; }
    void toggle() noexcept { enabled_ = !enabled_; }

    [[nodiscard]] Clock::duration budget() const noexcept { return budget_; }

private:
    Clock::duration budget_;
    bool enabled_;
};

}  // namespace specvis
