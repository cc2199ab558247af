#pragma once

#include "specvis/spectrum_analyzer.hpp"

#include <cstdint>
#include <mutex>
#include <utility>

namespace specvis {

/// Latest-frame mailbox between the analysis thread and the render loop.
///
/// The writer overwrites the held frame; readers copy it only when its
/// sequence differs from the one they saw last. Frames are never queued, so a
/// slow reader skips straight to the newest one.
class SpectrumFeed {
public:
    void publish(SpectrumFrame frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = std::move(frame);
        ++published_;
    }

    /// Copies the held frame into out if one was published since last_seen.
    /// Updates last_seen and returns true on copy.
    bool copy_if_new(std::uint64_t& last_seen, SpectrumFrame& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (published_ == last_seen) {
            return false;
        }
        last_seen = published_;
        out = frame_;
        return true;
    }

    /// Number of frames published so far.
    [[nodiscard]] std::uint64_t published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = SpectrumFrame{};
        ++published_;
    }

private:
    mutable std::mutex mutex_;
    SpectrumFrame frame_;
    std::uint64_t published_ = 0;
};

}  // namespace specvis
