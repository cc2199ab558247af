#include "specvis/spectrum_processor.hpp"

#include "specvis/job_pool.hpp"

#include <algorithm>
#include <cmath>

namespace specvis {

SpectrumProcessor::SpectrumProcessor(JobPool* pool) noexcept : pool_{pool} {}

float SpectrumProcessor::block_average(std::span<const float> spectrum, std::size_t start,
                                       std::size_t end) noexcept {
    // Accumulate in double so the mean of n equal values stays exact.
    double sum = 0.0;
    for (std::size_t j = start; j < end; ++j) {
        sum += static_cast<double>(spectrum[j]);
    }
    return static_cast<float>(sum / static_cast<double>(end - start));
}

std::vector<float> SpectrumProcessor::scale(std::span<const float> spectrum,
                                            std::size_t target_count,
                                            std::size_t source_length) const {
    std::vector<float> scaled(target_count, 0.0f);

    const auto length = std::min(source_length, spectrum.size());
    if (target_count == 0 || length == 0) {
        return scaled;
    }

    const double block_size = static_cast<double>(length) / static_cast<double>(target_count);

    auto compute_block = [&](std::size_t i) {
        const auto start = static_cast<std::size_t>(std::floor(static_cast<double>(i) * block_size));
        const auto end = std::min(
            static_cast<std::size_t>(std::floor(static_cast<double>(i + 1) * block_size)), length);

        if (start >= end) {
            // More bars than bins: repeat the nearest bin.
            scaled[i] = spectrum[std::min(start, length - 1)];
            return;
        }
        scaled[i] = block_average(spectrum, start, end);
    };

    JobPool& pool = pool_ != nullptr ? *pool_ : JobPool::shared();
    if (target_count >= kParallelThreshold && pool.size() > 0) {
        pool.parallel_for(target_count, compute_block);
    } else {
        for (std::size_t i = 0; i < target_count; ++i) {
            compute_block(i);
        }
    }

    return scaled;
}

std::vector<float> SpectrumProcessor::smooth(std::span<const float> scaled,
                                             std::size_t target_count, float factor) {
    if (previous_.size() != target_count) {
        // History is lost on resize; the next frames ramp up from zero.
        previous_.assign(target_count, 0.0f);
    }

    std::vector<float> smoothed(target_count);
    const float keep = 1.0f - factor;
    const std::size_t available = std::min(scaled.size(), target_count);

    std::size_t i = 0;
    for (; i + kSmoothingLanes <= available; i += kSmoothingLanes) {
        for (std::size_t lane = 0; lane < kSmoothingLanes; ++lane) {
            const float value = previous_[i + lane] * keep + scaled[i + lane] * factor;
            smoothed[i + lane] = value;
            previous_[i + lane] = value;
        }
    }

    for (; i < target_count; ++i) {
        const float current = i < available ? scaled[i] : 0.0f;
        const float value = previous_[i] * keep + current * factor;
        smoothed[i] = value;
        previous_[i] = value;
    }

    return smoothed;
}

std::vector<float> SpectrumProcessor::prepare(std::span<const float> spectrum,
                                              std::size_t target_count,
                                              std::size_t source_length) {
    const auto length = std::min(source_length, spectrum.size());
    if (target_count == 0 || length == 0) {
        return std::vector<float>(target_count, 0.0f);
    }

    std::unique_lock<std::mutex> compute(compute_mutex_, std::try_to_lock);
    if (compute.owns_lock()) {
        const auto scaled = scale(spectrum, target_count, length);
        auto smoothed = smooth(scaled, target_count, smoothing_factor());

        std::lock_guard<std::mutex> publish(publish_mutex_);
        committed_ = smoothed;
        return smoothed;
    }

    // Another thread is recomputing: hand out the last committed frame.
    {
        std::lock_guard<std::mutex> publish(publish_mutex_);
        if (committed_.size() == target_count) {
            return committed_;
        }
    }
    return scale(spectrum, target_count, length);
}

void SpectrumProcessor::reset() {
    {
        std::lock_guard<std::mutex> compute(compute_mutex_);
        previous_.clear();
    }
    std::lock_guard<std::mutex> publish(publish_mutex_);
    committed_.clear();
}

}  // namespace specvis
