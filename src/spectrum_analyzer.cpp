#include "specvis/spectrum_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace specvis {

SpectrumAnalyzer::SpectrumAnalyzer(RingBuffer<float>& source, std::uint32_t sample_rate,
                                   const FFTConfig& fft_config,
                                   const ConverterConfig& converter_config, JobPool* pool)
    : source_{source},
      sample_rate_{static_cast<float>(sample_rate)},
      fft_{fft_config},
      converter_{converter_config, pool} {
    if (sample_rate == 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }
    samples_.resize(fft_.fft_size());
    power_.resize(fft_.bin_count());
}

std::optional<SpectrumFrame> SpectrumAnalyzer::update() {
    const auto buffered = source_.size();
    if (buffered < fft_.fft_size() / 4 || buffered <= retained_) {
        return std::nullopt;
    }

    const auto count = source_.latest(samples_);
    retained_ = count;
    return analyze({samples_.data(), count});
}

SpectrumFrame SpectrumAnalyzer::analyze(std::span<const float> samples) {
    SpectrumFrame frame;
    frame.timestamp = std::chrono::steady_clock::now();
    frame.sequence = ++sequence_;

    if (!samples.empty()) {
        float sum_squares = 0.0f;
        float peak = 0.0f;
        for (const float s : samples) {
            sum_squares += s * s;
            peak = std::max(peak, std::abs(s));
        }
        frame.rms_level = std::sqrt(sum_squares / static_cast<float>(samples.size()));
        frame.peak_level = peak;
    }

    fft_.compute(samples, power_);
    frame.values = converter_.convert(power_, sample_rate_);
    return frame;
}

}  // namespace specvis
