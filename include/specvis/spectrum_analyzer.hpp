#pragma once

#include "specvis/fft_processor.hpp"
#include "specvis/ring_buffer.hpp"
#include "specvis/spectrum_converter.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace specvis {

class JobPool;

/// One analysed window, ready for SpectrumProcessor.
struct SpectrumFrame {
    std::vector<float> values;  // one per FFT bin, each in [0, 1]
    float rms_level = 0.0f;
    float peak_level = 0.0f;
    std::uint64_t sequence = 0;
    std::chrono::steady_clock::time_point timestamp;
};

/// Turns the newest samples of a capture ring into normalized spectra.
///
/// Each update() takes the most recent fft_size samples (older ones are
/// dropped), transforms them and converts the power bins through the
/// SpectrumConverter. Consecutive windows overlap; update() only produces a
/// frame once new samples have arrived.
///
/// Usage:
///   SpectrumAnalyzer analyzer{capture.buffer(), capture.sample_rate()};
///   while (running) {
///       if (auto frame = analyzer.update()) {
///           feed.publish(std::move(*frame));
///       }
///   }
///
/// Not thread-safe: one analysis thread owns the analyzer.
class SpectrumAnalyzer {
public:
    /// @throws std::invalid_argument for a bad FFT size, gain or sample rate.
    SpectrumAnalyzer(RingBuffer<float>& source, std::uint32_t sample_rate,
                     const FFTConfig& fft_config = {},
                     const ConverterConfig& converter_config = {}, JobPool* pool = nullptr);

    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

    /// Returns a frame, or nullopt while fewer than a quarter window of
    /// samples is buffered or nothing new arrived since the last frame.
    [[nodiscard]] std::optional<SpectrumFrame> update();

    /// Analyses samples directly, bypassing the ring. Used by update().
    [[nodiscard]] SpectrumFrame analyze(std::span<const float> samples);

    [[nodiscard]] std::size_t bin_count() const noexcept { return fft_.bin_count(); }
    [[nodiscard]] float sample_rate() const noexcept { return sample_rate_; }
    [[nodiscard]] SpectrumConverter& converter() noexcept { return converter_; }
    [[nodiscard]] const FFTProcessor& fft() const noexcept { return fft_; }

private:
    RingBuffer<float>& source_;
    float sample_rate_;
    FFTProcessor fft_;
    SpectrumConverter converter_;

    std::vector<float> samples_;
    std::vector<float> power_;
    std::size_t retained_ = 0;
    std::uint64_t sequence_ = 0;
};

}  // namespace specvis
