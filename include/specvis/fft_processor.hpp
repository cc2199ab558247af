#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace specvis {

/// Analysis window applied before the transform.
enum class WindowFunction {
    Rectangular,
    Hann,
    Hamming,
    Blackman,
    FlatTop
};

[[nodiscard]] const char* to_string(WindowFunction window) noexcept;

struct FFTConfig {
    std::size_t fft_size = 2048;  // power of two
    WindowFunction window = WindowFunction::Hann;
};

/// Real-input FFT producing a linear power spectrum.
///
/// Power is normalized so that a full-scale sine lands at 1.0 in its bin
/// (0 dB), which is what SpectrumConverter's gain range expects. Buffers and
/// the FFTW plan are allocated once; compute() does not allocate.
///
/// Not thread-safe. The analysis thread owns its processor.
class FFTProcessor {
public:
    /// @throws std::invalid_argument if fft_size is not a power of two >= 2.
    /// @throws std::runtime_error if FFTW cannot allocate or plan.
    explicit FFTProcessor(const FFTConfig& config = {});
    ~FFTProcessor();

    FFTProcessor(const FFTProcessor&) = delete;
    FFTProcessor& operator=(const FFTProcessor&) = delete;

    /// Windows the newest fft_size() samples (zero-padding on the left when
    /// fewer are given) and writes bin_count() power values.
    /// @throws std::invalid_argument if output holds fewer than bin_count().
    std::size_t compute(std::span<const float> samples, std::span<float> output);

    [[nodiscard]] std::size_t bin_count() const noexcept { return config_.fft_size / 2 + 1; }
    [[nodiscard]] std::size_t fft_size() const noexcept { return config_.fft_size; }
    [[nodiscard]] const FFTConfig& config() const noexcept { return config_; }

    [[nodiscard]] float bin_to_frequency(std::size_t bin, float sample_rate) const noexcept {
        return static_cast<float>(bin) * sample_rate / static_cast<float>(config_.fft_size);
    }

    /// Nearest bin, clamped to the last one.
    [[nodiscard]] std::size_t frequency_to_bin(float frequency, float sample_rate) const noexcept;

    /// Window coefficients, fft_size() of them.
    [[nodiscard]] std::span<const float> window() const noexcept { return window_; }

private:
    void build_window();

    FFTConfig config_;

    // Keeps fftw3.h out of the header.
    struct Plan;
    std::unique_ptr<Plan> plan_;

    std::vector<float> window_;
    float power_scale_ = 1.0f;
};

}  // namespace specvis
