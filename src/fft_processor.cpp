#include "specvis/fft_processor.hpp"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <stdexcept>

namespace specvis {

struct FFTProcessor::Plan {
    fftwf_plan plan = nullptr;
    float* input = nullptr;
    fftwf_complex* output = nullptr;

    explicit Plan(std::size_t n) {
        input = fftwf_alloc_real(n);
        output = fftwf_alloc_complex(n / 2 + 1);
        if (input == nullptr || output == nullptr) {
            release();
            throw std::runtime_error("Failed to allocate FFTW buffers");
        }
        plan = fftwf_plan_dft_r2c_1d(static_cast<int>(n), input, output, FFTW_ESTIMATE);
        if (plan == nullptr) {
            release();
            throw std::runtime_error("Failed to create FFTW plan");
        }
    }

    ~Plan() { release(); }

    Plan(const Plan&) = delete;
    Plan& operator=(const Plan&) = delete;

    void release() noexcept {
        if (plan != nullptr) {
            fftwf_destroy_plan(plan);
            plan = nullptr;
        }
        if (input != nullptr) {
            fftwf_free(input);
            input = nullptr;
        }
        if (output != nullptr) {
            fftwf_free(output);
            output = nullptr;
        }
    }
};

const char* to_string(WindowFunction window) noexcept {
    switch (window) {
        case WindowFunction::Rectangular: return "rectangular";
        case WindowFunction::Hann: return "hann";
        case WindowFunction::Hamming: return "hamming";
        case WindowFunction::Blackman: return "blackman";
        case WindowFunction::FlatTop: return "flattop";
    }
    return "unknown";
}

FFTProcessor::FFTProcessor(const FFTConfig& config) : config_{config} {
    const auto n = config_.fft_size;
    if (n < 2 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("FFT size must be a power of two >= 2, got " +
                                    std::to_string(n));
    }
    plan_ = std::make_unique<Plan>(n);
    build_window();
}

FFTProcessor::~FFTProcessor() = default;

void FFTProcessor::build_window() {
    const auto n = config_.fft_size;
    constexpr auto pi = std::numbers::pi_v<float>;
    window_.resize(n);

    for (std::size_t i = 0; i < n; ++i) {
        const float x = 2.0f * pi * static_cast<float>(i) / static_cast<float>(n - 1);
        switch (config_.window) {
            case WindowFunction::Rectangular:
                window_[i] = 1.0f;
                break;
            case WindowFunction::Hann:
                window_[i] = 0.5f * (1.0f - std::cos(x));
                break;
            case WindowFunction::Hamming:
                window_[i] = 0.54f - 0.46f * std::cos(x);
                break;
            case WindowFunction::Blackman:
                window_[i] = 0.42f - 0.5f * std::cos(x) + 0.08f * std::cos(2.0f * x);
                break;
            case WindowFunction::FlatTop:
                window_[i] = 0.21557895f - 0.41663158f * std::cos(x) +
                             0.277263158f * std::cos(2.0f * x) -
                             0.083578947f * std::cos(3.0f * x) +
                             0.006947368f * std::cos(4.0f * x);
                break;
        }
    }

    // Coherent gain correction: a full-scale sine peaks at sum(w)/2 in its bin.
    const float gain = std::accumulate(window_.begin(), window_.end(), 0.0f) * 0.5f;
    power_scale_ = gain > 0.0f ? 1.0f / (gain * gain) : 1.0f;
}

std::size_t FFTProcessor::compute(std::span<const float> samples, std::span<float> output) {
    const auto bins = bin_count();
    if (output.size() < bins) {
        throw std::invalid_argument("FFT output span holds " + std::to_string(output.size()) +
                                    " values, need " + std::to_string(bins));
    }

    const auto n = config_.fft_size;
    const auto count = std::min(samples.size(), n);
    const auto pad = n - count;
    const auto first = samples.size() - count;

    std::fill_n(plan_->input, pad, 0.0f);
    for (std::size_t i = 0; i < count; ++i) {
        plan_->input[pad + i] = samples[first + i] * window_[pad + i];
    }

    fftwf_execute(plan_->plan);

    for (std::size_t i = 0; i < bins; ++i) {
        const float re = plan_->output[i][0];
        const float im = plan_->output[i][1];
        float power = (re * re + im * im) * power_scale_;
        // DC and Nyquist have no mirrored half.
        if (i == 0 || i == bins - 1) {
            power *= 0.25f;
        }
        output[i] = power;
    }
    return bins;
}

std::size_t FFTProcessor::frequency_to_bin(float frequency, float sample_rate) const noexcept {
    if (sample_rate <= 0.0f || frequency <= 0.0f) {
        return 0;
    }
    const auto bin = static_cast<std::size_t>(
        frequency * static_cast<float>(config_.fft_size) / sample_rate + 0.5f);
    return std::min(bin, bin_count() - 1);
}

}  // namespace specvis
