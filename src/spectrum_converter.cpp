#include "specvis/spectrum_converter.hpp"

#include "specvis/job_pool.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace specvis {

namespace {

constexpr std::size_t kMinParallelBins = 32;

struct Axis {
    float (*to_axis)(float hz);
    float (*to_hz)(float value);
};

float hz_to_log(float hz) { return std::log10(hz); }
float log_to_hz(float v) { return std::pow(10.0f, v); }

float hz_to_mel(float hz) { return 2595.0f * std::log10(1.0f + hz / 700.0f); }
float mel_to_hz(float mel) { return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f); }

float hz_to_bark(float hz) {
    return 13.0f * std::atan(0.00076f * hz) + 3.5f * std::atan((hz / 7500.0f) * (hz / 7500.0f));
}
float bark_to_hz(float bark) { return 1960.0f * (bark + 0.53f) / (26.28f - bark); }

float hz_to_erb(float hz) { return 21.4f * std::log10(0.00437f * hz + 1.0f); }
float erb_to_hz(float erb) { return (std::pow(10.0f, erb / 21.4f) - 1.0f) / 0.00437f; }

Axis axis_for(SpectrumScale scale) noexcept {
    switch (scale) {
        case SpectrumScale::Mel: return {hz_to_mel, mel_to_hz};
        case SpectrumScale::Bark: return {hz_to_bark, bark_to_hz};
        case SpectrumScale::ERB: return {hz_to_erb, erb_to_hz};
        case SpectrumScale::Logarithmic:
        case SpectrumScale::Linear: break;
    }
    return {hz_to_log, log_to_hz};
}

}  // namespace

const char* to_string(SpectrumScale scale) noexcept {
    switch (scale) {
        case SpectrumScale::Linear: return "linear";
        case SpectrumScale::Logarithmic: return "log";
        case SpectrumScale::Mel: return "mel";
        case SpectrumScale::Bark: return "bark";
        case SpectrumScale::ERB: return "erb";
    }
    return "unknown";
}

SpectrumScale parse_scale(std::string_view text) {
    const auto token = detail::normalize_token(text);
    if (token == "linear" || token == "lin") return SpectrumScale::Linear;
    if (token == "log" || token == "logarithmic") return SpectrumScale::Logarithmic;
    if (token == "mel") return SpectrumScale::Mel;
    if (token == "bark") return SpectrumScale::Bark;
    if (token == "erb") return SpectrumScale::ERB;
    throw std::invalid_argument("Unknown spectrum scale: " + std::string(text));
}

void GainParameters::validate() const {
    if (min_db > max_db) {
        throw std::invalid_argument("min_db (" + std::to_string(min_db) +
                                    ") must not exceed max_db (" + std::to_string(max_db) + ")");
    }
    if (!(amplification > 0.0f)) {
        throw std::invalid_argument("amplification must be positive");
    }
}

SpectrumConverter::SpectrumConverter(const ConverterConfig& config, JobPool* pool)
    : config_{config}, pool_{pool} {
    config_.gain.validate();
}

void SpectrumConverter::set_gain(const GainParameters& gain) {
    gain.validate();
    config_.gain = gain;
}

float SpectrumConverter::normalize_db(float power, const GainParameters& gain) noexcept {
    if (!(power > 0.0f)) {
        return 0.0f;
    }
    const float db = 10.0f * std::log10(power);
    const float range = gain.max_db - gain.min_db;
    float norm = 0.0f;
    if (range > 0.0f) {
        norm = std::clamp((db - gain.min_db) / range, 0.0f, 1.0f);
    } else {
        norm = db >= gain.max_db ? 1.0f : 0.0f;
    }
    return norm < 1e-6f ? 0.0f : std::pow(norm, gain.amplification);
}

void SpectrumConverter::convert(std::span<const float> power, float sample_rate,
                                std::span<float> out) const {
    if (!(sample_rate > 0.0f)) {
        throw std::invalid_argument("Invalid sample rate: " + std::to_string(sample_rate));
    }
    if (out.size() < power.size()) {
        throw std::invalid_argument("Converter output holds " + std::to_string(out.size()) +
                                    " values, need " + std::to_string(power.size()));
    }
    if (power.empty()) {
        return;
    }

    if (config_.scale == SpectrumScale::Linear || power.size() < 2) {
        convert_linear(power, out);
    } else {
        convert_scaled(power, sample_rate, out);
    }
}

std::vector<float> SpectrumConverter::convert(std::span<const float> power,
                                              float sample_rate) const {
    std::vector<float> out(power.size(), 0.0f);
    convert(power, sample_rate, out);
    return out;
}

void SpectrumConverter::convert_linear(std::span<const float> power, std::span<float> out) const {
    const auto n = power.size();
    const GainParameters gain = config_.gain;
    for_each_bin(n, [&](std::size_t i) {
        const float center = power[i];
        const float left = i > 0 ? power[i - 1] : center;
        const float right = i + 1 < n ? power[i + 1] : center;
        out[i] = normalize_db((left + center + right) / 3.0f, gain);
    });
}

void SpectrumConverter::convert_scaled(std::span<const float> power, float sample_rate,
                                       std::span<float> out) const {
    const auto n = power.size();
    const GainParameters gain = config_.gain;
    const Axis axis = axis_for(config_.scale);

    const float nyquist = sample_rate * 0.5f;
    const float lo = axis.to_axis(1.0f);
    const float hi = axis.to_axis(nyquist);
    const float step = (hi - lo) / static_cast<float>(n - 1);
    const auto last = static_cast<long>(n - 1);

    for_each_bin(n, [&](std::size_t i) {
        const float hz = axis.to_hz(lo + static_cast<float>(i) * step);
        const long bin = std::clamp(std::lround(hz / nyquist * static_cast<float>(n - 1)), 0L, last);
        out[i] = normalize_db(power[static_cast<std::size_t>(bin)], gain);
    });
}

void SpectrumConverter::for_each_bin(std::size_t count,
                                     const std::function<void(std::size_t)>& body) const {
    JobPool& pool = pool_ != nullptr ? *pool_ : JobPool::shared();
    if (count >= kMinParallelBins && pool.size() > 0) {
        pool.parallel_for(count, body);
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        body(i);
    }
}

}  // namespace specvis
