#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace specvis {

class JobPool;

/// Frequency axis used when mapping FFT bins to output positions.
enum class SpectrumScale {
    Linear,
    Logarithmic,
    Mel,
    Bark,
    ERB
};

[[nodiscard]] const char* to_string(SpectrumScale scale) noexcept;

/// Accepts "linear", "log"/"logarithmic", "mel", "bark", "erb".
/// @throws std::invalid_argument for anything else.
[[nodiscard]] SpectrumScale parse_scale(std::string_view text);

/// Decibel window mapped onto [0, 1], plus a shaping exponent applied to the
/// normalized value (values below 1 lift quiet content).
struct GainParameters {
    float min_db = -130.0f;
    float max_db = 0.0f;
    float amplification = 0.5f;

    /// @throws std::invalid_argument if min_db > max_db or amplification <= 0.
    void validate() const;
};

struct ConverterConfig {
    SpectrumScale scale = SpectrumScale::Logarithmic;
    GainParameters gain{};
};

/// Turns a linear power spectrum into normalized display values.
///
/// The output has one value per input bin, each in [0, 1]. Linear scale
/// averages every bin with its two neighbours; the perceptual scales resample
/// the bins along their own axis from 1 Hz to Nyquist, picking the nearest
/// bin for each output position.
class SpectrumConverter {
public:
    /// @throws std::invalid_argument if config.gain is invalid.
    explicit SpectrumConverter(const ConverterConfig& config = {}, JobPool* pool = nullptr);

    /// Writes power.size() values into out.
    /// @throws std::invalid_argument if sample_rate <= 0 or out is too small.
    void convert(std::span<const float> power, float sample_rate, std::span<float> out) const;

    [[nodiscard]] std::vector<float> convert(std::span<const float> power,
                                             float sample_rate) const;

    [[nodiscard]] const ConverterConfig& config() const noexcept { return config_; }

    void set_scale(SpectrumScale scale) noexcept { config_.scale = scale; }

    /// @throws std::invalid_argument if gain is invalid; the old gain stays.
    void set_gain(const GainParameters& gain);

    /// Power to [0, 1] through the gain window. Non-positive power maps to 0.
    [[nodiscard]] static float normalize_db(float power, const GainParameters& gain) noexcept;

private:
    void convert_linear(std::span<const float> power, std::span<float> out) const;
    void convert_scaled(std::span<const float> power, float sample_rate,
                        std::span<float> out) const;
    void for_each_bin(std::size_t count, const std::function<void(std::size_t)>& body) const;

    ConverterConfig config_;
    JobPool* pool_;
};

}  // namespace specvis
