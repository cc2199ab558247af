#pragma once

#include <string_view>

namespace specvis {

/// Coarse quality level chosen by the user.
enum class RenderQuality {
    Low,
    Medium,
    High
};

/// How carefully a style samples the bar array onto surface columns.
enum class SamplingFidelity {
    Fast,      // Nearest bar per column
    Balanced,  // Linear interpolation between neighbouring bars
    Best       // Linear interpolation plus sub-cell detail where the style has it
};

/// Concrete fidelity flags derived from a RenderQuality.
struct QualitySettings {
    bool antialiasing = true;
    SamplingFidelity sampling = SamplingFidelity::Balanced;
    bool advanced_effects = true;

    friend bool operator==(const QualitySettings&, const QualitySettings&) = default;
};

/// Maps a quality level to fidelity flags. Total: values outside the enum
/// get Medium's settings.
[[nodiscard]] constexpr QualitySettings quality_settings(RenderQuality quality) noexcept {
    switch (quality) {
        case RenderQuality::Low:
            return {.antialiasing = false,
                    .sampling = SamplingFidelity::Fast,
                    .advanced_effects = false};
        case RenderQuality::High:
            return {.antialiasing = true,
                    .sampling = SamplingFidelity::Best,
                    .advanced_effects = true};
        case RenderQuality::Medium:
            break;
    }
    return {.antialiasing = true, .sampling = SamplingFidelity::Balanced, .advanced_effects = true};
}

[[nodiscard]] const char* to_string(RenderQuality quality) noexcept;

/// Parses "low", "medium" or "high" (case-insensitive).
/// @throws std::invalid_argument for anything else.
[[nodiscard]] RenderQuality parse_quality(std::string_view text);

}  // namespace specvis
