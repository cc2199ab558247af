#pragma once

#include <array>
#include <string_view>

namespace specvis {

/// Identifies a visual style. A style is only usable once a factory for it is
/// registered in the RendererTable handed to the registry.
enum class RenderStyle {
    Bars,
    Dots,
    Waveform,
    LedMeter,
    Particles,
    Waterfall,
    Gauge
};

inline constexpr std::array<RenderStyle, 7> kAllRenderStyles = {
    RenderStyle::Bars,      RenderStyle::Dots,      RenderStyle::Waveform, RenderStyle::LedMeter,
    RenderStyle::Particles, RenderStyle::Waterfall, RenderStyle::Gauge};

/// Returns the style's lowercase name, or "unknown" for values outside the enum.
[[nodiscard]] const char* to_string(RenderStyle style) noexcept;

/// Parses a style name (case-insensitive, '-' and '_' ignored).
/// @throws std::invalid_argument for an unknown name.
[[nodiscard]] RenderStyle parse_style(std::string_view text);

/// Next/previous style in kAllRenderStyles order, wrapping around.
[[nodiscard]] RenderStyle next_style(RenderStyle style) noexcept;
[[nodiscard]] RenderStyle previous_style(RenderStyle style) noexcept;

}  // namespace specvis
