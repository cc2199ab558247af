#pragma once

#include <cstdint>
#include <string_view>

namespace specvis {

/// Colour role of a cell. Surfaces map roles to whatever palette they have.
enum class Shade : std::uint8_t {
    Background,
    Low,      // Quiet
    MidLow,
    Mid,
    MidHigh,
    High,     // Loud
    Accent,   // Peaks, highlights
    Text
};

/// Symbolic glyphs a style can draw without knowing the terminal's charset.
enum class Glyph : std::uint8_t {
    Space,
    Block,       // Full cell
    LowerHalf,   // Partial cap, lower half
    Checker,     // Checkerboard / light fill
    HLine,
    VLine,
    Bullet,
    Diamond,
    Plus,
    Degree
};

/// Maps a normalized level in [0, 1] to a colour role (quiet to loud).
[[nodiscard]] constexpr Shade shade_for_level(float level) noexcept {
    if (level > 0.9f) return Shade::High;
    if (level > 0.7f) return Shade::MidHigh;
    if (level > 0.5f) return Shade::Mid;
    if (level > 0.3f) return Shade::MidLow;
    return Shade::Low;
}

/// Drawing capability handed to renderers.
///
/// Coordinates are cells, (0, 0) top-left. Drawing outside [0, width) x
/// [0, height) is clipped silently. A surface whose backing resource is gone
/// reports is_valid() == false; renderers must not draw on it.
class Surface {
public:
    virtual ~Surface() = default;

    [[nodiscard]] virtual int width() const noexcept = 0;
    [[nodiscard]] virtual int height() const noexcept = 0;
    [[nodiscard]] virtual bool is_valid() const noexcept = 0;

    virtual void clear() = 0;
    virtual void put(int x, int y, Glyph glyph, Shade shade) = 0;
    virtual void put_char(int x, int y, char ch, Shade shade) = 0;
    virtual void text(int x, int y, std::string_view str, Shade shade) = 0;

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width() && y < height();
    }
};

}  // namespace specvis
