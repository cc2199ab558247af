#pragma once

#include "specvis/surface.hpp"

namespace specvis {

/// Surface over a rectangle of the ncurses standard screen.
///
/// The caller owns the ncurses session (initscr/endwin) and calls
/// init_colors() once after initscr(). Coordinates are relative to the
/// viewport's top-left corner. After a terminal resize the application sets a
/// new viewport; until then the old one may be invalidated so renderers skip
/// the frame.
class TerminalSurface final : public Surface {
public:
    TerminalSurface(int origin_x, int origin_y, int width, int height) noexcept;

    /// Sets up the colour pairs used for each Shade. Returns false if the
    /// terminal has no colours; drawing then falls back to attributes.
    static bool init_colors() noexcept;

    [[nodiscard]] int width() const noexcept override { return width_; }
    [[nodiscard]] int height() const noexcept override { return height_; }
    [[nodiscard]] bool is_valid() const noexcept override { return valid_ && width_ > 0 && height_ > 0; }

    void clear() override;
    void put(int x, int y, Glyph glyph, Shade shade) override;
    void put_char(int x, int y, char ch, Shade shade) override;
    void text(int x, int y, std::string_view str, Shade shade) override;

    void set_viewport(int origin_x, int origin_y, int width, int height) noexcept;
    void invalidate() noexcept { valid_ = false; }

private:
    int origin_x_;
    int origin_y_;
    int width_;
    int height_;
    bool valid_ = true;
};

}  // namespace specvis
