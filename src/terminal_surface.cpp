#include "specvis/terminal_surface.hpp"

#include <ncurses.h>

#include <cstddef>
#include <iterator>

namespace specvis {

namespace {

bool g_has_color = false;

// Colour pair per Shade; 0 leaves the terminal default.
constexpr short kPairs[] = {
    0,  // Background
    1,  // Low
    2,  // MidLow
    3,  // Mid
    4,  // MidHigh
    5,  // High
    6,  // Accent
    7,  // Text
};

attr_t attributes_for(Shade shade) noexcept {
    const auto index = static_cast<std::size_t>(shade);
    attr_t attrs = A_NORMAL;
    if (g_has_color && index < std::size(kPairs) && kPairs[index] != 0) {
        attrs |= COLOR_PAIR(kPairs[index]);
    }
    if (shade == Shade::Accent || shade == Shade::High) {
        attrs |= A_BOLD;
    }
    return attrs;
}

chtype glyph_char(Glyph glyph) noexcept {
    switch (glyph) {
        case Glyph::Space: return ' ';
        case Glyph::Block: return ACS_BLOCK;
        case Glyph::LowerHalf: return '_';
        case Glyph::Checker: return ACS_CKBOARD;
        case Glyph::HLine: return ACS_HLINE;
        case Glyph::VLine: return ACS_VLINE;
        case Glyph::Bullet: return ACS_BULLET;
        case Glyph::Diamond: return ACS_DIAMOND;
        case Glyph::Plus: return ACS_PLUS;
        case Glyph::Degree: return ACS_DEGREE;
    }
    return '?';
}

}  // namespace

TerminalSurface::TerminalSurface(int origin_x, int origin_y, int width, int height) noexcept
    : origin_x_{origin_x}, origin_y_{origin_y}, width_{width}, height_{height} {}

bool TerminalSurface::init_colors() noexcept {
    if (!has_colors()) {
        g_has_color = false;
        return false;
    }
    start_color();
    use_default_colors();

    init_pair(1, COLOR_BLUE, -1);
    init_pair(2, COLOR_CYAN, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_RED, -1);
    init_pair(6, COLOR_MAGENTA, -1);
    init_pair(7, COLOR_WHITE, -1);

    g_has_color = true;
    return true;
}

void TerminalSurface::set_viewport(int origin_x, int origin_y, int width, int height) noexcept {
    origin_x_ = origin_x;
    origin_y_ = origin_y;
    width_ = width;
    height_ = height;
    valid_ = true;
}

void TerminalSurface::clear() {
    for (int y = 0; y < height_; ++y) {
        mvhline(origin_y_ + y, origin_x_, ' ', width_);
    }
}

void TerminalSurface::put(int x, int y, Glyph glyph, Shade shade) {
    if (!contains(x, y)) {
        return;
    }
    mvaddch(origin_y_ + y, origin_x_ + x, glyph_char(glyph) | attributes_for(shade));
}

void TerminalSurface::put_char(int x, int y, char ch, Shade shade) {
    if (!contains(x, y)) {
        return;
    }
    mvaddch(origin_y_ + y, origin_x_ + x,
            static_cast<chtype>(static_cast<unsigned char>(ch)) | attributes_for(shade));
}

void TerminalSurface::text(int x, int y, std::string_view str, Shade shade) {
    if (y < 0 || y >= height_) {
        return;
    }
    for (std::size_t i = 0; i < str.size(); ++i) {
        put_char(x + static_cast<int>(i), y, str[i], shade);
    }
}

}  // namespace specvis
