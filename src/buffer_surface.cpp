#include "specvis/buffer_surface.hpp"

#include <algorithm>
#include <stdexcept>

namespace specvis {

BufferSurface::BufferSurface(int width, int height) : width_{0}, height_{0} {
    resize(width, height);
}

void BufferSurface::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    cells_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), Cell{});
    draw_calls_ = 0;
}

void BufferSurface::clear() {
    std::fill(cells_.begin(), cells_.end(), Cell{});
    draw_calls_ = 0;
}

void BufferSurface::put(int x, int y, Glyph glyph, Shade shade) {
    ++draw_calls_;
    if (!contains(x, y)) {
        return;
    }
    cells_[index(x, y)] = Cell{.glyph = glyph, .ch = '\0', .shade = shade};
}

void BufferSurface::put_char(int x, int y, char ch, Shade shade) {
    ++draw_calls_;
    if (!contains(x, y)) {
        return;
    }
    cells_[index(x, y)] = Cell{.glyph = Glyph::Space, .ch = ch, .shade = shade};
}

void BufferSurface::text(int x, int y, std::string_view str, Shade shade) {
    for (std::size_t i = 0; i < str.size(); ++i) {
        put_char(x + static_cast<int>(i), y, str[i], shade);
    }
}

const BufferSurface::Cell& BufferSurface::at(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("BufferSurface::at: cell outside surface");
    }
    return cells_[index(x, y)];
}

std::size_t BufferSurface::painted_cells() const noexcept {
    return static_cast<std::size_t>(std::count_if(cells_.begin(), cells_.end(), [](const Cell& c) {
        return c.glyph != Glyph::Space || (c.ch != ' ' && c.ch != '\0');
    }));
}

std::string BufferSurface::to_string() const {
    std::string out;
    out.reserve(cells_.size() + static_cast<std::size_t>(height_));
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const auto& c = cells_[index(x, y)];
            if (c.glyph != Glyph::Space) {
                out.push_back('#');
            } else if (c.ch != '\0') {
                out.push_back(c.ch);
            } else {
                out.push_back(' ');
            }
        }
        out.push_back('\n');
    }
    return out;
}

}  // namespace specvis
