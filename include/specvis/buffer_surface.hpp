#pragma once

#include "specvis/surface.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace specvis {

/// In-memory Surface. Used headless and by the tests to inspect what a
/// renderer drew.
class BufferSurface final : public Surface {
public:
    struct Cell {
        Glyph glyph = Glyph::Space;
        char ch = ' ';        // Set by put_char()/text(), '\0' for glyph cells
        Shade shade = Shade::Background;
    };

    BufferSurface(int width, int height);

    [[nodiscard]] int width() const noexcept override { return width_; }
    [[nodiscard]] int height() const noexcept override { return height_; }
    [[nodiscard]] bool is_valid() const noexcept override { return valid_; }

    void clear() override;
    void put(int x, int y, Glyph glyph, Shade shade) override;
    void put_char(int x, int y, char ch, Shade shade) override;
    void text(int x, int y, std::string_view str, Shade shade) override;

    /// Marks the surface unusable, as if its backing resource was lost.
    void invalidate() noexcept { valid_ = false; }

    /// Reallocates to a new size and clears.
    void resize(int width, int height);

    [[nodiscard]] const Cell& at(int x, int y) const;

    /// Number of cells that are not blank.
    [[nodiscard]] std::size_t painted_cells() const noexcept;

    /// Number of write calls since construction or the last clear().
    [[nodiscard]] std::size_t draw_calls() const noexcept { return draw_calls_; }

    /// One line per row; glyph cells become '#', blanks ' '.
    [[nodiscard]] std::string to_string() const;

private:
    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(x);
    }

    int width_;
    int height_;
    bool valid_ = true;
    std::size_t draw_calls_ = 0;
    std::vector<Cell> cells_;
};

}  // namespace specvis
