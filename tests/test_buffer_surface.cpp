#include "specvis/buffer_surface.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace specvis {
namespace {

TEST(BufferSurfaceTest, StartsBlank) {
    BufferSurface surface{4, 2};
    EXPECT_EQ(surface.width(), 4);
    EXPECT_EQ(surface.height(), 2);
    EXPECT_TRUE(surface.is_valid());
    EXPECT_EQ(surface.painted_cells(), 0u);
    EXPECT_EQ(surface.to_string(), "    \n    \n");
}

TEST(BufferSurfaceTest, DrawsGlyphsAndText) {
    BufferSurface surface{6, 2};
    surface.put(0, 0, Glyph::Block, Shade::High);
    surface.text(1, 1, "ab", Shade::Text);

    EXPECT_EQ(surface.at(0, 0).glyph, Glyph::Block);
    EXPECT_EQ(surface.at(0, 0).shade, Shade::High);
    EXPECT_EQ(surface.at(2, 1).ch, 'b');
    EXPECT_EQ(surface.painted_cells(), 3u);
    EXPECT_EQ(surface.draw_calls(), 3u);
    EXPECT_EQ(surface.to_string(), "#     \n ab   \n");
}

TEST(BufferSurfaceTest, ClipsOutsideWrites) {
    BufferSurface surface{3, 3};
    surface.put(-1, 0, Glyph::Block, Shade::Low);
    surface.put(3, 1, Glyph::Block, Shade::Low);
    surface.text(2, 2, "xyz", Shade::Text);
    EXPECT_EQ(surface.painted_cells(), 1u);
    EXPECT_THROW((void)surface.at(3, 0), std::out_of_range);
}

TEST(BufferSurfaceTest, ClearAndResize) {
    BufferSurface surface{3, 3};
    surface.put(1, 1, Glyph::Diamond, Shade::Accent);
    surface.clear();
    EXPECT_EQ(surface.painted_cells(), 0u);
    EXPECT_EQ(surface.draw_calls(), 0u);

    surface.resize(5, 1);
    EXPECT_EQ(surface.width(), 5);
    EXPECT_EQ(surface.height(), 1);
    surface.resize(-2, 4);
    EXPECT_EQ(surface.width(), 0);
    EXPECT_EQ(surface.painted_cells(), 0u);
}

TEST(BufferSurfaceTest, InvalidateMarksSurfaceUnusable) {
    BufferSurface surface{2, 2};
    surface.invalidate();
    EXPECT_FALSE(surface.is_valid());
}

TEST(ShadeTest, LevelsMapQuietToLoud) {
    EXPECT_EQ(shade_for_level(0.0f), Shade::Low);
    EXPECT_EQ(shade_for_level(0.4f), Shade::MidLow);
    EXPECT_EQ(shade_for_level(0.6f), Shade::Mid);
    EXPECT_EQ(shade_for_level(0.8f), Shade::MidHigh);
    EXPECT_EQ(shade_for_level(1.0f), Shade::High);
}

}  // namespace
}  // namespace specvis
