#include "specvis/renderers.hpp"

#include <algorithm>

namespace specvis {

namespace {

constexpr int kTrailLength = 3;

}  // namespace

DotsRenderer::DotsRenderer(JobPool* pool) : SpectrumRenderer{RenderStyle::Dots, "dots", pool} {}

void DotsRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();
    const int base_y = height - 1;

    for (int x = 0; x < width; ++x) {
        const float level =
            std::clamp(sample(ctx.bars, x, width, ctx.quality.sampling), 0.0f, 1.0f);
        const int row = static_cast<int>(level * static_cast<float>(height - 1));
        const int y = base_y - row;

        const Glyph dot = ctx.quality.antialiasing && level > 0.5f ? Glyph::Diamond : Glyph::Bullet;
        surface.put(x, y, dot, shade_for_level(level));

        if (!ctx.quality.advanced_effects) {
            continue;
        }
        for (int t = 1; t <= kTrailLength && y + t <= base_y; ++t) {
            surface.put_char(x, y + t, t == 1 ? ':' : '.', Shade::Low);
        }
    }
}

}  // namespace specvis
