#include "specvis/renderers.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>

namespace specvis {

LedMeterRenderer::LedMeterRenderer(JobPool* pool)
    : SpectrumRenderer{RenderStyle::LedMeter, "ledmeter", pool} {}

void LedMeterRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();

    // Bottom row holds the numeric readout when effects are on.
    const int meter_height = ctx.quality.advanced_effects && height > 2 ? height - 1 : height;
    const int base_y = meter_height - 1;
    const int pitch = kSegmentHeight + kSegmentGap;
    const int segments = std::max(1, (meter_height + kSegmentGap) / pitch);

    const int columns = std::min(width, static_cast<int>(ctx.bars.size()) * 2);
    const int column_width = std::max(1, width / std::max(1, columns));

    for (int c = 0; c < columns; ++c) {
        const float level =
            std::clamp(sample(ctx.bars, c, columns, ctx.quality.sampling), 0.0f, 1.0f);
        const int lit = static_cast<int>(level * static_cast<float>(segments) + 0.5f);
        const int x = c * column_width;

        for (int s = 0; s < segments; ++s) {
            const int y = base_y - s * pitch;
            const bool on = s < lit;
            if (!on && !ctx.quality.advanced_effects) {
                continue;
            }
            const Glyph glyph = on ? Glyph::Block : Glyph::Checker;
            const Shade shade =
                on ? shade_for_level(static_cast<float>(s) / static_cast<float>(segments))
                   : Shade::Background;
            // Leave one cell between columns when there is room.
            const int cell_width = column_width > 1 ? column_width - 1 : 1;
            for (int bx = 0; bx < cell_width; ++bx) {
                surface.put(x + bx, y, glyph, shade);
            }
        }
    }

    if (meter_height < height) {
        const float mean = std::accumulate(ctx.bars.begin(), ctx.bars.end(), 0.0f) /
                           static_cast<float>(ctx.bars.size());
        char label[32];
        std::snprintf(label, sizeof(label), "level %3d%%",
                      static_cast<int>(display_level(mean) * 100.0f + 0.5f));
        surface.text(0, height - 1, label, Shade::Text);
    }
}

}  // namespace specvis
