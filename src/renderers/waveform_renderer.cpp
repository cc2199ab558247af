#include "specvis/renderers.hpp"

#include <algorithm>

namespace specvis {

WaveformRenderer::WaveformRenderer(JobPool* pool)
    : SpectrumRenderer{RenderStyle::Waveform, "waveform", pool} {}

void WaveformRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();
    const int centre = height / 2;
    const int half = std::max(1, height / 2);

    if (ctx.quality.advanced_effects) {
        for (int x = 0; x < width; ++x) {
            surface.put(x, centre, Glyph::HLine, Shade::Accent);
        }
    }

    for (int x = 0; x < width; ++x) {
        const float level =
            std::clamp(sample(ctx.bars, x, width, ctx.quality.sampling), 0.0f, 1.0f);
        const int extent = static_cast<int>(level * static_cast<float>(half));
        const Shade shade = shade_for_level(level);

        for (int dy = 1; dy <= extent; ++dy) {
            const Glyph glyph = ctx.quality.antialiasing && dy == extent ? Glyph::Bullet
                                                                         : Glyph::VLine;
            surface.put(x, centre - dy, glyph, shade);
            surface.put(x, centre + dy, glyph, shade);
        }
        if (extent > 0 || !ctx.quality.advanced_effects) {
            surface.put(x, centre, Glyph::Block, shade);
        }
    }
}

}  // namespace specvis
