#include "specvis/renderers.hpp"

namespace specvis {

PlaceholderRenderer::PlaceholderRenderer() : SpectrumRenderer{RenderStyle::Bars, "placeholder"} {}

void PlaceholderRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();

    for (int x = 0; x < width; ++x) {
        const float level = display_level(sample(ctx.bars, x, width, SamplingFidelity::Fast));
        const int rows = static_cast<int>(level * static_cast<float>(height - 1));
        for (int y = 0; y < rows; ++y) {
            surface.put(x, height - 1 - y, Glyph::Checker, Shade::Low);
        }
    }
    surface.text(0, 0, "[fallback]", Shade::Text);
}

}  // namespace specvis
