#include "specvis/renderers.hpp"

#include <algorithm>

namespace specvis {

BarsRenderer::BarsRenderer(JobPool* pool) : SpectrumRenderer{RenderStyle::Bars, "bars", pool} {}

void BarsRenderer::on_initialize() {
    peaks_.reserve(256);
}

void BarsRenderer::on_dispose() {
    peaks_.clear();
    peaks_.shrink_to_fit();
}

void BarsRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int bar_count = static_cast<int>(ctx.bars.size());
    const int width = surface.width();
    const int height = surface.height();

    int bar_width = std::max(1, ctx.request.bar_width);
    int gap = std::max(0, ctx.request.bar_spacing);
    int shown = bar_count;

    if (shown * (bar_width + gap) - gap > width) {
        // Does not fit: drop the gaps, then narrow the bars, then resample.
        gap = 0;
        bar_width = std::max(1, width / bar_count);
        shown = std::min(bar_count, width / bar_width);
    }

    const int used = shown * (bar_width + gap) - gap;
    const int left = std::max(0, (width - used) / 2);
    const int base_y = height - 1;

    if (peaks_.size() != static_cast<std::size_t>(shown)) {
        peaks_.assign(static_cast<std::size_t>(shown), 0.0f);
    }

    for (int i = 0; i < shown; ++i) {
        const float level = display_level(shown == bar_count
                                              ? ctx.bars[static_cast<std::size_t>(i)]
                                              : sample(ctx.bars, i, shown, ctx.quality.sampling));
        const int x = left + i * (bar_width + gap);

        draw_bar(surface, x, bar_width, base_y, height, level, ctx.quality);

        if (!ctx.quality.advanced_effects) {
            continue;
        }

        float& peak = peaks_[static_cast<std::size_t>(i)];
        peak = level > peak ? level : peak * kPeakDecay;

        const int bar_rows = static_cast<int>(level * static_cast<float>(height));
        const int peak_row = static_cast<int>(display_level(peak) * static_cast<float>(height - 1));
        if (peak_row >= bar_rows) {
            for (int bx = 0; bx < bar_width; ++bx) {
                surface.put(x + bx, base_y - peak_row, Glyph::HLine, Shade::Accent);
            }
        }
    }
}

}  // namespace specvis
