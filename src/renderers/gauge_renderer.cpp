#include "specvis/renderers.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <numeric>

namespace specvis {

namespace {

constexpr int kTicks = 10;
constexpr float kPeakDecay = 0.97f;

// Angle for a gauge position: 0 is the left end, 1 the right end.
float angle_for(float position) noexcept {
    return std::numbers::pi_v<float> * (1.0f - std::clamp(position, 0.0f, 1.0f));
}

}  // namespace

GaugeRenderer::GaugeRenderer(JobPool* pool)
    : SpectrumRenderer{RenderStyle::Gauge, "gauge", pool} {}

void GaugeRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();

    const float loudness = display_level(std::accumulate(ctx.bars.begin(), ctx.bars.end(), 0.0f) /
                                         static_cast<float>(ctx.bars.size()));

    const float rate = loudness > needle_ ? kNeedleRise : kNeedleFall;
    needle_ += (loudness - needle_) * rate;
    peak_ = std::max(needle_, peak_ * kPeakDecay);

    // Terminal cells are about twice as tall as wide.
    const int cx = width / 2;
    const int cy = height - 2;
    const float ry = static_cast<float>(std::max(1, std::min(cy, width / 4)));
    const float rx = ry * 2.0f;

    const int arc_points = ctx.quality.sampling == SamplingFidelity::Fast ? 24 : 48;
    for (int i = 0; i <= arc_points; ++i) {
        const float pos = static_cast<float>(i) / static_cast<float>(arc_points);
        const float a = angle_for(pos);
        const int x = cx + static_cast<int>(std::lround(rx * std::cos(a)));
        const int y = cy - static_cast<int>(std::lround(ry * std::sin(a)));
        surface.put(x, y, Glyph::Bullet, pos <= needle_ ? shade_for_level(pos) : Shade::Low);
    }

    if (ctx.quality.advanced_effects) {
        for (int t = 0; t <= kTicks; ++t) {
            const float a = angle_for(static_cast<float>(t) / kTicks);
            const int x = cx + static_cast<int>(std::lround((rx + 2.0f) * std::cos(a)));
            const int y = cy - static_cast<int>(std::lround((ry + 1.0f) * std::sin(a)));
            surface.put(x, y, Glyph::Degree, Shade::Text);
        }
        const float a = angle_for(peak_);
        surface.put(cx + static_cast<int>(std::lround(rx * std::cos(a))),
                    cy - static_cast<int>(std::lround(ry * std::sin(a))), Glyph::Plus,
                    Shade::Accent);
    }

    // Needle from the hub to just inside the arc.
    const float a = angle_for(needle_);
    const int steps = static_cast<int>(rx);
    for (int s = 0; s < steps; ++s) {
        const float r = static_cast<float>(s) / static_cast<float>(steps);
        const int x = cx + static_cast<int>(std::lround(r * (rx - 1.0f) * std::cos(a)));
        const int y = cy - static_cast<int>(std::lround(r * (ry - 1.0f) * std::sin(a)));
        if (ctx.quality.antialiasing) {
            surface.put(x, y, Glyph::Bullet, Shade::Accent);
        } else {
            surface.put_char(x, y, '*', Shade::Accent);
        }
    }
    surface.put(cx, cy, Glyph::Diamond, Shade::Text);

    char label[24];
    std::snprintf(label, sizeof(label), "%3d%%", static_cast<int>(needle_ * 100.0f + 0.5f));
    surface.text(cx - 2, height - 1, label, Shade::Text);
}

}  // namespace specvis
