#include "specvis/renderer_registry.hpp"
#include "specvis/renderers.hpp"

#include <utility>

namespace specvis {

void RendererTable::add(RenderStyle style, RendererFactory factory) {
    factories_[style] = std::move(factory);
}

const RendererFactory* RendererTable::find(RenderStyle style) const noexcept {
    const auto it = factories_.find(style);
    return it == factories_.end() ? nullptr : &it->second;
}

std::vector<RenderStyle> RendererTable::styles() const {
    std::vector<RenderStyle> out;
    out.reserve(factories_.size());
    for (const auto& entry : factories_) {
        out.push_back(entry.first);
    }
    return out;
}

namespace {

template <typename T>
void add_style(RendererTable& table, RenderStyle style, JobPool* pool) {
    table.add(style, [pool] { return std::make_shared<T>(pool); });
}

}  // namespace

RendererTable default_renderer_table(JobPool* pool) {
    RendererTable table;
    add_style<BarsRenderer>(table, RenderStyle::Bars, pool);
    add_style<DotsRenderer>(table, RenderStyle::Dots, pool);
    add_style<WaveformRenderer>(table, RenderStyle::Waveform, pool);
    add_style<LedMeterRenderer>(table, RenderStyle::LedMeter, pool);
    add_style<ParticlesRenderer>(table, RenderStyle::Particles, pool);
    add_style<WaterfallRenderer>(table, RenderStyle::Waterfall, pool);
    add_style<GaugeRenderer>(table, RenderStyle::Gauge, pool);
    return table;
}

}  // namespace specvis
