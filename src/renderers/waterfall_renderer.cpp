#include "specvis/renderers.hpp"

#include <algorithm>
#include <string_view>

namespace specvis {

namespace {

// Intensity ramp, quiet to loud.
constexpr std::string_view kRamp = " .:-=+*#%@";
constexpr std::string_view kRampCoarse = " .+#";

}  // namespace

WaterfallRenderer::WaterfallRenderer(JobPool* pool)
    : SpectrumRenderer{RenderStyle::Waterfall, "waterfall", pool} {}

void WaterfallRenderer::on_dispose() {
    history_.clear();
    history_.shrink_to_fit();
    columns_ = rows_ = head_ = 0;
}

void WaterfallRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();

    if (width != columns_ || height != rows_) {
        // Size changed: start a fresh history.
        columns_ = width;
        rows_ = height;
        head_ = 0;
        history_.assign(static_cast<std::size_t>(columns_) * static_cast<std::size_t>(rows_),
                        0.0f);
    }

    // Write the newest row into the ring slot before head_.
    head_ = (head_ + rows_ - 1) % rows_;
    float* newest = history_.data() + static_cast<std::size_t>(head_) * columns_;
    for (int x = 0; x < columns_; ++x) {
        newest[x] = display_level(sample(ctx.bars, x, columns_, ctx.quality.sampling));
    }

    const std::string_view ramp = ctx.quality.advanced_effects ? kRamp : kRampCoarse;
    const auto steps = static_cast<float>(ramp.size() - 1);

    for (int row = 0; row < rows_; ++row) {
        const int slot = (head_ + row) % rows_;
        const float* values = history_.data() + static_cast<std::size_t>(slot) * columns_;
        for (int x = 0; x < columns_; ++x) {
            const float v = values[x];
            const auto idx = static_cast<std::size_t>(v * steps + 0.5f);
            const char ch = ramp[std::min(idx, ramp.size() - 1)];
            if (ch != ' ') {
                surface.put_char(x, row, ch, shade_for_level(v));
            }
        }
    }
}

}  // namespace specvis
