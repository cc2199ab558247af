#include "specvis/spectrum_renderer.hpp"

#include "specvis/logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace specvis {

const char* to_string(RendererState state) noexcept {
    switch (state) {
        case RendererState::Uninitialized:
            return "uninitialized";
        case RendererState::Initialized:
            return "initialized";
        case RendererState::Configured:
            return "configured";
        case RendererState::Disposed:
            return "disposed";
    }
    return "unknown";
}

SpectrumRenderer::SpectrumRenderer(RenderStyle style, std::string name, JobPool* pool)
    : style_{style}, name_{std::move(name)}, processor_{pool} {}

void SpectrumRenderer::initialize() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (disposed_.load(std::memory_order_acquire)) {
        SPECVIS_LOG_DEBUG(name_, "initialize() ignored: renderer is disposed");
        return;
    }
    if (state() != RendererState::Uninitialized) {
        return;
    }

    on_initialize();
    state_.store(RendererState::Initialized, std::memory_order_release);
    SPECVIS_LOG_DEBUG(name_, "Initialized");
}

void SpectrumRenderer::configure(bool overlay_active, RenderQuality quality) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (disposed_.load(std::memory_order_acquire)) {
        SPECVIS_LOG_DEBUG(name_, "configure() ignored: renderer is disposed");
        return;
    }

    {
        std::lock_guard<std::mutex> draw_lock(draw_mutex_);
        on_configure(overlay_active, quality_settings(quality));
    }

    overlay_.store(overlay_active, std::memory_order_release);
    processor_.set_smoothing_factor(overlay_active ? SpectrumProcessor::kOverlaySmoothingFactor
                                                   : SpectrumProcessor::kDefaultSmoothingFactor);
    quality_.store(quality, std::memory_order_release);

    if (state() == RendererState::Initialized) {
        state_.store(RendererState::Configured, std::memory_order_release);
    }
}

void SpectrumRenderer::set_quality(RenderQuality quality) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (disposed_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> draw_lock(draw_mutex_);
        on_configure(is_overlay_active(), quality_settings(quality));
    }
    quality_.store(quality, std::memory_order_release);
}

void SpectrumRenderer::render(Surface* surface, std::span<const float> spectrum,
                              const RenderRequest& request) {
    if (disposed_.load(std::memory_order_acquire)) {
        SPECVIS_LOG_DEBUG(name_, "render() skipped: renderer is disposed");
        return;
    }
    if (state() != RendererState::Configured) {
        SPECVIS_LOG_DEBUG(name_, "render() skipped: state is %s", to_string(state()));
        return;
    }
    if (surface == nullptr || !surface->is_valid() || surface->width() <= 0 ||
        surface->height() <= 0) {
        SPECVIS_LOG_DEBUG(name_, "render() skipped: no usable surface");
        return;
    }
    if (spectrum.empty() || request.bar_count == 0) {
        SPECVIS_LOG_DEBUG(name_, "render() skipped: empty spectrum or zero bars");
        return;
    }

    const auto bar_count = std::min(spectrum.size(), request.bar_count);
    const auto bars = processor_.prepare(spectrum, bar_count, spectrum.size());

    std::lock_guard<std::mutex> draw_lock(draw_mutex_);
    if (disposed_.load(std::memory_order_acquire)) {
        return;
    }

    const DrawContext ctx{.surface = *surface,
                          .bars = bars,
                          .request = request,
                          .quality = fidelity(),
                          .overlay = is_overlay_active()};
    try {
        draw(ctx);
    } catch (const std::exception& e) {
        SPECVIS_LOG_ERROR(name_, "draw failed: %s", e.what());
    } catch (...) {
        SPECVIS_LOG_ERROR(name_, "draw failed: unknown exception");
    }
}

void SpectrumRenderer::dispose() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    state_.store(RendererState::Disposed, std::memory_order_release);

    {
        // Waits for an in-flight draw() to finish.
        std::lock_guard<std::mutex> draw_lock(draw_mutex_);
        on_dispose();
    }
    processor_.reset();
    SPECVIS_LOG_DEBUG(name_, "Disposed");
}

float SpectrumRenderer::display_level(float level) noexcept {
    return std::isfinite(level) ? std::clamp(level, 0.0f, 1.0f) : 0.0f;
}

float SpectrumRenderer::sample(std::span<const float> bars, int column, int columns,
                               SamplingFidelity fidelity) noexcept {
    if (bars.empty() || columns <= 0) {
        return 0.0f;
    }
    const auto at = [&](std::size_t i) { return std::isfinite(bars[i]) ? bars[i] : 0.0f; };
    const auto n = bars.size();
    if (n == 1) {
        return at(0);
    }

    const float pos = (static_cast<float>(column) + 0.5f) * static_cast<float>(n) /
                          static_cast<float>(columns) -
                      0.5f;
    const float clamped = std::clamp(pos, 0.0f, static_cast<float>(n - 1));

    if (fidelity == SamplingFidelity::Fast) {
        return at(static_cast<std::size_t>(std::lround(clamped)));
    }

    const auto lo = static_cast<std::size_t>(clamped);
    const auto hi = std::min(lo + 1, n - 1);
    const float t = clamped - static_cast<float>(lo);
    return at(lo) + (at(hi) - at(lo)) * t;
}

void SpectrumRenderer::draw_bar(Surface& surface, int x, int width, int base_y, int max_height,
                                float level, const QualitySettings& quality) {
    if (max_height <= 0 || width <= 0) {
        return;
    }

    const float cells = display_level(level) * static_cast<float>(max_height);
    const int full = static_cast<int>(cells);
    const float fraction = cells - static_cast<float>(full);

    for (int y = 0; y < full; ++y) {
        const auto shade =
            shade_for_level(static_cast<float>(y) / static_cast<float>(max_height));
        for (int bx = 0; bx < width; ++bx) {
            surface.put(x + bx, base_y - y, Glyph::Block, shade);
        }
    }

    if (!quality.antialiasing || full >= max_height) {
        return;
    }

    // Best sampling also shows quarter-cell caps.
    const float threshold = quality.sampling == SamplingFidelity::Best ? 0.25f : 0.5f;
    if (fraction >= threshold) {
        const auto shade =
            shade_for_level(static_cast<float>(full) / static_cast<float>(max_height));
        for (int bx = 0; bx < width; ++bx) {
            surface.put(x + bx, base_y - full, Glyph::LowerHalf, shade);
        }
    }
}

}  // namespace specvis
