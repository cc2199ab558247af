#pragma once

#include "specvis/renderer.hpp"
#include "specvis/spectrum_processor.hpp"
#include "specvis/surface.hpp"

#include <atomic>
#include <mutex>
#include <span>
#include <string>

namespace specvis {

/// Base class for styles that draw a smoothed bar array.
///
/// Implements the Renderer lifecycle, input validation and spectrum
/// preparation once; a style only supplies draw() and, if it owns drawing
/// resources, on_initialize()/on_dispose(). render() prepares the bars
/// through this instance's SpectrumProcessor and then calls draw() with the
/// draw lock held, so on_dispose() never runs concurrently with draw().
class SpectrumRenderer : public Renderer {
public:
    SpectrumRenderer(RenderStyle style, std::string name, JobPool* pool = nullptr);
    ~SpectrumRenderer() override = default;

    SpectrumRenderer(const SpectrumRenderer&) = delete;
    SpectrumRenderer& operator=(const SpectrumRenderer&) = delete;

    void initialize() override;
    void configure(bool overlay_active, RenderQuality quality) override;
    void render(Surface* surface, std::span<const float> spectrum,
                const RenderRequest& request) override;

    [[nodiscard]] RenderQuality quality() const noexcept override {
        return quality_.load(std::memory_order_acquire);
    }
    void set_quality(RenderQuality quality) override;

    [[nodiscard]] bool is_overlay_active() const noexcept override {
        return overlay_.load(std::memory_order_acquire);
    }
    [[nodiscard]] RendererState state() const noexcept override {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] RenderStyle style() const noexcept override { return style_; }
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void dispose() override;

    /// Smoothing factor currently in effect (depends on overlay mode).
    [[nodiscard]] float smoothing_factor() const noexcept {
        return processor_.smoothing_factor();
    }

protected:
    /// Everything draw() needs for one frame.
    struct DrawContext {
        Surface& surface;
        std::span<const float> bars;   // Smoothed, one value per bar
        const RenderRequest& request;
        QualitySettings quality;
        bool overlay;
    };

    virtual void draw(const DrawContext& ctx) = 0;

    /// Called once by the first initialize(). May throw; the instance then
    /// stays Uninitialized.
    virtual void on_initialize() {}

    /// Called by every configure() on a live instance before the new settings
    /// take effect. May throw; the settings are then left unchanged.
    virtual void on_configure(bool /*overlay_active*/, const QualitySettings& /*quality*/) {}

    /// Releases drawing resources. Called at most once.
    virtual void on_dispose() {}

    /// Current quality flags.
    [[nodiscard]] QualitySettings fidelity() const noexcept {
        return quality_settings(quality());
    }

    [[nodiscard]] SpectrumProcessor& processor() noexcept { return processor_; }

    /// Level clamped to [0, 1]; NaN and infinities draw as silence.
    [[nodiscard]] static float display_level(float level) noexcept;

    /// Value of bars at a surface column, using nearest-bar sampling for Fast
    /// and linear interpolation otherwise. Non-finite bars read as 0.
    [[nodiscard]] static float sample(std::span<const float> bars, int column, int columns,
                                      SamplingFidelity fidelity) noexcept;

    /// Draws a vertical bar of `level` (clamped to [0, 1]) growing up from
    /// base_y. With antialiasing a fractional cap cell is added.
    static void draw_bar(Surface& surface, int x, int width, int base_y, int max_height,
                         float level, const QualitySettings& quality);

private:
    const RenderStyle style_;
    const std::string name_;

    SpectrumProcessor processor_;

    std::atomic<RenderQuality> quality_{RenderQuality::Medium};
    std::atomic<bool> overlay_{false};
    std::atomic<RendererState> state_{RendererState::Uninitialized};
    std::atomic<bool> disposed_{false};

    // Serializes initialize/configure/dispose.
    std::mutex lifecycle_mutex_;
    // Held while draw()/on_configure()/on_dispose() touch style resources.
    std::mutex draw_mutex_;
};

}  // namespace specvis
