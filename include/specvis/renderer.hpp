#pragma once

#include "specvis/render_quality.hpp"
#include "specvis/render_style.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace specvis {

class Surface;

/// Lifecycle of a renderer.
///
///   Uninitialized --initialize()--> Initialized --configure()--> Configured
///   Configured --render()*--> Configured --dispose()--> Disposed
///
/// Disposed is terminal. dispose() is legal from any state.
enum class RendererState {
    Uninitialized,
    Initialized,
    Configured,
    Disposed
};

[[nodiscard]] const char* to_string(RendererState state) noexcept;

/// Per-frame layout parameters.
struct RenderRequest {
    std::size_t bar_count = 64;   // Requested bars; capped at the spectrum length
    int bar_width = 1;            // Cells per bar (styles that lay out bars)
    int bar_spacing = 0;          // Cells between bars
};

/// Contract every visual style implements.
///
/// Implementations are shared between the thread that configures them and
/// the thread that renders; configure() and set_quality() may be called while
/// a render() is in flight. dispose() may race render(): render() must check
/// for disposal first and do nothing.
class Renderer {
public:
    virtual ~Renderer() = default;

    /// One-time setup. Calls after the first are no-ops.
    virtual void initialize() = 0;

    /// Selects smoothing for overlay/normal mode and applies the quality policy.
    virtual void configure(bool overlay_active, RenderQuality quality) = 0;

    /// Draws one frame. Requires the Configured state, a valid surface with
    /// positive size, a non-empty spectrum and a positive bar count;
    /// otherwise returns without drawing. Never throws for bad input.
    virtual void render(Surface* surface, std::span<const float> spectrum,
                        const RenderRequest& request) = 0;

    [[nodiscard]] virtual RenderQuality quality() const noexcept = 0;

    /// Re-applies the quality policy only; smoothing and state are unchanged.
    virtual void set_quality(RenderQuality quality) = 0;

    [[nodiscard]] virtual bool is_overlay_active() const noexcept = 0;
    [[nodiscard]] virtual RendererState state() const noexcept = 0;
    /// The registry's shared fallback reports Bars whichever style it stands
    /// in for; check is_fallback() rather than comparing styles.
    [[nodiscard]] virtual RenderStyle style() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// True only for the stand-in handed out when a style fails.
    [[nodiscard]] virtual bool is_fallback() const noexcept { return false; }

    /// Releases drawing resources exactly once. Idempotent.
    virtual void dispose() = 0;
};

}  // namespace specvis
