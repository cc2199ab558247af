#pragma once

#include "specvis/render_quality.hpp"
#include "specvis/render_style.hpp"
#include "specvis/renderer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace specvis {

class JobPool;

/// Builds a fresh, uninitialized renderer. May throw.
using RendererFactory = std::function<std::shared_ptr<Renderer>()>;

/// Style -> factory registration table. Styles without an entry are unknown
/// to a registry built from this table.
class RendererTable {
public:
    /// Registers a factory, replacing any previous one for the style.
    void add(RenderStyle style, RendererFactory factory);

    /// Returns the factory for a style, or nullptr.
    [[nodiscard]] const RendererFactory* find(RenderStyle style) const noexcept;

    [[nodiscard]] bool contains(RenderStyle style) const noexcept { return find(style) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return factories_.size(); }
    [[nodiscard]] std::vector<RenderStyle> styles() const;

private:
    std::map<RenderStyle, RendererFactory> factories_;
};

/// Table with every built-in style.
[[nodiscard]] RendererTable default_renderer_table(JobPool* pool = nullptr);

/// Owns at most one live renderer per style.
///
/// create_renderer() looks the style up in an immutable snapshot of the
/// cache without locking; only a miss (or a failed configure) takes the
/// registry mutex. Any failure to build, initialize or configure a renderer
/// is logged and answered with a fallback PlaceholderRenderer, so callers
/// always get something they can render with. The only exception that
/// escapes is std::invalid_argument for a style the table does not know.
///
/// Thread safety: all methods may be called concurrently.
class RendererRegistry {
public:
    explicit RendererRegistry(RendererTable table,
                              RenderQuality initial_quality = RenderQuality::Medium);

    /// Disposes every renderer (final reset()).
    ~RendererRegistry();

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;

    /// Returns the cached renderer for a style, building it on first use, and
    /// configures it with the overlay flag and quality (global quality when
    /// none is given).
    /// @throws std::invalid_argument if no factory is registered for style.
    [[nodiscard]] std::shared_ptr<Renderer> create_renderer(
        RenderStyle style, bool overlay_active,
        std::optional<RenderQuality> quality = std::nullopt);

    [[nodiscard]] RenderQuality global_quality() const noexcept {
        return global_quality_.load(std::memory_order_acquire);
    }

    /// Reconfigures every cached renderer with the new quality, keeping each
    /// one's overlay flag. Per-renderer failures are logged and skipped.
    /// Returns after all renderers were visited.
    void set_global_quality(RenderQuality quality);

    /// Disposes and forgets every renderer, starting a new generation; the
    /// next request for any style builds and initializes it again.
    void reset();

    /// Cached renderers, in style order. Empty if none.
    [[nodiscard]] std::vector<std::shared_ptr<Renderer>> get_all_renderers() const;

    /// Cached renderer for a style, or nullptr.
    [[nodiscard]] std::shared_ptr<Renderer> get_cached_renderer(RenderStyle style) const;

    [[nodiscard]] std::vector<RenderStyle> registered_styles() const { return table_.styles(); }

    /// Incremented by every reset().
    [[nodiscard]] std::uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    /// Number of fallback substitutions so far.
    [[nodiscard]] std::size_t fallback_count() const noexcept {
        return fallback_count_.load(std::memory_order_relaxed);
    }

private:
    using Cache = std::map<RenderStyle, std::shared_ptr<Renderer>>;

    [[nodiscard]] std::shared_ptr<Renderer> create_locked(RenderStyle style, bool overlay_active,
                                                          RenderQuality quality);
    [[nodiscard]] std::shared_ptr<Renderer> substitute_fallback(RenderStyle style,
                                                                bool overlay_active,
                                                                RenderQuality quality);

    const RendererTable table_;

    // Guards writers of cache_, initialized_ and fallback_.
    mutable std::mutex mutex_;
    std::atomic<std::shared_ptr<const Cache>> cache_;
    std::set<RenderStyle> initialized_;
    std::shared_ptr<Renderer> fallback_;

    std::atomic<RenderQuality> global_quality_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::size_t> fallback_count_{0};
};

}  // namespace specvis
