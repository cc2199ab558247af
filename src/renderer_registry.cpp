#include "specvis/renderer_registry.hpp"

#include "specvis/logging.hpp"
#include "specvis/renderers.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace specvis {

namespace {

constexpr const char* kLogSource = "RendererRegistry";

std::string describe(RenderStyle style) {
    const std::string name = to_string(style);
    if (name != "unknown") {
        return name;
    }
    return "#" + std::to_string(static_cast<int>(style));
}

}  // namespace

RendererRegistry::RendererRegistry(RendererTable table, RenderQuality initial_quality)
    : table_{std::move(table)},
      cache_{std::make_shared<const Cache>()},
      global_quality_{initial_quality} {}

RendererRegistry::~RendererRegistry() {
    reset();
}

std::shared_ptr<Renderer> RendererRegistry::create_renderer(RenderStyle style,
                                                            bool overlay_active,
                                                            std::optional<RenderQuality> quality) {
    const RenderQuality effective = quality.value_or(global_quality());

    // Fast path: no lock when the style is already cached.
    const auto cache = cache_.load(std::memory_order_acquire);
    if (const auto it = cache->find(style); it != cache->end()) {
        try {
            it->second->configure(overlay_active, effective);
            return it->second;
        } catch (const std::exception& e) {
            SPECVIS_LOG_WARNING(kLogSource, "Configure failed for cached style %s: %s",
                                describe(style).c_str(), e.what());
        } catch (...) {
            SPECVIS_LOG_WARNING(kLogSource,
                                "Configure failed for cached style %s: unknown exception",
                                describe(style).c_str());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return create_locked(style, overlay_active, effective);
}

std::shared_ptr<Renderer> RendererRegistry::create_locked(RenderStyle style, bool overlay_active,
                                                          RenderQuality quality) {
    // Another thread may have built it while we waited for the lock.
    const auto cache = cache_.load(std::memory_order_acquire);
    if (const auto it = cache->find(style); it != cache->end()) {
        try {
            it->second->configure(overlay_active, quality);
            return it->second;
        } catch (const std::exception& e) {
            // The instance stays cached; the next request retries it.
            SPECVIS_LOG_ERROR(kLogSource, "Error configuring renderer for style %s: %s",
                              describe(style).c_str(), e.what());
            return substitute_fallback(style, overlay_active, quality);
        } catch (...) {
            SPECVIS_LOG_ERROR(kLogSource,
                              "Error configuring renderer for style %s: unknown exception",
                              describe(style).c_str());
            return substitute_fallback(style, overlay_active, quality);
        }
    }

    const RendererFactory* factory = table_.find(style);
    if (factory == nullptr) {
        throw std::invalid_argument("Unknown render style: " + describe(style));
    }

    std::shared_ptr<Renderer> renderer;
    try {
        renderer = (*factory)();
        if (!renderer) {
            throw std::runtime_error("factory returned no renderer");
        }
        SPECVIS_LOG_DEBUG(kLogSource, "Instance created for style %s", describe(style).c_str());

        if (!initialized_.contains(style)) {
            renderer->initialize();
            initialized_.insert(style);
            SPECVIS_LOG_INFO(kLogSource, "Initialized renderer for style %s",
                             describe(style).c_str());
        }
    } catch (const std::exception& e) {
        SPECVIS_LOG_ERROR(kLogSource, "Error during creation/initialization of style %s: %s",
                          describe(style).c_str(), e.what());
        return substitute_fallback(style, overlay_active, quality);
    } catch (...) {
        SPECVIS_LOG_ERROR(kLogSource,
                          "Error during creation/initialization of style %s: unknown exception",
                          describe(style).c_str());
        return substitute_fallback(style, overlay_active, quality);
    }

    auto next = std::make_shared<Cache>(*cache);
    (*next)[style] = renderer;
    cache_.store(std::move(next), std::memory_order_release);

    try {
        renderer->configure(overlay_active, quality);
    } catch (const std::exception& e) {
        SPECVIS_LOG_ERROR(kLogSource, "Error configuring renderer for style %s: %s",
                          describe(style).c_str(), e.what());
        return substitute_fallback(style, overlay_active, quality);
    } catch (...) {
        SPECVIS_LOG_ERROR(kLogSource, "Error configuring renderer for style %s: unknown exception",
                          describe(style).c_str());
        return substitute_fallback(style, overlay_active, quality);
    }

    return renderer;
}

std::shared_ptr<Renderer> RendererRegistry::substitute_fallback(RenderStyle style,
                                                                bool overlay_active,
                                                                RenderQuality quality) {
    if (!fallback_) {
        fallback_ = std::make_shared<PlaceholderRenderer>();
        fallback_->initialize();
    }
    fallback_->configure(overlay_active, quality);
    fallback_count_.fetch_add(1, std::memory_order_relaxed);

    SPECVIS_LOG_WARNING(kLogSource, "Substituting fallback renderer for style %s",
                        describe(style).c_str());
    return fallback_;
}

void RendererRegistry::set_global_quality(RenderQuality quality) {
    std::lock_guard<std::mutex> lock(mutex_);

    const RenderQuality old = global_quality_.exchange(quality, std::memory_order_acq_rel);

    const auto cache = cache_.load(std::memory_order_acquire);
    for (const auto& [style, renderer] : *cache) {
        try {
            renderer->configure(renderer->is_overlay_active(), quality);
        } catch (const std::exception& e) {
            SPECVIS_LOG_ERROR(kLogSource, "Failed to apply quality %s to style %s: %s",
                              to_string(quality), describe(style).c_str(), e.what());
        } catch (...) {
            SPECVIS_LOG_ERROR(kLogSource,
                              "Failed to apply quality %s to style %s: unknown exception",
                              to_string(quality), describe(style).c_str());
        }
    }
    if (fallback_) {
        fallback_->configure(fallback_->is_overlay_active(), quality);
    }

    SPECVIS_LOG_INFO(kLogSource, "Global quality changed from %s to %s", to_string(old),
                     to_string(quality));
}

void RendererRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto cache =
        cache_.exchange(std::make_shared<const Cache>(), std::memory_order_acq_rel);
    for (const auto& [style, renderer] : *cache) {
        try {
            renderer->dispose();
        } catch (const std::exception& e) {
            SPECVIS_LOG_ERROR(kLogSource, "Error disposing renderer for style %s: %s",
                              describe(style).c_str(), e.what());
        } catch (...) {
            SPECVIS_LOG_ERROR(kLogSource,
                              "Error disposing renderer for style %s: unknown exception",
                              describe(style).c_str());
        }
    }
    if (fallback_) {
        fallback_->dispose();
        fallback_.reset();
    }
    initialized_.clear();

    const auto generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    SPECVIS_LOG_DEBUG(kLogSource, "Reset: disposed %zu renderer(s), generation %llu",
                      cache->size(), static_cast<unsigned long long>(generation));
}

std::vector<std::shared_ptr<Renderer>> RendererRegistry::get_all_renderers() const {
    const auto cache = cache_.load(std::memory_order_acquire);
    std::vector<std::shared_ptr<Renderer>> out;
    out.reserve(cache->size());
    for (const auto& entry : *cache) {
        out.push_back(entry.second);
    }
    return out;
}

std::shared_ptr<Renderer> RendererRegistry::get_cached_renderer(RenderStyle style) const {
    const auto cache = cache_.load(std::memory_order_acquire);
    const auto it = cache->find(style);
    return it == cache->end() ? nullptr : it->second;
}

}  // namespace specvis
