#include "specvis/renderers.hpp"

#include <algorithm>

namespace specvis {

namespace {

constexpr float kLifeDecay = 0.06f;
constexpr float kMinVelocity = 0.3f;
constexpr float kMaxVelocity = 1.2f;

}  // namespace

ParticlesRenderer::ParticlesRenderer(JobPool* pool)
    : SpectrumRenderer{RenderStyle::Particles, "particles", pool} {}

void ParticlesRenderer::on_initialize() {
    particles_.reserve(kMaxParticles);
}

void ParticlesRenderer::on_configure(bool /*overlay_active*/, const QualitySettings& quality) {
    capacity_ = quality.advanced_effects ? kMaxParticles : kMaxParticlesLowQuality;
    if (particles_.size() > capacity_) {
        particles_.resize(capacity_);
    }
}

void ParticlesRenderer::on_dispose() {
    particles_.clear();
    particles_.shrink_to_fit();
}

void ParticlesRenderer::draw(const DrawContext& ctx) {
    Surface& surface = ctx.surface;
    const int width = surface.width();
    const int height = surface.height();
    const int base_y = height - 1;

    // Age and move.
    for (auto& p : particles_) {
        p.y -= p.velocity;
        p.life -= kLifeDecay;
    }
    std::erase_if(particles_, [](const Particle& p) { return p.life <= 0.0f || p.y < 0.0f; });

    // Spawn at loud columns.
    std::uniform_real_distribution<float> chance{0.0f, 1.0f};
    std::uniform_real_distribution<float> speed{kMinVelocity, kMaxVelocity};
    for (int x = 0; x < width && particles_.size() < capacity_; ++x) {
        const float level =
            std::clamp(sample(ctx.bars, x, width, ctx.quality.sampling), 0.0f, 1.0f);
        if (level < kSpawnThreshold || chance(rng_) > level) {
            continue;
        }
        particles_.push_back(Particle{.x = static_cast<float>(x),
                                      .y = static_cast<float>(base_y) -
                                           level * static_cast<float>(height - 1),
                                      .velocity = speed(rng_),
                                      .life = 1.0f,
                                      .level = level});
    }

    if (ctx.quality.advanced_effects) {
        for (int x = 0; x < width; ++x) {
            surface.put(x, base_y, Glyph::HLine, Shade::Low);
        }
    }

    for (const auto& p : particles_) {
        const int x = static_cast<int>(p.x);
        const int y = static_cast<int>(p.y);
        const Shade shade = shade_for_level(p.level * p.life);
        if (p.life > 0.66f) {
            surface.put(x, y, ctx.quality.antialiasing ? Glyph::Plus : Glyph::Bullet, shade);
        } else if (p.life > 0.33f) {
            surface.put(x, y, Glyph::Bullet, shade);
        } else {
            surface.put_char(x, y, '.', shade);
        }
    }
}

}  // namespace specvis
