#pragma once

#include "specvis/spectrum_renderer.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace specvis {

/// Classic vertical bars with falling peak markers.
class BarsRenderer final : public SpectrumRenderer {
public:
    static constexpr float kPeakDecay = 0.92f;

    explicit BarsRenderer(JobPool* pool = nullptr);

protected:
    void on_initialize() override;
    void draw(const DrawContext& ctx) override;
    void on_dispose() override;

private:
    std::vector<float> peaks_;
};

/// One dot per column at the bar's height, with a fading trail below it.
class DotsRenderer final : public SpectrumRenderer {
public:
    explicit DotsRenderer(JobPool* pool = nullptr);

protected:
    void draw(const DrawContext& ctx) override;
};

/// Spectrum mirrored around the horizontal centre line.
class WaveformRenderer final : public SpectrumRenderer {
public:
    explicit WaveformRenderer(JobPool* pool = nullptr);

protected:
    void draw(const DrawContext& ctx) override;
};

/// Segmented LED columns with a lit/unlit pattern and a level readout.
class LedMeterRenderer final : public SpectrumRenderer {
public:
    static constexpr int kSegmentHeight = 1;
    static constexpr int kSegmentGap = 1;

    explicit LedMeterRenderer(JobPool* pool = nullptr);

protected:
    void draw(const DrawContext& ctx) override;
};

/// Particles spawned at loud bars that drift upward and fade.
class ParticlesRenderer final : public SpectrumRenderer {
public:
    static constexpr std::size_t kMaxParticles = 512;
    static constexpr std::size_t kMaxParticlesLowQuality = 128;
    static constexpr float kSpawnThreshold = 0.1f;

    explicit ParticlesRenderer(JobPool* pool = nullptr);

    /// Live particles after the last frame.
    [[nodiscard]] std::size_t particle_count() const noexcept { return particles_.size(); }

protected:
    void on_initialize() override;
    void on_configure(bool overlay_active, const QualitySettings& quality) override;
    void draw(const DrawContext& ctx) override;
    void on_dispose() override;

private:
    struct Particle {
        float x;
        float y;
        float velocity;
        float life;    // 1.0 at spawn, removed at 0
        float level;
    };

    std::vector<Particle> particles_;
    std::size_t capacity_ = kMaxParticles;
    std::mt19937 rng_{0x5eed};
};

/// Scrolling spectrogram: newest frame at the top, older rows below.
class WaterfallRenderer final : public SpectrumRenderer {
public:
    explicit WaterfallRenderer(JobPool* pool = nullptr);

protected:
    void draw(const DrawContext& ctx) override;
    void on_dispose() override;

private:
    // history_[row * columns_ + column]; row 0 is the newest.
    std::vector<float> history_;
    int columns_ = 0;
    int rows_ = 0;
    int head_ = 0;
};

/// Needle gauge showing the overall loudness of the bars.
class GaugeRenderer final : public SpectrumRenderer {
public:
    static constexpr float kNeedleRise = 0.5f;
    static constexpr float kNeedleFall = 0.1f;

    explicit GaugeRenderer(JobPool* pool = nullptr);

    /// Needle position in [0, 1] after the last frame.
    [[nodiscard]] float needle() const noexcept { return needle_; }

protected:
    void draw(const DrawContext& ctx) override;

private:
    float needle_ = 0.0f;
    float peak_ = 0.0f;
};

/// Fallback style. Low checker bars and a "[fallback]" tag; allocates
/// nothing and cannot fail to construct, initialize or configure. One
/// instance serves every failed style, so style() is always Bars.
class PlaceholderRenderer final : public SpectrumRenderer {
public:
    PlaceholderRenderer();

    [[nodiscard]] bool is_fallback() const noexcept override { return true; }

protected:
    void draw(const DrawContext& ctx) override;
};

}  // namespace specvis
