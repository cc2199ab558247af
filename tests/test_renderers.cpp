#include "specvis/buffer_surface.hpp"
#include "specvis/job_pool.hpp"
#include "specvis/renderer_registry.hpp"
#include "specvis/renderers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace specvis {
namespace {

class RenderersTest : public ::testing::Test {
protected:
    JobPool pool_{0};
    std::vector<float> loud_ = std::vector<float>(256, 1.0f);
    std::vector<float> silent_ = std::vector<float>(256, 0.0f);

    template <typename T>
    std::shared_ptr<T> make(bool overlay = false, RenderQuality quality = RenderQuality::High) {
        auto r = std::make_shared<T>(&pool_);
        r->initialize();
        r->configure(overlay, quality);
        return r;
    }

    static void render_frames(Renderer& r, Surface& surface, std::span<const float> spectrum,
                              int frames, std::size_t bars = 32) {
        for (int i = 0; i < frames; ++i) {
            surface.clear();
            r.render(&surface, spectrum, RenderRequest{.bar_count = bars, .bar_width = 1});
        }
    }
};

TEST_F(RenderersTest, EveryStyleDrawsAtEveryQuality) {
    const RendererTable table = default_renderer_table(&pool_);
    for (const auto style : kAllRenderStyles) {
        for (const auto quality : {RenderQuality::Low, RenderQuality::Medium, RenderQuality::High}) {
            const auto* factory = table.find(style);
            ASSERT_NE(factory, nullptr);
            auto r = (*factory)();
            r->initialize();
            r->configure(false, quality);

            BufferSurface surface{60, 16};
            render_frames(*r, surface, loud_, 10);
            EXPECT_GT(surface.painted_cells(), 0u)
                << to_string(style) << " at " << to_string(quality);
            r->dispose();
        }
    }
}

TEST_F(RenderersTest, StylesReportTheirIdentity) {
    EXPECT_EQ(make<BarsRenderer>()->style(), RenderStyle::Bars);
    EXPECT_EQ(make<DotsRenderer>()->style(), RenderStyle::Dots);
    EXPECT_EQ(make<WaveformRenderer>()->style(), RenderStyle::Waveform);
    EXPECT_EQ(make<LedMeterRenderer>()->style(), RenderStyle::LedMeter);
    EXPECT_EQ(make<ParticlesRenderer>()->style(), RenderStyle::Particles);
    EXPECT_EQ(make<WaterfallRenderer>()->style(), RenderStyle::Waterfall);
    EXPECT_EQ(make<GaugeRenderer>()->style(), RenderStyle::Gauge);
    EXPECT_EQ(make<GaugeRenderer>()->name(), "gauge");
}

TEST_F(RenderersTest, StylesStayInsideTinySurfaces) {
    const RendererTable table = default_renderer_table(&pool_);
    for (const auto style : kAllRenderStyles) {
        auto r = (*table.find(style))();
        r->initialize();
        r->configure(false, RenderQuality::High);
        for (const auto [w, h] : {std::pair{1, 1}, std::pair{2, 1}, std::pair{1, 3}, std::pair{3, 2}}) {
            BufferSurface surface{w, h};
            EXPECT_NO_THROW(render_frames(*r, surface, loud_, 3)) << to_string(style);
        }
    }
}

TEST_F(RenderersTest, NonFiniteSpectrumDrawsAsSilence) {
    std::vector<float> broken(64, std::numeric_limits<float>::quiet_NaN());
    for (std::size_t i = 0; i < broken.size(); i += 3) {
        broken[i] = std::numeric_limits<float>::infinity();
    }

    const RendererTable table = default_renderer_table(&pool_);
    std::vector<std::shared_ptr<Renderer>> renderers;
    for (const auto style : kAllRenderStyles) {
        renderers.push_back((*table.find(style))());
    }
    renderers.push_back(std::make_shared<PlaceholderRenderer>());

    for (const auto& r : renderers) {
        for (const auto quality : {RenderQuality::Low, RenderQuality::High}) {
            r->initialize();
            r->configure(false, quality);
            // 64 bars fit the wide surface as-is; the narrow one resamples them.
            for (const auto [w, h] : {std::pair{80, 12}, std::pair{20, 6}}) {
                BufferSurface surface{w, h};
                EXPECT_NO_THROW(render_frames(*r, surface, broken, 4, 64)) << r->name();
                EXPECT_NO_THROW(render_frames(*r, surface, loud_, 4, 64)) << r->name();
            }
        }
        r->dispose();
    }
}

TEST_F(RenderersTest, GaugeNeedleStaysFiniteForNonFiniteInput) {
    auto gauge = make<GaugeRenderer>();
    BufferSurface surface{40, 12};
    render_frames(*gauge, surface, loud_, 40);

    // Smoothing keeps NaN in the history, so the needle falls back towards rest.
    const std::vector<float> nan(64, std::numeric_limits<float>::quiet_NaN());
    render_frames(*gauge, surface, nan, 40);
    EXPECT_TRUE(std::isfinite(gauge->needle()));
    EXPECT_LT(gauge->needle(), 0.5f);
    EXPECT_GT(surface.painted_cells(), 0u);
}

TEST_F(RenderersTest, BarsFillColumnsForLoudInput) {
    auto bars = make<BarsRenderer>(false, RenderQuality::Low);
    BufferSurface surface{32, 8};
    render_frames(*bars, surface, loud_, 60);

    // Smoothed towards 1.0: the bottom row is fully lit.
    for (int x = 0; x < 32; ++x) {
        EXPECT_EQ(surface.at(x, 7).glyph, Glyph::Block) << "column " << x;
    }
}

TEST_F(RenderersTest, BarsShowPeakMarkersOnlyWithEffects) {
    auto high = make<BarsRenderer>(false, RenderQuality::High);
    auto low = make<BarsRenderer>(false, RenderQuality::Low);
    BufferSurface high_surface{32, 10};
    BufferSurface low_surface{32, 10};

    render_frames(*high, high_surface, loud_, 30);
    render_frames(*low, low_surface, loud_, 30);
    // Fall off to half height so the peak hangs above the bar.
    std::vector<float> half(256, 0.5f);
    render_frames(*high, high_surface, half, 3);
    render_frames(*low, low_surface, half, 3);

    auto count_hlines = [](const BufferSurface& s) {
        int n = 0;
        for (int y = 0; y < s.height(); ++y) {
            for (int x = 0; x < s.width(); ++x) {
                n += s.at(x, y).glyph == Glyph::HLine ? 1 : 0;
            }
        }
        return n;
    };
    EXPECT_GT(count_hlines(high_surface), 0);
    EXPECT_EQ(count_hlines(low_surface), 0);
}

TEST_F(RenderersTest, ParticleCapacityFollowsQuality) {
    auto particles = make<ParticlesRenderer>(false, RenderQuality::Low);
    BufferSurface surface{200, 40};
    render_frames(*particles, surface, loud_, 20);
    EXPECT_GT(particles->particle_count(), 0u);
    EXPECT_LE(particles->particle_count(), ParticlesRenderer::kMaxParticlesLowQuality);

    particles->set_quality(RenderQuality::High);
    render_frames(*particles, surface, loud_, 20);
    EXPECT_LE(particles->particle_count(), ParticlesRenderer::kMaxParticles);
}

TEST_F(RenderersTest, SilenceSpawnsNoParticles) {
    auto particles = make<ParticlesRenderer>();
    BufferSurface surface{80, 20};
    render_frames(*particles, surface, silent_, 10);
    EXPECT_EQ(particles->particle_count(), 0u);
}

TEST_F(RenderersTest, GaugeNeedleRisesAndFalls) {
    auto gauge = make<GaugeRenderer>();
    BufferSurface surface{40, 12};

    render_frames(*gauge, surface, loud_, 40);
    const float loud_needle = gauge->needle();
    EXPECT_GT(loud_needle, 0.5f);

    render_frames(*gauge, surface, silent_, 40);
    EXPECT_LT(gauge->needle(), loud_needle);
}

TEST_F(RenderersTest, WaterfallSurvivesResize) {
    auto waterfall = make<WaterfallRenderer>();
    BufferSurface surface{30, 10};
    render_frames(*waterfall, surface, loud_, 5);
    surface.resize(50, 4);
    render_frames(*waterfall, surface, loud_, 5);
    EXPECT_GT(surface.painted_cells(), 0u);
}

TEST_F(RenderersTest, LedMeterPrintsLevelWithEffects) {
    auto meter = make<LedMeterRenderer>(false, RenderQuality::High);
    BufferSurface surface{40, 10};
    render_frames(*meter, surface, loud_, 5);
    EXPECT_NE(surface.to_string().find("level"), std::string::npos);
}

TEST_F(RenderersTest, PlaceholderMarksItself) {
    PlaceholderRenderer placeholder;
    placeholder.initialize();
    placeholder.configure(false, RenderQuality::Medium);
    BufferSurface surface{30, 6};
    placeholder.render(&surface, loud_, RenderRequest{.bar_count = 16});
    EXPECT_NE(surface.to_string().find("[fallback]"), std::string::npos);
    EXPECT_TRUE(placeholder.is_fallback());
    EXPECT_FALSE(make<BarsRenderer>()->is_fallback());
}

TEST_F(RenderersTest, DisposedStylesReleaseState) {
    auto particles = make<ParticlesRenderer>();
    BufferSurface surface{80, 20};
    render_frames(*particles, surface, loud_, 5);
    particles->dispose();
    EXPECT_EQ(particles->particle_count(), 0u);
}

}  // namespace
}  // namespace specvis
