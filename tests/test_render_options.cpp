#include "specvis/render_quality.hpp"
#include "specvis/render_style.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>

namespace specvis {
namespace {

TEST(RenderQualityTest, LowDisablesEverything) {
    constexpr auto s = quality_settings(RenderQuality::Low);
    EXPECT_FALSE(s.antialiasing);
    EXPECT_EQ(s.sampling, SamplingFidelity::Fast);
    EXPECT_FALSE(s.advanced_effects);
}

TEST(RenderQualityTest, MediumIsBalanced) {
    constexpr auto s = quality_settings(RenderQuality::Medium);
    EXPECT_TRUE(s.antialiasing);
    EXPECT_EQ(s.sampling, SamplingFidelity::Balanced);
    EXPECT_TRUE(s.advanced_effects);
}

TEST(RenderQualityTest, HighUsesBestSampling) {
    constexpr auto s = quality_settings(RenderQuality::High);
    EXPECT_TRUE(s.antialiasing);
    EXPECT_EQ(s.sampling, SamplingFidelity::Best);
    EXPECT_TRUE(s.advanced_effects);
}

TEST(RenderQualityTest, UnknownValueFallsBackToMedium) {
    const auto bogus = static_cast<RenderQuality>(42);
    EXPECT_EQ(quality_settings(bogus), quality_settings(RenderQuality::Medium));
    EXPECT_STREQ(to_string(bogus), "medium");
}

TEST(RenderQualityTest, ParsesNames) {
    EXPECT_EQ(parse_quality("low"), RenderQuality::Low);
    EXPECT_EQ(parse_quality("Medium"), RenderQuality::Medium);
    EXPECT_EQ(parse_quality("med"), RenderQuality::Medium);
    EXPECT_EQ(parse_quality("HIGH"), RenderQuality::High);
    EXPECT_THROW((void)parse_quality("ultra"), std::invalid_argument);
    for (const auto q : {RenderQuality::Low, RenderQuality::Medium, RenderQuality::High}) {
        EXPECT_EQ(parse_quality(to_string(q)), q);
    }
}

TEST(RenderStyleTest, NamesAreUniqueAndParseBack) {
    std::set<std::string> names;
    for (const auto style : kAllRenderStyles) {
        names.insert(to_string(style));
        EXPECT_EQ(parse_style(to_string(style)), style);
    }
    EXPECT_EQ(names.size(), kAllRenderStyles.size());
    EXPECT_STREQ(to_string(static_cast<RenderStyle>(99)), "unknown");
}

TEST(RenderStyleTest, ParsingIgnoresCaseAndSeparators) {
    EXPECT_EQ(parse_style("LED-Meter"), RenderStyle::LedMeter);
    EXPECT_EQ(parse_style("led_meter"), RenderStyle::LedMeter);
    EXPECT_EQ(parse_style("Water Fall"), RenderStyle::Waterfall);
    EXPECT_THROW((void)parse_style("spiral"), std::invalid_argument);
    EXPECT_THROW((void)parse_style(""), std::invalid_argument);
}

TEST(RenderStyleTest, CyclingWraps) {
    EXPECT_EQ(next_style(RenderStyle::Bars), RenderStyle::Dots);
    EXPECT_EQ(next_style(RenderStyle::Gauge), RenderStyle::Bars);
    EXPECT_EQ(previous_style(RenderStyle::Bars), RenderStyle::Gauge);
    EXPECT_EQ(previous_style(RenderStyle::Dots), RenderStyle::Bars);

    auto style = RenderStyle::Waveform;
    for (std::size_t i = 0; i < kAllRenderStyles.size(); ++i) {
        style = next_style(style);
    }
    EXPECT_EQ(style, RenderStyle::Waveform);
}

}  // namespace
}  // namespace specvis
