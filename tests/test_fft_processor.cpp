#include "specvis/fft_processor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <vector>

namespace specvis {
namespace {

class FFTProcessorTest : public ::testing::Test {
protected:
    static constexpr std::size_t kFFTSize = 1024;
    static constexpr float kSampleRate = 48000.0f;

    static std::vector<float> sine(float frequency, std::size_t count, float amplitude = 1.0f) {
        std::vector<float> samples(count);
        const float omega = 2.0f * std::numbers::pi_v<float> * frequency / kSampleRate;
        for (std::size_t i = 0; i < count; ++i) {
            samples[i] = amplitude * std::sin(omega * static_cast<float>(i));
        }
        return samples;
    }

    static std::size_t peak_bin(const std::vector<float>& power) {
        return static_cast<std::size_t>(
            std::distance(power.begin(), std::max_element(power.begin(), power.end())));
    }
};

TEST_F(FFTProcessorTest, ReportsSizes) {
    FFTProcessor proc{{.fft_size = 512}};
    EXPECT_EQ(proc.fft_size(), 512u);
    EXPECT_EQ(proc.bin_count(), 257u);
    EXPECT_EQ(proc.window().size(), 512u);
}

TEST_F(FFTProcessorTest, RejectsBadSizes) {
    EXPECT_THROW(FFTProcessor({.fft_size = 500}), std::invalid_argument);
    EXPECT_THROW(FFTProcessor({.fft_size = 0}), std::invalid_argument);
    EXPECT_THROW(FFTProcessor({.fft_size = 1}), std::invalid_argument);
}

TEST_F(FFTProcessorTest, RejectsShortOutput) {
    FFTProcessor proc{{.fft_size = 256}};
    std::vector<float> out(10);
    EXPECT_THROW(proc.compute(sine(1000.0f, 256), out), std::invalid_argument);
}

TEST_F(FFTProcessorTest, BinFrequencyMapping) {
    FFTProcessor proc{{.fft_size = kFFTSize}};
    EXPECT_FLOAT_EQ(proc.bin_to_frequency(0, kSampleRate), 0.0f);
    EXPECT_FLOAT_EQ(proc.bin_to_frequency(512, kSampleRate), 24000.0f);
    EXPECT_EQ(proc.frequency_to_bin(0.0f, kSampleRate), 0u);
    EXPECT_EQ(proc.frequency_to_bin(1000.0f, kSampleRate), 21u);
    EXPECT_EQ(proc.frequency_to_bin(96000.0f, kSampleRate), proc.bin_count() - 1);
}

TEST_F(FFTProcessorTest, FindsSineFrequency) {
    FFTProcessor proc{{.fft_size = kFFTSize, .window = WindowFunction::Hann}};
    std::vector<float> power(proc.bin_count());
    proc.compute(sine(1000.0f, kFFTSize), power);

    const float detected = proc.bin_to_frequency(peak_bin(power), kSampleRate);
    EXPECT_NEAR(detected, 1000.0f, kSampleRate / kFFTSize);
}

TEST_F(FFTProcessorTest, FullScaleSineIsAboutZeroDecibels) {
    FFTProcessor proc{{.fft_size = kFFTSize, .window = WindowFunction::Rectangular}};
    // Exactly on bin 32 so nothing leaks.
    const float frequency = proc.bin_to_frequency(32, kSampleRate);
    std::vector<float> power(proc.bin_count());
    proc.compute(sine(frequency, kFFTSize), power);

    EXPECT_EQ(peak_bin(power), 32u);
    EXPECT_NEAR(power[32], 1.0f, 0.01f);
}

TEST_F(FFTProcessorTest, PowerScalesWithAmplitudeSquared) {
    FFTProcessor proc{{.fft_size = kFFTSize, .window = WindowFunction::Rectangular}};
    const float frequency = proc.bin_to_frequency(40, kSampleRate);
    std::vector<float> full(proc.bin_count());
    std::vector<float> half(proc.bin_count());
    proc.compute(sine(frequency, kFFTSize, 1.0f), full);
    proc.compute(sine(frequency, kFFTSize, 0.5f), half);
    EXPECT_NEAR(half[40] / full[40], 0.25f, 1e-3f);
}

TEST_F(FFTProcessorTest, SilenceHasNoPower) {
    FFTProcessor proc{{.fft_size = kFFTSize}};
    std::vector<float> power(proc.bin_count(), 1.0f);
    proc.compute(std::vector<float>(kFFTSize, 0.0f), power);
    for (const float p : power) {
        EXPECT_FLOAT_EQ(p, 0.0f);
    }
}

TEST_F(FFTProcessorTest, HannLeaksLessThanRectangular) {
    const auto samples = sine(1010.0f, kFFTSize);
    FFTProcessor rect{{.fft_size = kFFTSize, .window = WindowFunction::Rectangular}};
    FFTProcessor hann{{.fft_size = kFFTSize, .window = WindowFunction::Hann}};

    std::vector<float> rect_power(rect.bin_count());
    std::vector<float> hann_power(hann.bin_count());
    rect.compute(samples, rect_power);
    hann.compute(samples, hann_power);

    const std::size_t peak = peak_bin(rect_power);
    float rect_leak = 0.0f;
    float hann_leak = 0.0f;
    for (std::size_t i = 0; i < rect_power.size(); ++i) {
        if (i + 3 < peak || i > peak + 3) {
            rect_leak += rect_power[i];
            hann_leak += hann_power[i];
        }
    }
    EXPECT_LT(hann_leak, rect_leak);
}

TEST_F(FFTProcessorTest, EveryWindowIsBounded) {
    for (const auto w : {WindowFunction::Rectangular, WindowFunction::Hann,
                         WindowFunction::Hamming, WindowFunction::Blackman,
                         WindowFunction::FlatTop}) {
        FFTProcessor proc{{.fft_size = 256, .window = w}};
        for (const float c : proc.window()) {
            EXPECT_LE(c, 1.0f + 1e-5f) << to_string(w);
            EXPECT_GE(c, -0.1f) << to_string(w);
        }
    }
}

TEST_F(FFTProcessorTest, ZeroPadsShortInput) {
    FFTProcessor proc{{.fft_size = kFFTSize}};
    std::vector<float> power(proc.bin_count());
    EXPECT_EQ(proc.compute(sine(1000.0f, 512), power), proc.bin_count());
    EXPECT_EQ(proc.compute({}, power), proc.bin_count());
}

}  // namespace
}  // namespace specvis
