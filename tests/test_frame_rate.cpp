#include "specvis/frame_rate.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace specvis {
namespace {

using namespace std::chrono_literals;

class FrameRateMeterTest : public ::testing::Test {
protected:
    FrameRateMeter meter_;
    FrameRateMeter::Clock::time_point now_{};

    double run(int frames, FrameRateMeter::Clock::duration interval) {
        double fps = 0.0;
        for (int i = 0; i < frames; ++i) {
            now_ += interval;
            fps = meter_.tick(now_);
        }
        return fps;
    }
};

TEST_F(FrameRateMeterTest, ReportsZeroUntilTwoFrames) {
    EXPECT_DOUBLE_EQ(meter_.fps(), 0.0);
    EXPECT_DOUBLE_EQ(run(1, 20ms), 0.0);
    EXPECT_NEAR(run(1, 20ms), 50.0, 1e-6);
}

TEST_F(FrameRateMeterTest, SteadyPacingGivesExactRate) {
    EXPECT_NEAR(run(300, 16ms), 62.5, 1e-6);
}

TEST_F(FrameRateMeterTest, EasesTowardsNewRate) {
    run(200, 20ms);
    const double first = run(1, 10ms);
    EXPECT_GT(first, 50.0);
    EXPECT_LT(first, 55.0);

    EXPECT_NEAR(run(400, 10ms), 100.0, 0.5);
}

TEST_F(FrameRateMeterTest, IgnoresUnrealisticBursts) {
    run(10, 20ms);
    const double before = meter_.fps();
    // Every frame at the same instant: the window span collapses.
    meter_.reset();
    for (int i = 0; i < 5; ++i) {
        meter_.tick(now_);
    }
    EXPECT_DOUBLE_EQ(meter_.fps(), 0.0);
    EXPECT_GT(before, 0.0);

    run(10, 100us);
    EXPECT_DOUBLE_EQ(meter_.fps(), 0.0);
}

TEST_F(FrameRateMeterTest, ResetForgetsHistory) {
    run(50, 20ms);
    meter_.reset();
    EXPECT_DOUBLE_EQ(meter_.fps(), 0.0);
    EXPECT_NEAR(run(2, 5ms), 200.0, 1e-6);
}

TEST(FrameLimiterTest, WaitsOutTheFrameBudget) {
    const FrameLimiter limiter{50};
    EXPECT_EQ(limiter.budget(), 20ms);
    EXPECT_EQ(limiter.remaining(5ms), 15ms);
    EXPECT_EQ(limiter.remaining(20ms), FrameLimiter::Clock::duration::zero());
    EXPECT_EQ(limiter.remaining(35ms), FrameLimiter::Clock::duration::zero());
}

TEST(FrameLimiterTest, DisabledNeverWaits) {
    FrameLimiter limiter{60, false};
    EXPECT_FALSE(limiter.is_enabled());
    EXPECT_EQ(limiter.remaining(0ms), FrameLimiter::Clock::duration::zero());

    limiter.toggle();
    EXPECT_TRUE(limiter.is_enabled());
    EXPECT_GT(limiter.remaining(0ms), FrameLimiter::Clock::duration::zero());
}

TEST(FrameLimiterTest, ClampsNonPositiveRate) {
    EXPECT_EQ(FrameLimiter{0}.budget(), 1s);
    EXPECT_EQ(FrameLimiter{-5}.budget(), 1s);
}

}  // namespace
}  // namespace specvis
