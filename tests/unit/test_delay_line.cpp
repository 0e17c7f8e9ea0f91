#include <gtest/gtest.h>
#include "DelayLine.hpp"
#include "dynamics/SoftLimiter.hpp"
#include <cmath>
#include <vector>

using namespace tonegen;

TEST(DelayLineTest, ImpulseReturnsAfterOneLength) {
    DelayLine delay(1000, 0.0105f); // 10 samples
    ASSERT_EQ(delay.length(), 10u);
    delay.set_wet(0.5f);
    delay.set_feedback(0.3f);

    std::vector<float> block(25, 0.0f);
    block[0] = 1.0f;
    delay.pull(block);

    EXPECT_FLOAT_EQ(block[0], 1.0f);
    for (size_t i = 1; i < 10; ++i) EXPECT_EQ(block[i], 0.0f);
    // Reflection = dry * feedback * wet
    EXPECT_FLOAT_EQ(block[10], 0.15f);
    // Only dry samples are written back, so the reflection does not repeat
    EXPECT_EQ(block[20], 0.0f);
}

TEST(DelayLineTest, CursorWrapsAndResetClears) {
    DelayLine delay(100, 0.052f); // 5 samples
    delay.set_wet(1.0f);
    delay.set_feedback(0.5f);

    std::vector<float> block(7, 1.0f);
    delay.pull(block);
    EXPECT_EQ(delay.cursor(), 2u);

    delay.reset();
    EXPECT_EQ(delay.cursor(), 0u);

    std::vector<float> silent(5, 0.0f);
    delay.pull(silent);
    for (float s : silent) EXPECT_EQ(s, 0.0f);
}

TEST(DelayLineTest, ParameterClamping) {
    DelayLine delay(44100);
    EXPECT_EQ(delay.length(), static_cast<size_t>(44100.0f * 0.2f));
    delay.set_feedback(1.5f);
    EXPECT_FLOAT_EQ(delay.feedback(), 0.99f);
    delay.set_wet(-1.0f);
    EXPECT_FLOAT_EQ(delay.wet(), 0.0f);
}

TEST(SoftLimiterTest, ScalesPeakToCeilingThenSaturates) {
    SoftLimiter limiter(0.7f);
    std::vector<float> block = {1.4f, -0.7f, 0.35f};
    limiter.pull(block);

    EXPECT_FLOAT_EQ(limiter.last_reduction(), 0.5f);
    EXPECT_NEAR(block[0], std::tanh(0.7f), 1e-6f);
    EXPECT_NEAR(block[1], std::tanh(-0.35f), 1e-6f);
    EXPECT_NEAR(block[2], std::tanh(0.175f), 1e-6f);
}

TEST(SoftLimiterTest, QuietBlockOnlyGainAndSaturation) {
    SoftLimiter limiter(0.7f);
    limiter.set_gain(2.0f);
    std::vector<float> block = {0.5f, -0.25f};
    limiter.pull(block);

    EXPECT_FLOAT_EQ(limiter.last_reduction(), 1.0f);
    EXPECT_NEAR(block[0], std::tanh(1.0f), 1e-6f);
    EXPECT_NEAR(block[1], std::tanh(-0.5f), 1e-6f);
}

TEST(SoftLimiterTest, OutputNeverExceedsUnity) {
    SoftLimiter limiter(1.0f);
    limiter.set_gain(2.0f);
    std::vector<float> block = {1000.0f, -1000.0f, 3.0f, 1e-9f};
    limiter.pull(block);
    for (float s : block) {
        EXPECT_LE(std::abs(s), 1.0f);
    }
}
