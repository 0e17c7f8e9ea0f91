#include <gtest/gtest.h>
#include "oscillator/PhaseOscillator.hpp"
#include "oscillator/VibratoLfo.hpp"
#include "oscillator/Waveform.hpp"
#include "filter/OnePoleFilter.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace tonegen;

class OscillatorTest : public ::testing::Test {
protected:
    const int sample_rate = 44100;
    const int block_size = 512;
};

TEST_F(OscillatorTest, PhaseStaysInUnitInterval) {
    const std::vector<double> frequencies = {0.0, 0.5, 261.63, 12543.85, 44100.0, 100000.0};
    for (double freq : frequencies) {
        PhaseOscillator osc(sample_rate);
        osc.set_frequency(freq);
        for (int i = 0; i < block_size * 4; ++i) {
            const double phase = osc.advance();
            ASSERT_GE(phase, 0.0) << freq;
            ASSERT_LT(phase, 1.0) << freq;
        }
    }
}

TEST_F(OscillatorTest, IncrementMatchesFrequency) {
    PhaseOscillator osc(sample_rate);
    osc.set_frequency(441.0);
    EXPECT_DOUBLE_EQ(osc.phase_increment(), 0.01);

    osc.advance();
    osc.set_frequency(882.0);
    // Phase is preserved across frequency changes
    EXPECT_NEAR(osc.phase(), 0.01, 1e-12);

    osc.reset();
    EXPECT_EQ(osc.phase(), 0.0);
}

TEST_F(OscillatorTest, WaveformBounds) {
    const std::vector<Waveform> shapes = {
        Waveform::Sine, Waveform::Square, Waveform::Sawtooth, Waveform::Triangle, Waveform::Pulse};
    for (Waveform wave : shapes) {
        double peak = 0.0;
        for (int i = 0; i < 1000; ++i) {
            const double s = waveform_sample(wave, i / 1000.0);
            peak = std::max(peak, std::abs(s));
        }
        EXPECT_LE(peak, 1.0) << to_string(wave);
        EXPECT_GT(peak, 0.3) << to_string(wave);
    }
}

TEST_F(OscillatorTest, PulseDutyCycle) {
    int high = 0;
    for (int i = 0; i < 1000; ++i) {
        if (waveform_sample(Waveform::Pulse, i / 1000.0) > 0.0) ++high;
    }
    EXPECT_EQ(high, 300);
}

TEST_F(OscillatorTest, WaveformNames) {
    EXPECT_EQ(to_string(Waveform::Sawtooth), "sawtooth");
    EXPECT_EQ(waveform_from_string("triangle"), Waveform::Triangle);
    EXPECT_FALSE(waveform_from_string("noise").has_value());
}

TEST_F(OscillatorTest, AdditiveIsNormalized) {
    const std::vector<float> harmonics = {1.0f, 0.8f, 0.7f, 0.6f, 0.5f, 0.4f, 0.3f};
    double peak = 0.0;
    for (int i = 0; i < 4096; ++i) {
        peak = std::max(peak, std::abs(additive_sample(harmonics, i / 4096.0)));
    }
    EXPECT_LE(peak, 1.0);
    EXPECT_GT(peak, 0.5);

    // Fundamental only is a plain sine
    const std::vector<float> fundamental = {1.0f};
    EXPECT_NEAR(additive_sample(fundamental, 0.25), 1.0, 1e-12);
}

TEST_F(OscillatorTest, VibratoWarmupAndDisable) {
    VibratoLfo lfo(5.5, 0.015, 0.2);
    EXPECT_TRUE(lfo.enabled());
    EXPECT_EQ(lfo.frequency_ratio(0.1, 1.0), 1.0);
    EXPECT_EQ(lfo.frequency_ratio(0.2, 1.0), 1.0);

    bool deviated = false;
    for (int i = 0; i < 100; ++i) {
        const double ratio = lfo.frequency_ratio(0.21 + i * 0.01, 1.0);
        EXPECT_LE(std::abs(ratio - 1.0), 0.015 + 1e-12);
        if (std::abs(ratio - 1.0) > 1e-4) deviated = true;
    }
    EXPECT_TRUE(deviated);

    // Depth scale 0 flattens the LFO
    EXPECT_EQ(lfo.frequency_ratio(0.5, 0.0), 1.0);

    VibratoLfo off(0.0, 0.0, 0.2);
    EXPECT_FALSE(off.enabled());
    EXPECT_EQ(off.frequency_ratio(3.0, 2.0), 1.0);
}

TEST_F(OscillatorTest, OnePoleCarriesMemory) {
    OnePoleFilter filter(0.9f);
    std::vector<float> block(4, 1.0f);
    filter.process(block);
    EXPECT_NEAR(block[0], 0.1f, 1e-6f);
    EXPECT_NEAR(block[1], 0.19f, 1e-6f);

    const float carried = filter.last_output();
    EXPECT_NEAR(filter.process_sample(1.0f), 0.9f * carried + 0.1f, 1e-6f);

    filter.reset();
    EXPECT_EQ(filter.last_output(), 0.0f);
}
