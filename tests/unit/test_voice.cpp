#include <gtest/gtest.h>
#include "Voice.hpp"
#include "GenreCatalog.hpp"
#include "TuningSystem.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace tonegen;

class VoiceTest : public ::testing::Test {
protected:
    const int sample_rate = 44100;
    const size_t block_size = 512;
    const GenreCatalog& catalog = GenreCatalog::instance();

    VoiceSettings settings_for(const GenrePreset& preset) const {
        VoiceSettings settings;
        settings.synthesis = preset.synthesis;
        settings.waveform = preset.waveforms.front();
        return settings;
    }
};

TEST_F(VoiceTest, FinishedOnlyAfterFullRelease) {
    const GenrePreset& jazz = catalog.lookup("jazz");
    Voice voice(jazz, 261.63, 0.8f, sample_rate, settings_for(jazz));

    for (int i = 0; i < 50; ++i) {
        voice.generate(block_size);
        ASSERT_FALSE(voice.is_finished());
    }

    voice.note_off();
    EXPECT_FALSE(voice.is_finished());

    // 0.3 s release = 25.8 blocks of 512 at 44.1 kHz
    int blocks = 0;
    while (!voice.is_finished() && blocks < 100) {
        voice.generate(block_size);
        ++blocks;
        if (!voice.is_finished()) {
            EXPECT_LT(voice.release_age(), jazz.envelope.release);
        }
    }
    EXPECT_TRUE(voice.is_finished());
    EXPECT_EQ(blocks, 26);
    EXPECT_GE(voice.release_age(), jazz.envelope.release);
}

TEST_F(VoiceTest, AgeAdvancesByBlockDuration) {
    const GenrePreset& rock = catalog.lookup("rock");
    Voice voice(rock, 440.0, 1.0f, sample_rate, settings_for(rock));

    voice.generate(441);
    EXPECT_NEAR(voice.age(), 0.01, 1e-12);
    EXPECT_EQ(voice.release_age(), 0.0);

    voice.note_off();
    voice.generate(441);
    EXPECT_NEAR(voice.age(), 0.02, 1e-12);
    EXPECT_NEAR(voice.release_age(), 0.01, 1e-12);
}

TEST_F(VoiceTest, PhaseInRangeAfterEveryBlock) {
    const std::vector<size_t> sizes = {1, 7, 64, 512, 4096};
    for (const auto& info : catalog.list()) {
        const GenrePreset& preset = catalog.lookup(info.key);
        for (int note : {0, 60, 127}) {
            Voice voice(preset, TwelveToneEqual().get_frequency(note), 1.0f, sample_rate, settings_for(preset));
            for (size_t n : sizes) {
                voice.generate(n);
                ASSERT_GE(voice.phase(), 0.0);
                ASSERT_LT(voice.phase(), 1.0);
            }
        }
    }
}

TEST_F(VoiceTest, MetalFrequencyNeverDeviates) {
    const GenrePreset& metal = catalog.lookup("metal");
    const double base = TwelveToneEqual().get_frequency(quantize_to_scale(64, metal.scale));
    Voice voice(metal, base, 1.0f, sample_rate, settings_for(metal));
    voice.set_vibrato_scale(2.0);

    const double expected_increment = base / sample_rate;
    for (int i = 0; i < 200; ++i) {
        voice.generate(block_size);
        EXPECT_EQ(voice.effective_frequency(), base);
        EXPECT_EQ(voice.phase_increment(), expected_increment);
    }
}

TEST_F(VoiceTest, VibratoModulatesAfterWarmup) {
    const GenrePreset& jazz = catalog.lookup("jazz");
    Voice voice(jazz, 440.0, 1.0f, sample_rate, settings_for(jazz));

    // Warm-up (0.2 s) covers the first 17 blocks
    for (int i = 0; i < 17; ++i) {
        voice.generate(block_size);
        EXPECT_EQ(voice.effective_frequency(), 440.0);
    }

    double max_deviation = 0.0;
    for (int i = 0; i < 40; ++i) {
        voice.generate(block_size);
        max_deviation = std::max(max_deviation, std::abs(voice.effective_frequency() - 440.0));
    }
    EXPECT_GT(max_deviation, 0.0);
    EXPECT_LE(max_deviation, 440.0 * jazz.vibrato_depth + 1e-9);
}

TEST_F(VoiceTest, VibratoScaleZeroDisablesModulation) {
    const GenrePreset& electronic = catalog.lookup("electronic");
    Voice voice(electronic, 523.25, 1.0f, sample_rate, settings_for(electronic));
    voice.set_vibrato_scale(0.0);

    for (int i = 0; i < 60; ++i) {
        voice.generate(block_size);
        EXPECT_EQ(voice.effective_frequency(), 523.25);
    }
}

TEST_F(VoiceTest, SmoothingContinuesAcrossBlocks) {
    const GenrePreset& rock = catalog.lookup("rock");
    Voice split(rock, 220.0, 1.0f, sample_rate, settings_for(rock));
    Voice whole(rock, 220.0, 1.0f, sample_rate, settings_for(rock));

    // Past the attack so the envelope is in a linear stage on both paths
    split.generate(4410);
    whole.generate(4410);

    const auto first = split.generate(256);
    EXPECT_EQ(split.last_output(), first.back());
    const auto second = split.generate(256);
    const auto joined = whole.generate(512);

    for (size_t i = 0; i < 256; ++i) {
        EXPECT_NEAR(first[i], joined[i], 1e-5f);
        EXPECT_NEAR(second[i], joined[256 + i], 1e-5f);
    }
}

TEST_F(VoiceTest, AmplitudeBoundedByVelocityAndHeadroom) {
    for (const auto& info : catalog.list()) {
        const GenrePreset& preset = catalog.lookup(info.key);
        const float velocity = 100.0f / 127.0f;
        Voice voice(preset, 330.0, velocity, sample_rate, settings_for(preset));
        for (int i = 0; i < 20; ++i) {
            for (float s : voice.generate(block_size)) {
                ASSERT_LE(std::abs(s), velocity * 0.9f + 1e-6f) << info.key;
            }
        }
    }
}

TEST_F(VoiceTest, ResetRewindsToNoteOn) {
    const GenrePreset& classical = catalog.lookup("classical");
    Voice voice(classical, 392.0, 0.5f, sample_rate, settings_for(classical));

    const auto first = voice.generate(block_size);
    voice.generate(block_size);
    voice.note_off();
    voice.reset();

    EXPECT_EQ(voice.age(), 0.0);
    EXPECT_FALSE(voice.released());
    EXPECT_EQ(voice.phase(), 0.0);

    const auto again = voice.generate(block_size);
    for (size_t i = 0; i < block_size; ++i) {
        EXPECT_FLOAT_EQ(again[i], first[i]);
    }
}

TEST_F(VoiceTest, NotIdempotent) {
    const GenrePreset& ambient = catalog.lookup("ambient");
    Voice voice(ambient, 440.0, 1.0f, sample_rate, settings_for(ambient));
    const auto a = voice.generate(block_size);
    const auto b = voice.generate(block_size);

    float diff = 0.0f;
    for (size_t i = 0; i < block_size; ++i) diff += std::abs(a[i] - b[i]);
    EXPECT_GT(diff, 0.0f);
}
