#include <gtest/gtest.h>
#include "Mixer.hpp"
#include "VoiceRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using namespace tonegen;

class MixerTest : public ::testing::Test {
protected:
    float peak(const std::vector<float>& block, size_t begin = 0, size_t end = SIZE_MAX) const {
        float p = 0.0f;
        end = std::min(end, block.size());
        for (size_t i = begin; i < end; ++i) p = std::max(p, std::abs(block[i]));
        return p;
    }

    EngineConfig config;
    VoiceRegistry registry{GenreCatalog::instance(), config};
    Mixer mixer{registry, config};
};

TEST_F(MixerTest, EmptyRegistryYieldsSilence) {
    for (size_t n : {1u, 64u, 512u, 2048u}) {
        const auto block = mixer.render_block(n);
        ASSERT_EQ(block.size(), n);
        for (float s : block) EXPECT_EQ(s, 0.0f);
    }
}

TEST_F(MixerTest, SpanOverloadOverwritesBuffer) {
    std::vector<float> buffer(256, 0.5f);
    mixer.render_block(std::span<float>(buffer));
    for (float s : buffer) EXPECT_EQ(s, 0.0f);
}

TEST_F(MixerTest, BoundedWithManyVoicesAtMaxVelocity) {
    registry.set_volume(2.0);
    for (const auto& info : registry.list_genres()) {
        registry.set_genre(info.key);
        for (int i = 0; i < 64; ++i) {
            registry.note_on(36 + i, 127, "stress" + std::to_string(i));
        }
        ASSERT_EQ(registry.voice_count(), 64u);

        for (int b = 0; b < 40; ++b) {
            const auto block = mixer.render_block(512);
            for (float s : block) {
                ASSERT_LE(s, 1.0f) << info.key;
                ASSERT_GE(s, -1.0f) << info.key;
            }
        }
    }
}

TEST_F(MixerTest, LimiterEngagesAboveCeiling) {
    registry.set_genre("rock");
    for (int i = 0; i < 16; ++i) {
        registry.note_on(48 + i, 127, "v" + std::to_string(i));
    }
    mixer.render_block(4096);
    mixer.render_block(512);
    EXPECT_LT(mixer.limiter().last_reduction(), 1.0f);

    // Block peak lands at tanh(ceiling) with unit gain
    const auto block = mixer.render_block(512);
    EXPECT_LE(peak(block), std::tanh(config.limiter_ceiling) + 1e-5f);
}

TEST_F(MixerTest, MasterVolumeScalesOutput) {
    registry.set_genre("classical");
    registry.note_on(60, 40, "quiet");
    mixer.render_block(4410);

    registry.set_volume(0.0);
    const auto muted = mixer.render_block(512);
    EXPECT_EQ(peak(muted), 0.0f);

    registry.set_volume(1.0);
    EXPECT_GT(peak(mixer.render_block(512)), 0.0f);

    registry.set_expression(0.0);
    EXPECT_EQ(peak(mixer.render_block(512)), 0.0f);
}

TEST_F(MixerTest, PrunesFinishedVoicesAfterRender) {
    registry.set_genre("metal"); // 0.1 s release
    registry.note_on(60, 100, "a");
    registry.note_on(63, 100, "b");
    mixer.render_block(512);
    registry.note_off(60, "a");

    size_t pruned = 0;
    for (int b = 0; b < 12; ++b) {
        mixer.render_block(512);
        pruned += mixer.last_pruned();
    }
    EXPECT_EQ(pruned, 1u);
    EXPECT_EQ(registry.voice_count(), 1u);

    registry.note_off(63, "b");
    for (int b = 0; b < 12; ++b) mixer.render_block(512);
    EXPECT_EQ(registry.voice_count(), 0u);

    // Registry empty again: silence
    EXPECT_EQ(peak(mixer.render_block(512)), 0.0f);
}

TEST_F(MixerTest, ReverbLengthAndTail) {
    EXPECT_EQ(mixer.reverb().length(), static_cast<size_t>(0.2f * 44100.0f));

    registry.set_genre("ambient");
    registry.note_on(60, 100, "a");
    mixer.render_block(512);
    EXPECT_EQ(mixer.reverb().cursor(), 512u);
    EXPECT_FLOAT_EQ(mixer.reverb().wet(), GenreCatalog::instance().lookup("ambient").reverb);

    registry.all_notes_off();
    mixer.render_block(512);
    // No voices: reverb is cleared and rewound
    EXPECT_EQ(mixer.reverb().cursor(), 0u);
}

TEST_F(MixerTest, RenderIsAtomicWithRespectToControl) {
    registry.note_on(60, 100, "a");
    const auto with_voice = mixer.render_block(512);
    EXPECT_GT(peak(with_voice), 0.0f);

    registry.close();
    const auto after_close = mixer.render_block(512);
    EXPECT_EQ(peak(after_close), 0.0f);
}

TEST(MixerChunkingTest, LongerPeriodRendersInScratchSizedChunks) {
    EngineConfig small_config;
    small_config.block_size = 64;
    EngineConfig full_config;

    VoiceRegistry small_registry(GenreCatalog::instance(), small_config);
    VoiceRegistry full_registry(GenreCatalog::instance(), full_config);
    Mixer small_mixer(small_registry, small_config);
    Mixer full_mixer(full_registry, full_config);

    // Metal has no vibrato, so chunking cannot change the pitch path
    for (VoiceRegistry* registry : {&small_registry, &full_registry}) {
        registry->set_genre("metal");
        registry->note_on(60, 120, "a");
        registry->note_on(67, 90, "b");
    }

    for (int b = 0; b < 4; ++b) {
        const auto chunked = small_mixer.render_block(512);
        const auto whole = full_mixer.render_block(512);
        ASSERT_EQ(chunked.size(), whole.size());
        for (size_t i = 0; i < whole.size(); ++i) {
            ASSERT_NEAR(chunked[i], whole[i], 1e-5f) << "block " << b << " sample " << i;
        }
    }
    EXPECT_EQ(small_mixer.scratch_size(), 64u);
}
