/**
 * @file Mixer.cpp
 * @brief Implementation of the Mixer render pass.
 */

#include "Mixer.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tonegen {

Mixer::Mixer(VoiceRegistry& registry, const EngineConfig& config)
    : registry_(registry)
    , sample_rate_(config.sample_rate)
    , reverb_(config.sample_rate, config.reverb_seconds)
    , limiter_(config.limiter_ceiling)
    , last_pruned_(0)
{
    reverb_.set_feedback(config.reverb_feedback);
    voice_buffer_.assign(static_cast<size_t>(std::max(config.block_size, 1)), 0.0f);

    const auto budget = std::chrono::nanoseconds(
        static_cast<int64_t>(1e9 * config.block_size / config.sample_rate));
    profiler_.set_budget(budget);
}

std::vector<float> Mixer::render_block(size_t num_samples) {
    std::vector<float> block(num_samples, 0.0f);
    pull(block);
    return block;
}

void Mixer::reset() {
    reverb_.reset();
    limiter_.reset();
}

void Mixer::do_pull(std::span<float> output) {
    std::fill(output.begin(), output.end(), 0.0f);
    if (output.empty()) return;

    registry_.with_locked_state([&](VoiceRegistry::State& state) {
        last_pruned_ = 0;
        if (state.closed || state.voices.empty()) {
            // Silence, and no stale reflections when the next note starts.
            reverb_.reset();
            return;
        }

        // 1. Sum voices, in chunks of the scratch size when the caller asks for more
        for (auto& [key, voice] : state.voices) {
            for (size_t offset = 0; offset < output.size(); offset += voice_buffer_.size()) {
                const size_t n = std::min(voice_buffer_.size(), output.size() - offset);
                std::span<float> voice_span(voice_buffer_.data(), n);
                voice->pull(voice_span);
                for (size_t i = 0; i < n; ++i) {
                    output[offset + i] += voice_span[i];
                }
            }
        }

        // 2. Reverb
        reverb_.set_wet(state.preset->reverb);
        reverb_.pull(output);

        // 3. Limiter, master gain, saturation
        limiter_.set_gain(state.master_volume * state.expression);
        limiter_.pull(output);

        // 4. Prune
        last_pruned_ = VoiceRegistry::prune_finished(state);
    });
}

} // namespace tonegen
