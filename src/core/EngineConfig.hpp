/**
 * @file EngineConfig.hpp
 * @brief Tunables for the voice engine and its output stage.
 */

#ifndef TONEGEN_ENGINE_CONFIG_HPP
#define TONEGEN_ENGINE_CONFIG_HPP

#include "oscillator/Waveform.hpp"
#include <string>

namespace tonegen {

/**
 * @brief Where each voice gets its waveform from.
 */
enum class WaveformMode {
    PerVoice, // Deterministic pick from the voice's own preset
    Global    // Every voice uses EngineConfig::global_waveform
};

/**
 * @brief Overrides the synthesis mode the presets ask for.
 */
enum class SynthesisOverride {
    Preset,
    Additive,
    Waveform
};

struct EngineConfig {
    int sample_rate = 44100;
    int block_size = 512;
    std::string default_genre = "jazz";
    float master_volume = 1.0f;

    float smoothing = 0.9f;        // One-pole coefficient
    float headroom = 0.9f;         // Per-voice gain ahead of the mix
    float limiter_ceiling = 0.7f;
    float reverb_seconds = 0.2f;
    float reverb_feedback = 0.3f;
    double vibrato_warmup = 0.2;   // Seconds of voice age before vibrato starts

    WaveformMode waveform_mode = WaveformMode::PerVoice;
    Waveform global_waveform = Waveform::Sine;
    SynthesisOverride synthesis = SynthesisOverride::Preset;

    std::string device = "default"; // ALSA playback device
};

} // namespace tonegen

#endif // TONEGEN_ENGINE_CONFIG_HPP
