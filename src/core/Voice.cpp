/**
 * @file Voice.cpp
 * @brief Implementation of the Voice class.
 */

#include "Voice.hpp"
#include "envelope/AdsrEnvelope.hpp"
#include <algorithm>

namespace tonegen {

Voice::Voice(const GenrePreset& preset, double frequency, float velocity,
             int sample_rate, const VoiceSettings& settings)
    : preset_(&preset)
    , settings_(settings)
    , base_frequency_(frequency)
    , velocity_(std::clamp(velocity, 0.0f, 1.0f))
    , sample_rate_(sample_rate)
    , oscillator_(sample_rate)
    , vibrato_(preset.vibrato_rate, preset.vibrato_depth, settings.vibrato_warmup)
    , smoother_(settings.smoothing)
    , vibrato_scale_(1.0)
    , age_(0.0)
    , released_(false)
    , release_age_(0.0)
{
    oscillator_.set_frequency(base_frequency_);
}

std::vector<float> Voice::generate(size_t num_samples) {
    std::vector<float> block(num_samples, 0.0f);
    pull(block);
    return block;
}

void Voice::note_off() {
    released_ = true;
}

bool Voice::is_finished() const {
    return released_ && release_age_ >= preset_->envelope.release;
}

void Voice::reset() {
    oscillator_.reset();
    oscillator_.set_frequency(base_frequency_);
    smoother_.reset();
    age_ = 0.0;
    released_ = false;
    release_age_ = 0.0;
}

double Voice::raw_sample(double phase) const {
    if (settings_.synthesis == SynthesisMode::Additive) {
        return additive_sample(preset_->harmonics, phase);
    }
    return waveform_sample(settings_.waveform, phase);
}

void Voice::do_pull(std::span<float> output) {
    const double dt = 1.0 / sample_rate_;
    const AdsrSpec& envelope = preset_->envelope;

    // Vibrato is block-rate: one frequency for the whole block.
    oscillator_.set_frequency(base_frequency_ * vibrato_.frequency_ratio(age_, vibrato_scale_));

    const double gain = static_cast<double>(velocity_) * settings_.headroom;

    for (size_t i = 0; i < output.size(); ++i) {
        const double offset = static_cast<double>(i) * dt;
        const double level = envelope_value(envelope, age_ + offset, released_,
                                            released_ ? release_age_ + offset : 0.0);
        const double phase = oscillator_.advance();
        const float raw = static_cast<float>(raw_sample(phase) * level * gain);
        output[i] = smoother_.process_sample(raw);
    }

    const double block_seconds = static_cast<double>(output.size()) * dt;
    age_ += block_seconds;
    if (released_) {
        release_age_ += block_seconds;
    }
}

} // namespace tonegen
