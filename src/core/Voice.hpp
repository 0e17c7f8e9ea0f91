/**
 * @file Voice.hpp
 * @brief One sounding note: oscillator, envelope, vibrato and declick filter.
 */

#ifndef TONEGEN_VOICE_HPP
#define TONEGEN_VOICE_HPP

#include "Processor.hpp"
#include "GenreCatalog.hpp"
#include "oscillator/PhaseOscillator.hpp"
#include "oscillator/VibratoLfo.hpp"
#include "filter/OnePoleFilter.hpp"
#include <span>
#include <vector>

namespace tonegen {

/**
 * @brief Per-voice render settings fixed at note-on.
 */
struct VoiceSettings {
    SynthesisMode synthesis = SynthesisMode::Additive;
    Waveform waveform = Waveform::Sine;
    float headroom = 0.9f;
    float smoothing = 0.9f;
    double vibrato_warmup = 0.2;
};

/**
 * @brief A single synth voice bound to the preset that was active at its note-on.
 *
 * Every pull() advances phase, age and filter memory, so rendering the same block
 * twice yields different audio.
 */
class Voice : public Processor {
public:
    /**
     * @param preset Preset owned by a GenreCatalog that outlives the voice.
     * @param frequency Base frequency in Hz.
     * @param velocity Normalized velocity 0..1.
     */
    Voice(const GenrePreset& preset, double frequency, float velocity,
          int sample_rate, const VoiceSettings& settings);

    /**
     * @brief Render numSamples into a new buffer. Same side effects as pull().
     */
    std::vector<float> generate(size_t num_samples);

    void note_off();

    /**
     * @brief True once released and the preset's release time has elapsed.
     */
    bool is_finished() const;

    /**
     * @brief Rewind to the note-on state (age 0, phase 0, filter cleared, not released).
     */
    void reset() override;

    /**
     * @brief External vibrato depth multiplier, applied from the next block on.
     */
    void set_vibrato_scale(double scale) { vibrato_scale_ = scale; }

    const GenrePreset& preset() const { return *preset_; }
    double base_frequency() const { return base_frequency_; }
    double effective_frequency() const { return oscillator_.frequency(); }
    double phase() const { return oscillator_.phase(); }
    double phase_increment() const { return oscillator_.phase_increment(); }
    float velocity() const { return velocity_; }
    double age() const { return age_; }
    bool released() const { return released_; }
    double release_age() const { return release_age_; }
    float last_output() const { return smoother_.last_output(); }
    const VoiceSettings& settings() const { return settings_; }

protected:
    void do_pull(std::span<float> output) override;

private:
    double raw_sample(double phase) const;

    const GenrePreset* preset_;
    VoiceSettings settings_;
    double base_frequency_;
    float velocity_;
    int sample_rate_;

    PhaseOscillator oscillator_;
    VibratoLfo vibrato_;
    OnePoleFilter smoother_;
    double vibrato_scale_;

    double age_;
    bool released_;
    double release_age_;
};

} // namespace tonegen

#endif // TONEGEN_VOICE_HPP
