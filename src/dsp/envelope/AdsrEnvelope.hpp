/**
 * @file AdsrEnvelope.hpp
 * @brief Stateless ADSR (Attack, Decay, Sustain, Release) envelope.
 *
 * The level is a pure function of the note's age and release state, so a voice can
 * evaluate it at any sample position without carrying envelope state of its own.
 */

#ifndef TONEGEN_ADSR_ENVELOPE_HPP
#define TONEGEN_ADSR_ENVELOPE_HPP

#include <algorithm>

namespace tonegen {

/**
 * @brief Envelope shape. Durations in seconds, sustain is a level.
 */
struct AdsrSpec {
    double attack = 0.01;
    double decay = 0.1;
    double sustain = 0.7;
    double release = 0.2;

    bool is_valid() const {
        return attack >= 0.0 && decay >= 0.0 && release >= 0.0 &&
               sustain >= 0.0 && sustain <= 1.0;
    }
};

/**
 * @brief ADSR stages.
 */
enum class EnvelopeStage {
    Attack,
    Decay,
    Sustain,
    Release,
    Idle
};

inline EnvelopeStage envelope_stage(const AdsrSpec& spec, double age, bool released, double release_age) {
    if (released) {
        return release_age < spec.release ? EnvelopeStage::Release : EnvelopeStage::Idle;
    }
    if (age < spec.attack) return EnvelopeStage::Attack;
    if (age < spec.attack + spec.decay) return EnvelopeStage::Decay;
    return EnvelopeStage::Sustain;
}

/**
 * @brief Amplitude multiplier for a note.
 *
 * Linear ramps for A, D and R. A zero-length stage completes instantly: attack 0
 * starts at full level, decay 0 jumps to sustain, release 0 drops to silence.
 * Release always ramps down from the sustain level.
 *
 * @param spec Envelope shape.
 * @param age Seconds since note-on.
 * @param released True once note-off has been received.
 * @param release_age Seconds since note-off.
 * @return Level in [0, 1].
 */
inline double envelope_value(const AdsrSpec& spec, double age, bool released, double release_age) {
    switch (envelope_stage(spec, age, released, release_age)) {
        case EnvelopeStage::Attack:
            return age / spec.attack;

        case EnvelopeStage::Decay: {
            const double progress = (age - spec.attack) / spec.decay;
            return 1.0 - (1.0 - spec.sustain) * progress;
        }

        case EnvelopeStage::Sustain:
            return spec.sustain;

        case EnvelopeStage::Release:
            return std::max(0.0, spec.sustain * (1.0 - release_age / spec.release));

        case EnvelopeStage::Idle:
            return 0.0;
    }
    return 0.0;
}

} // namespace tonegen

#endif // TONEGEN_ADSR_ENVELOPE_HPP
