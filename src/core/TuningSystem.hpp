/**
 * @file TuningSystem.hpp
 * @brief Note-to-frequency conversion and scale quantization.
 */

#ifndef TONEGEN_TUNING_SYSTEM_HPP
#define TONEGEN_TUNING_SYSTEM_HPP

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <span>

namespace tonegen {

inline constexpr int kMinNote = 0;
inline constexpr int kMaxNote = 127;
inline constexpr int kMinVelocity = 1;
inline constexpr int kMaxVelocity = 127;

/**
 * @brief Base class for musical tuning systems.
 */
class TuningSystem {
public:
    virtual ~TuningSystem() = default;
    virtual double get_frequency(int midi_note) const = 0;
};

/**
 * @brief Standard 12-tone equal temperament tuning.
 */
class TwelveToneEqual : public TuningSystem {
public:
    TwelveToneEqual(double reference_hz = 440.0, int reference_note = 69) // A4 = 69
        : reference_hz_(reference_hz)
        , reference_note_(reference_note)
    {}

    double get_frequency(int midi_note) const override {
        // f = f_ref * 2^((n - n_ref) / 12)
        return reference_hz_ * std::pow(2.0, static_cast<double>(midi_note - reference_note_) / 12.0);
    }

private:
    double reference_hz_;
    int reference_note_;
};

inline int clamp_note(int note) {
    return std::clamp(note, kMinNote, kMaxNote);
}

inline int clamp_velocity(int velocity) {
    return std::clamp(velocity, kMinVelocity, kMaxVelocity);
}

/**
 * @brief Snap a note to the nearest pitch class of a scale, within its own octave.
 *
 * Distance is measured inside the octave (no wrap-around). Ties go to the entry that
 * appears first in the scale. A result above note 127 drops one octave, which keeps
 * the pitch class in the scale.
 *
 * @param note MIDI note, clamped to 0..127 first.
 * @param scale Pitch-class offsets 0..11; must be non-empty.
 */
inline int quantize_to_scale(int note, std::span<const int> scale) {
    note = clamp_note(note);
    if (scale.empty()) {
        return note;
    }

    const int octave = note / 12;
    const int pitch_class = note % 12;

    int closest = scale.front();
    for (int step : scale) {
        if (std::abs(step - pitch_class) < std::abs(closest - pitch_class)) {
            closest = step;
        }
    }

    int quantized = octave * 12 + closest;
    if (quantized > kMaxNote) {
        quantized -= 12;
    }
    return quantized;
}

} // namespace tonegen

#endif // TONEGEN_TUNING_SYSTEM_HPP
