/**
 * @file PhaseOscillator.hpp
 * @brief Normalized phase accumulator shared by every voice waveform.
 */

#ifndef TONEGEN_PHASE_OSCILLATOR_HPP
#define TONEGEN_PHASE_OSCILLATOR_HPP

#include <cmath>

namespace tonegen {

/**
 * @brief Phase accumulator running in [0, 1).
 *
 * The frequency is held constant until the next set_frequency() call, which lets a
 * voice apply block-rate modulation (vibrato) without per-sample pitch jitter.
 */
class PhaseOscillator {
public:
    explicit PhaseOscillator(int sample_rate)
        : sample_rate_(sample_rate)
        , frequency_(0.0)
        , increment_(0.0)
        , phase_(0.0)
    {
    }

    /**
     * @brief Set frequency (instant change, phase is preserved).
     */
    void set_frequency(double freq) {
        frequency_ = freq;
        increment_ = (sample_rate_ > 0) ? freq / sample_rate_ : 0.0;
    }

    double frequency() const { return frequency_; }
    double phase_increment() const { return increment_; }
    double phase() const { return phase_; }

    /**
     * @brief Advance by one sample and return the new phase.
     */
    double advance() {
        phase_ += increment_;

        // Wrap phase to [0.0, 1.0)
        if (phase_ >= 1.0) {
            phase_ -= 1.0;
            if (phase_ >= 1.0) {
                // Frequencies at or above the sample rate step more than one cycle.
                phase_ -= std::floor(phase_);
            }
        }
        if (phase_ < 0.0 || phase_ >= 1.0) {
            phase_ = 0.0;
        }
        return phase_;
    }

    void reset() {
        phase_ = 0.0;
    }

private:
    int sample_rate_;
    double frequency_;
    double increment_;
    double phase_;
};

} // namespace tonegen

#endif // TONEGEN_PHASE_OSCILLATOR_HPP
