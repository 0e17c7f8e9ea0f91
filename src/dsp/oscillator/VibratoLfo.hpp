/**
 * @file VibratoLfo.hpp
 * @brief Block-rate sinusoidal pitch LFO.
 */

#ifndef TONEGEN_VIBRATO_LFO_HPP
#define TONEGEN_VIBRATO_LFO_HPP

#include <cmath>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace tonegen {

/**
 * @brief Slow sine LFO evaluated once per block from the voice age.
 *
 * Depth is a fractional frequency deviation: 0.015 swings the pitch by +/-1.5%.
 * The LFO stays silent until the voice is older than the warm-up so attack
 * transients are not smeared.
 */
class VibratoLfo {
public:
    VibratoLfo(double rate_hz, double depth, double warmup_seconds)
        : rate_(rate_hz)
        , depth_(depth)
        , warmup_(warmup_seconds)
    {
    }

    bool enabled() const { return rate_ > 0.0 && depth_ > 0.0; }

    /**
     * @brief Frequency multiplier for a block starting at the given voice age.
     *
     * @param age Voice age in seconds.
     * @param depth_scale External depth multiplier (sensor-driven intensity).
     * @return Exactly 1.0 when the LFO is disabled or still warming up.
     */
    double frequency_ratio(double age, double depth_scale) const {
        if (!enabled() || age <= warmup_) {
            return 1.0;
        }
        return 1.0 + std::sin(2.0 * M_PI * rate_ * age) * depth_ * depth_scale;
    }

private:
    double rate_;
    double depth_;
    double warmup_;
};

} // namespace tonegen

#endif // TONEGEN_VIBRATO_LFO_HPP
