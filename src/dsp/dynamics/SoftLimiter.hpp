/**
 * @file SoftLimiter.hpp
 * @brief Master output stage: block peak limiter, gain and tanh saturation.
 */

#ifndef TONEGEN_SOFT_LIMITER_HPP
#define TONEGEN_SOFT_LIMITER_HPP

#include "Processor.hpp"
#include <algorithm>
#include <cmath>

namespace tonegen {

/**
 * @brief Graceful gain reduction followed by a bounded saturator.
 *
 * If the block peak exceeds the ceiling the whole block is scaled so the peak lands
 * on the ceiling. The output gain is applied next, then tanh guarantees |y| < 1.
 */
class SoftLimiter : public Processor {
public:
    explicit SoftLimiter(float ceiling = 0.7f)
        : ceiling_(std::clamp(ceiling, 0.01f, 1.0f))
        , gain_(1.0f)
        , last_reduction_(1.0f)
    {
    }

    void set_gain(float gain) { gain_ = std::max(0.0f, gain); }

    /**
     * @brief Gain factor applied by the limiter on the last block (1.0 = untouched).
     */
    float last_reduction() const { return last_reduction_; }

    void reset() override {
        last_reduction_ = 1.0f;
    }

protected:
    void do_pull(std::span<float> output) override {
        float peak = 0.0f;
        for (float sample : output) {
            peak = std::max(peak, std::abs(sample));
        }

        last_reduction_ = (peak > ceiling_) ? ceiling_ / peak : 1.0f;
        const float gain = last_reduction_ * gain_;

        for (auto& sample : output) {
            sample = std::tanh(sample * gain);
        }
    }

private:
    float ceiling_;
    float gain_;
    float last_reduction_;
};

} // namespace tonegen

#endif // TONEGEN_SOFT_LIMITER_HPP
