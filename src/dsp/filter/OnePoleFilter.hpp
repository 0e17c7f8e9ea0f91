/**
 * @file OnePoleFilter.hpp
 * @brief One-pole low-pass smoother with memory carried across blocks.
 */

#ifndef TONEGEN_ONE_POLE_FILTER_HPP
#define TONEGEN_ONE_POLE_FILTER_HPP

#include <algorithm>
#include <span>

namespace tonegen {

/**
 * @brief y[n] = a * y[n-1] + (1 - a) * x[n]
 *
 * Larger coefficients smooth harder. The last output persists between process()
 * calls so consecutive blocks join without a discontinuity.
 */
class OnePoleFilter {
public:
    explicit OnePoleFilter(float coefficient = 0.9f)
        : coefficient_(std::clamp(coefficient, 0.0f, 0.999f))
        , last_output_(0.0f)
    {
    }

    float last_output() const { return last_output_; }

    float process_sample(float input) {
        last_output_ = coefficient_ * last_output_ + (1.0f - coefficient_) * input;
        return last_output_;
    }

    void process(std::span<float> block) {
        for (auto& sample : block) {
            sample = process_sample(sample);
        }
    }

    void reset() {
        last_output_ = 0.0f;
    }

private:
    float coefficient_;
    float last_output_;
};

} // namespace tonegen

#endif // TONEGEN_ONE_POLE_FILTER_HPP
