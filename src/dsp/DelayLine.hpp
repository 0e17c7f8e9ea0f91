/**
 * @file DelayLine.hpp
 * @brief Fixed-length circular delay used as the master reverb.
 */

#ifndef TONEGEN_DELAY_LINE_HPP
#define TONEGEN_DELAY_LINE_HPP

#include "Processor.hpp"
#include <vector>
#include <algorithm>

namespace tonegen {

/**
 * @brief Mono delay line with a single read/write cursor.
 *
 * Each sample reads the reflection stored one buffer length ago, adds it to the dry
 * signal scaled by the wet amount, and stores the dry sample scaled by the feedback
 * coefficient in its place. No diffusion network.
 */
class DelayLine : public Processor {
public:
    /**
     * @param sample_rate Sample rate in Hz.
     * @param delay_seconds Buffer length in seconds.
     */
    explicit DelayLine(int sample_rate, float delay_seconds = 0.2f)
        : wet_(0.0f)
        , feedback_(0.3f)
        , cursor_(0)
        , dirty_(false)
    {
        size_t size = static_cast<size_t>(static_cast<float>(sample_rate) * delay_seconds);
        buffer_.assign(std::max<size_t>(size, 1), 0.0f);
    }

    void set_wet(float wet) {
        wet_ = std::clamp(wet, 0.0f, 1.0f);
    }

    void set_feedback(float feedback) {
        feedback_ = std::clamp(feedback, 0.0f, 0.99f);
    }

    float wet() const { return wet_; }
    float feedback() const { return feedback_; }
    size_t length() const { return buffer_.size(); }
    size_t cursor() const { return cursor_; }

    /**
     * @brief Process a single sample through the delay line.
     *
     * @param input Dry sample.
     * @return Dry sample plus the wet reflection.
     */
    float process_sample(float input) {
        const float delayed = buffer_[cursor_];
        buffer_[cursor_] = input * feedback_;
        cursor_ = (cursor_ + 1) % buffer_.size();
        dirty_ = true;
        return input + delayed * wet_;
    }

    /**
     * @brief Clear the stored reflections if anything was written since the last clear.
     */
    void reset() override {
        if (dirty_) {
            std::fill(buffer_.begin(), buffer_.end(), 0.0f);
            dirty_ = false;
        }
        cursor_ = 0;
    }

protected:
    void do_pull(std::span<float> output) override {
        for (auto& sample : output) {
            sample = process_sample(sample);
        }
    }

private:
    float wet_;
    float feedback_;
    std::vector<float> buffer_;
    size_t cursor_;
    bool dirty_;
};

} // namespace tonegen

#endif // TONEGEN_DELAY_LINE_HPP
