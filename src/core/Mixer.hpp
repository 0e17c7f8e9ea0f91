/**
 * @file Mixer.hpp
 * @brief Fixed-cadence render stage: voice sum, reverb, limiter, master gain.
 */

#ifndef TONEGEN_MIXER_HPP
#define TONEGEN_MIXER_HPP

#include "Processor.hpp"
#include "DelayLine.hpp"
#include "dynamics/SoftLimiter.hpp"
#include "EngineConfig.hpp"
#include "VoiceRegistry.hpp"
#include <span>
#include <vector>

namespace tonegen {

/**
 * @brief Renders one block from every live voice in the registry.
 *
 * The whole pass (voice generation, effects and pruning) runs under the registry
 * lock. Output is always within [-1, 1]; with no live voices the block is silent.
 */
class Mixer : public Processor {
public:
    Mixer(VoiceRegistry& registry, const EngineConfig& config);

    /**
     * @brief Render a block of num_samples into a new buffer.
     */
    std::vector<float> render_block(size_t num_samples);

    /**
     * @brief Render in place; equivalent to pull().
     */
    void render_block(std::span<float> output) { pull(output); }

    /**
     * @brief Clear the reverb tail.
     */
    void reset() override;

    const DelayLine& reverb() const { return reverb_; }
    const SoftLimiter& limiter() const { return limiter_; }

    /**
     * @brief Voices removed by the last render pass.
     */
    size_t last_pruned() const { return last_pruned_; }

    /**
     * @brief Per-voice scratch length (the configured block size). Never grows.
     */
    size_t scratch_size() const { return voice_buffer_.size(); }

protected:
    void do_pull(std::span<float> output) override;

private:
    VoiceRegistry& registry_;
    int sample_rate_;
    DelayLine reverb_;
    SoftLimiter limiter_;
    std::vector<float> voice_buffer_;
    size_t last_pruned_;
};

} // namespace tonegen

#endif // TONEGEN_MIXER_HPP
