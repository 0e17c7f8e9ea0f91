/**
 * @file AudioDriver.hpp
 * @brief Abstract playback device that pulls mono blocks from a render callback.
 *
 * Device binding lives here, outside the engine core: the core only renders blocks.
 */

#ifndef TONEGEN_AUDIO_DRIVER_HPP
#define TONEGEN_AUDIO_DRIVER_HPP

#include "Logger.hpp"
#include <functional>
#include <span>

namespace tonegen::hal {

/**
 * @brief Abstract base class for audio output drivers.
 */
class AudioDriver {
public:
    /**
     * @brief Render callback: fill one mono block.
     */
    using AudioCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and start the render thread.
     *
     * @return false if the device is unavailable; the callback is then never invoked.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the render thread and close the device. No callback runs after return.
     */
    virtual void stop() = 0;

    virtual void set_callback(AudioCallback callback) = 0;

    virtual bool is_running() const = 0;

    /**
     * @brief Sample rate in Hz (negotiated value once started).
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Frames per block (negotiated value once started).
     */
    virtual int block_size() const = 0;

    /**
     * @brief Start, and keep the device only if it settled on the given rate.
     *
     * A device negotiating another rate would shift every pitch, so it is stopped
     * again instead. Period size may differ; the mixer renders longer periods in chunks.
     *
     * @return false if the device is unavailable or runs at another rate.
     */
    bool start_at(int wanted_sample_rate) {
        if (!start()) return false;
        if (sample_rate() == wanted_sample_rate) return true;

        stop();
        AudioLogger::instance().log_event("RateMismatch", static_cast<float>(sample_rate()));
        return false;
    }
};

} // namespace tonegen::hal

#endif // TONEGEN_AUDIO_DRIVER_HPP
