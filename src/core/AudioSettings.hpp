/**
 * @file AudioSettings.hpp
 * @brief Hardware-negotiated stream settings shared between driver and engine.
 */

#ifndef TONEGEN_AUDIO_SETTINGS_HPP
#define TONEGEN_AUDIO_SETTINGS_HPP

#include <atomic>

namespace tonegen {

/**
 * @brief Sample rate, period size and channel count actually granted by the device.
 *
 * Written by the driver once the stream is configured, read by the UI/demo to report
 * what the hardware accepted. The engine itself renders at its configured rate.
 */
struct AudioSettings {
    std::atomic<int> sample_rate{44100};
    std::atomic<int> block_size{512};
    std::atomic<int> num_channels{1};

    static AudioSettings& instance() {
        static AudioSettings inst;
        return inst;
    }
};

} // namespace tonegen

#endif // TONEGEN_AUDIO_SETTINGS_HPP
