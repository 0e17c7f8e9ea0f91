/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef TONEGEN_HAL_ALSA_DRIVER_HPP
#define TONEGEN_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tonegen::hal {

/**
 * @brief ALSA playback driver.
 *
 * The engine renders mono; on multi-channel hardware the block is duplicated to
 * every channel while interleaving.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels.
     * @param device ALSA device name.
     */
    AlsaDriver(int sample_rate = 44100, int block_size = 512, int num_channels = 2,
               const std::string& device = "default");
    ~AlsaDriver() override;

    bool start() override;
    void stop() override;
    void set_callback(AudioCallback callback) override;
    bool is_running() const override { return running_; }
    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const { return num_channels_; }

private:
    void thread_loop();
    bool setup_pcm();
    void close_pcm();
    void recover_pcm(int err);
    void write_interleaved();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    bool use_s32_;

    std::mutex callback_mutex_;
    AudioCallback callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;

    std::vector<float> mono_buffer_;
    std::vector<int32_t> s32_buffer_;
    std::vector<int16_t> s16_buffer_;
};

} // namespace tonegen::hal

#endif // TONEGEN_HAL_ALSA_DRIVER_HPP
