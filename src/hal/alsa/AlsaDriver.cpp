/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include "AudioSettings.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <pthread.h>

namespace tonegen::hal {

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, const std::string& device)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , use_s32_(true)
    , running_(false)
{
    // Buffers are sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!setup_pcm()) {
        close_pcm();
        AudioLogger::instance().log_message("ALSA", "Device unavailable");
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);
    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;
    snd_pcm_hw_params_t* hw_params = nullptr;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    if ((err = snd_pcm_hw_params_malloc(&hw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    auto fail = [&](const char* what) {
        std::cerr << "ALSA: " << what << " (" << snd_strerror(err) << ")" << std::endl;
        snd_pcm_hw_params_free(hw_params);
        return false;
    };

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot initialize hardware parameter structure");
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        return fail("Cannot set access type");
    }

    use_s32_ = true;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S32_LE)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        use_s32_ = false;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) {
            return fail("Cannot set sample format");
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, nullptr)) < 0) {
        return fail("Cannot set sample rate");
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params, &channels)) < 0) {
        return fail("Cannot set channel count");
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, nullptr)) < 0) {
        return fail("Cannot set period size");
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, nullptr);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        return fail("Cannot set parameters");
    }
    snd_pcm_hw_params_free(hw_params);

    auto& settings = AudioSettings::instance();
    settings.sample_rate = sample_rate_;
    settings.block_size = block_size_;
    settings.num_channels = num_channels_;

    const size_t interleaved = static_cast<size_t>(block_size_) * static_cast<size_t>(num_channels_);
    mono_buffer_.assign(static_cast<size_t>(block_size_), 0.0f);
    s32_buffer_.assign(use_s32_ ? interleaved : 0, 0);
    s16_buffer_.assign(use_s32_ ? 0 : interleaved, 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    return true;
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        AudioLogger::instance().log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    while (running_) {
        // Silence first so a missing callback never replays stale data
        std::fill(mono_buffer_.begin(), mono_buffer_.end(), 0.0f);

        const auto start_time = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(std::span<float>(mono_buffer_));
            }
        }
        const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        AudioLogger::instance().log_event("PROC_US", static_cast<float>(duration));

        write_interleaved();
    }
}

void AlsaDriver::write_interleaved() {
    const size_t channels = static_cast<size_t>(num_channels_);
    for (size_t i = 0; i < mono_buffer_.size(); ++i) {
        const float sample = std::clamp(mono_buffer_[i], -1.0f, 1.0f);
        for (size_t ch = 0; ch < channels; ++ch) {
            if (use_s32_) {
                s32_buffer_[i * channels + ch] = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
            } else {
                s16_buffer_[i * channels + ch] = static_cast<int16_t>(sample * 32767.0f);
            }
        }
    }

    const void* data = use_s32_ ? static_cast<const void*>(s32_buffer_.data())
                                : static_cast<const void*>(s16_buffer_.data());
    snd_pcm_sframes_t err = snd_pcm_writei(pcm_handle_, data, static_cast<snd_pcm_uframes_t>(block_size_));
    if (err < 0) {
        recover_pcm(static_cast<int>(err));
    }
}

void AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        AudioLogger::instance().log_message("ALSA", "Underrun");
        snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            snd_pcm_prepare(pcm_handle_);
        }
    }
}

} // namespace tonegen::hal
