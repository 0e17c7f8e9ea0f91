/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the tone engine.
 */

#include "tonegen/CInterface.h"
#include "ToneEngine.hpp"
#include "ConfigStore.hpp"
#include "Logger.hpp"
#include "alsa/AlsaDriver.hpp"
#include <algorithm>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <sstream>
#include <string>
#include <system_error>

namespace {

// Internal handle structure (hidden from C API)
struct EngineHandleImpl {
    std::unique_ptr<tonegen::ToneEngine> engine;
    std::unique_ptr<tonegen::hal::AudioDriver> driver;

    explicit EngineHandleImpl(const tonegen::EngineConfig& config)
        : engine(std::make_unique<tonegen::ToneEngine>(config))
    {
    }

    ~EngineHandleImpl() {
        // Teardown: no render callback may run once the engine starts closing.
        if (driver) driver->stop();
        engine->close();
    }
};

EngineHandleImpl* as_impl(ToneEngineHandle handle) {
    return static_cast<EngineHandleImpl*>(handle);
}

void copy_string(const std::string& src, char* dst, size_t dst_size) {
    if (!dst || dst_size == 0) return;
    const size_t n = std::min(src.size(), dst_size - 1);
    std::memcpy(dst, src.data(), n);
    dst[n] = '\0';
}

ToneEngineHandle create(const tonegen::EngineConfig& config) {
    try {
        return static_cast<ToneEngineHandle>(new EngineHandleImpl(config));
    } catch (const std::bad_alloc&) {
        return nullptr;
    } catch (const std::system_error&) {
        return nullptr;
    }
}

} // namespace

extern "C" {

ToneEngineHandle tonegen_engine_create(unsigned int sample_rate) {
    tonegen::EngineConfig config;
    config.sample_rate = static_cast<int>(sample_rate);
    return create(config);
}

ToneEngineHandle tonegen_engine_create_from_config(const char* config_path) {
    tonegen::EngineConfig config;
    if (config_path && !tonegen::ConfigStore::load_from_file(config, config_path)) {
        tonegen::AudioLogger::instance().log_message("Config", "Using defaults");
    }
    return create(config);
}

void tonegen_engine_destroy(ToneEngineHandle handle) {
    if (handle) delete as_impl(handle);
}

int tonegen_engine_close(ToneEngineHandle handle) {
    if (!handle) return -1;
    auto* impl = as_impl(handle);
    if (impl->driver) impl->driver->stop();
    impl->engine->close();
    return 0;
}

int tonegen_engine_note_on(ToneEngineHandle handle, int note, int velocity, const char* instrument_id) {
    if (!handle || !instrument_id) return -1;
    as_impl(handle)->engine->note_on(note, velocity, instrument_id);
    return 0;
}

int tonegen_engine_note_off(ToneEngineHandle handle, int note, const char* instrument_id) {
    if (!handle || !instrument_id) return -1;
    as_impl(handle)->engine->note_off(note, instrument_id);
    return 0;
}

int tonegen_engine_all_notes_off(ToneEngineHandle handle) {
    if (!handle) return -1;
    as_impl(handle)->engine->all_notes_off();
    return 0;
}

int tonegen_engine_set_genre(ToneEngineHandle handle, const char* key) {
    if (!handle || !key) return -1;
    // Unknown keys are ignored by the engine, not reported as failures.
    as_impl(handle)->engine->set_genre(key);
    return 0;
}

int tonegen_engine_set_volume(ToneEngineHandle handle, double value) {
    if (!handle) return -1;
    as_impl(handle)->engine->set_volume(value);
    return 0;
}

int tonegen_engine_set_expression(ToneEngineHandle handle, double level) {
    if (!handle) return -1;
    as_impl(handle)->engine->set_expression(level);
    return 0;
}

int tonegen_engine_set_vibrato_scale(ToneEngineHandle handle, double scale) {
    if (!handle) return -1;
    as_impl(handle)->engine->set_vibrato_scale(scale);
    return 0;
}

int tonegen_engine_genre_count(ToneEngineHandle handle) {
    if (!handle) return -1;
    return static_cast<int>(as_impl(handle)->engine->list_genres().size());
}

int tonegen_engine_genre_info(ToneEngineHandle handle, int index,
                              char* key, size_t key_size,
                              char* name, size_t name_size,
                              char* description, size_t description_size) {
    if (!handle || index < 0) return -1;
    const auto genres = as_impl(handle)->engine->list_genres();
    if (static_cast<size_t>(index) >= genres.size()) return -1;

    const auto& info = genres[static_cast<size_t>(index)];
    copy_string(info.key, key, key_size);
    copy_string(info.name, name, name_size);
    copy_string(info.description, description, description_size);
    return 0;
}

int tonegen_engine_active_genre(ToneEngineHandle handle, char* key, size_t key_size) {
    if (!handle || !key || key_size == 0) return -1;
    copy_string(as_impl(handle)->engine->active_genre(), key, key_size);
    return 0;
}

int tonegen_engine_voice_count(ToneEngineHandle handle) {
    if (!handle) return -1;
    return static_cast<int>(as_impl(handle)->engine->voice_count());
}

int tonegen_engine_process(ToneEngineHandle handle, float* output, size_t frames) {
    if (!handle || !output || frames == 0) return -1;
    auto* impl = as_impl(handle);
    // The device thread owns rendering while it runs.
    if (impl->driver && impl->driver->is_running()) return -1;
    impl->engine->render_block(std::span<float>(output, frames));
    return 0;
}

int tonegen_engine_start(ToneEngineHandle handle) {
    if (!handle) return -1;
    auto* impl = as_impl(handle);
    if (impl->engine->is_closed()) return -1;

    if (!impl->driver) {
        const auto& config = impl->engine->config();
        impl->driver = std::make_unique<tonegen::hal::AlsaDriver>(
            config.sample_rate, config.block_size, 2, config.device);
        impl->driver->set_callback([engine = impl->engine.get()](std::span<float> output) {
            engine->render_block(output);
        });
    }
    return impl->driver->start_at(impl->engine->config().sample_rate) ? 0 : -1;
}

int tonegen_engine_stop(ToneEngineHandle handle) {
    if (!handle) return -1;
    auto* impl = as_impl(handle);
    if (impl->driver) impl->driver->stop();
    return 0;
}

int tonegen_drain_log(char* buffer, size_t buffer_size) {
    std::ostringstream out;
    const size_t count = tonegen::AudioLogger::instance().flush(out);
    copy_string(out.str(), buffer, buffer_size);
    return static_cast<int>(count);
}

} // extern "C"
