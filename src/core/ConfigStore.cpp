#include "ConfigStore.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace tonegen {

namespace {

std::string to_string(WaveformMode mode) {
    return mode == WaveformMode::Global ? "global" : "per_voice";
}

WaveformMode waveform_mode_from_string(const std::string& name) {
    if (name == "per_voice") return WaveformMode::PerVoice;
    if (name == "global") return WaveformMode::Global;
    throw std::invalid_argument("unknown waveform_mode: " + name);
}

std::string to_string(SynthesisOverride mode) {
    switch (mode) {
        case SynthesisOverride::Preset: return "preset";
        case SynthesisOverride::Additive: return "additive";
        case SynthesisOverride::Waveform: return "waveform";
    }
    return "preset";
}

SynthesisOverride synthesis_from_string(const std::string& name) {
    if (name == "preset") return SynthesisOverride::Preset;
    if (name == "additive") return SynthesisOverride::Additive;
    if (name == "waveform") return SynthesisOverride::Waveform;
    throw std::invalid_argument("unknown synthesis: " + name);
}

} // namespace

void to_json(json& j, const EngineConfig& config) {
    j = json{
        {"sample_rate", config.sample_rate},
        {"block_size", config.block_size},
        {"default_genre", config.default_genre},
        {"master_volume", config.master_volume},
        {"smoothing", config.smoothing},
        {"headroom", config.headroom},
        {"limiter_ceiling", config.limiter_ceiling},
        {"reverb_seconds", config.reverb_seconds},
        {"reverb_feedback", config.reverb_feedback},
        {"vibrato_warmup", config.vibrato_warmup},
        {"waveform_mode", to_string(config.waveform_mode)},
        {"global_waveform", std::string(to_string(config.global_waveform))},
        {"synthesis", to_string(config.synthesis)},
        {"device", config.device}
    };
}

void from_json(const json& j, EngineConfig& config) {
    const EngineConfig defaults;
    config.sample_rate = j.value("sample_rate", defaults.sample_rate);
    config.block_size = j.value("block_size", defaults.block_size);
    config.default_genre = j.value("default_genre", defaults.default_genre);
    config.master_volume = j.value("master_volume", defaults.master_volume);
    config.smoothing = j.value("smoothing", defaults.smoothing);
    config.headroom = j.value("headroom", defaults.headroom);
    config.limiter_ceiling = j.value("limiter_ceiling", defaults.limiter_ceiling);
    config.reverb_seconds = j.value("reverb_seconds", defaults.reverb_seconds);
    config.reverb_feedback = j.value("reverb_feedback", defaults.reverb_feedback);
    config.vibrato_warmup = j.value("vibrato_warmup", defaults.vibrato_warmup);
    config.device = j.value("device", defaults.device);

    config.waveform_mode = waveform_mode_from_string(
        j.value("waveform_mode", to_string(defaults.waveform_mode)));
    config.synthesis = synthesis_from_string(
        j.value("synthesis", to_string(defaults.synthesis)));

    const std::string wave_name = j.value("global_waveform", std::string(to_string(defaults.global_waveform)));
    auto wave = waveform_from_string(wave_name);
    if (!wave) {
        throw std::invalid_argument("unknown global_waveform: " + wave_name);
    }
    config.global_waveform = *wave;
}

void ConfigStore::sanitize(EngineConfig& config) {
    config.sample_rate = std::clamp(config.sample_rate, 8000, 192000);
    config.block_size = std::clamp(config.block_size, 16, 8192);
    config.master_volume = std::clamp(config.master_volume, 0.0f, 2.0f);
    config.smoothing = std::clamp(config.smoothing, 0.0f, 0.999f);
    config.headroom = std::clamp(config.headroom, 0.0f, 1.0f);
    config.limiter_ceiling = std::clamp(config.limiter_ceiling, 0.01f, 1.0f);
    config.reverb_seconds = std::clamp(config.reverb_seconds, 0.001f, 2.0f);
    config.reverb_feedback = std::clamp(config.reverb_feedback, 0.0f, 0.99f);
    config.vibrato_warmup = std::max(0.0, config.vibrato_warmup);
}

std::string ConfigStore::serialize(const EngineConfig& config) {
    json j = config;
    return j.dump(4);
}

bool ConfigStore::deserialize(EngineConfig& config, const std::string& data) {
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            AudioLogger::instance().log_message("Config", "Root is not an object");
            return false;
        }
        EngineConfig parsed = j.get<EngineConfig>();
        sanitize(parsed);
        config = parsed;
        return true;
    } catch (const json::exception& e) {
        AudioLogger::instance().log_message("Config", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        AudioLogger::instance().log_message("Config", e.what());
        return false;
    }
}

bool ConfigStore::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        AudioLogger::instance().log_message("Config", "Failed to open file for writing");
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(EngineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        AudioLogger::instance().log_message("Config", "Failed to open file");
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return deserialize(config, content);
}

} // namespace tonegen
