/**
 * @file VoiceRegistry.cpp
 * @brief Voice lifecycle: creation, release, genre switches and pruning.
 */

#include "VoiceRegistry.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace tonegen {

VoiceRegistry::VoiceRegistry(const GenreCatalog& catalog, const EngineConfig& config)
    : catalog_(catalog)
    , config_(config)
{
    state_.preset = catalog_.find(config_.default_genre);
    if (state_.preset == nullptr) {
        AudioLogger::instance().log_message("UnknownGenre", config_.default_genre.c_str());
        state_.preset = &catalog_.front();
    }
    state_.master_volume = std::clamp(config_.master_volume, 0.0f, 2.0f);
}

VoiceSettings VoiceRegistry::voice_settings(const GenrePreset& preset, int note,
                                            std::string_view instrument_id) const {
    VoiceSettings settings;
    settings.headroom = config_.headroom;
    settings.smoothing = config_.smoothing;
    settings.vibrato_warmup = config_.vibrato_warmup;

    switch (config_.synthesis) {
        case SynthesisOverride::Preset: settings.synthesis = preset.synthesis; break;
        case SynthesisOverride::Additive: settings.synthesis = SynthesisMode::Additive; break;
        case SynthesisOverride::Waveform: settings.synthesis = SynthesisMode::Waveform; break;
    }

    if (config_.waveform_mode == WaveformMode::Global) {
        settings.waveform = config_.global_waveform;
    } else {
        // Deterministic: same instrument and note always get the same shape.
        const uint32_t index = fnv1a32(instrument_id) + static_cast<uint32_t>(note);
        settings.waveform = preset.waveforms[index % preset.waveforms.size()];
    }
    return settings;
}

void VoiceRegistry::note_on(int note, int velocity, std::string_view instrument_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closed) return;

    const GenrePreset& preset = *state_.preset;
    const int quantized = quantize_to_scale(note, preset.scale);
    const double freq = tuning_.get_frequency(quantized);
    const float vel = static_cast<float>(clamp_velocity(velocity)) / static_cast<float>(kMaxVelocity);

    auto voice = std::make_unique<Voice>(preset, freq, vel, config_.sample_rate,
                                         voice_settings(preset, quantized, instrument_id));
    voice->set_vibrato_scale(state_.vibrato_scale);

    state_.voices.insert_or_assign(VoiceKey{std::string(instrument_id), quantized}, std::move(voice));
}

void VoiceRegistry::note_off(int note, std::string_view instrument_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closed) return;

    const int quantized = quantize_to_scale(note, state_.preset->scale);
    auto it = state_.voices.find(VoiceKey{std::string(instrument_id), quantized});
    if (it != state_.voices.end()) {
        it->second->note_off();
    }
}

void VoiceRegistry::all_notes_off() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.voices.empty()) {
        AudioLogger::instance().log_event("AllNotesOff", static_cast<float>(state_.voices.size()));
    }
    state_.voices.clear();
}

bool VoiceRegistry::set_genre(std::string_view key) {
    const GenrePreset* preset = catalog_.find(key);
    if (preset == nullptr) {
        AudioLogger::instance().log_message("UnknownGenre", std::string(key).c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closed) return false;

    // Voices are shaped by their own preset; switching cuts them instead of reinterpreting.
    state_.preset = preset;
    state_.voices.clear();
    AudioLogger::instance().log_message("Genre", preset->key.c_str());
    return true;
}

void VoiceRegistry::set_volume(double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.master_volume = static_cast<float>(std::clamp(value, 0.0, 2.0));
}

void VoiceRegistry::set_expression(double level) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.expression = static_cast<float>(std::clamp(level, 0.0, 1.0));
}

void VoiceRegistry::set_vibrato_scale(double scale) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.vibrato_scale = std::clamp(scale, 0.0, 2.0);
    for (auto& [key, voice] : state_.voices) {
        voice->set_vibrato_scale(state_.vibrato_scale);
    }
}

std::string VoiceRegistry::active_genre() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.preset->key;
}

std::vector<int> VoiceRegistry::active_scale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.preset->scale;
}

size_t VoiceRegistry::voice_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.voices.size();
}

float VoiceRegistry::master_volume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.master_volume;
}

float VoiceRegistry::expression() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.expression;
}

double VoiceRegistry::vibrato_scale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.vibrato_scale;
}

int VoiceRegistry::quantize(int note) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quantize_to_scale(note, state_.preset->scale);
}

void VoiceRegistry::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.closed) return;
    state_.closed = true;
    state_.voices.clear();
    AudioLogger::instance().log_message("Close", "Registry closed");
}

bool VoiceRegistry::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.closed;
}

size_t VoiceRegistry::prune_finished(State& state) {
    return std::erase_if(state.voices, [](const auto& entry) {
        return entry.second->is_finished();
    });
}

} // namespace tonegen
