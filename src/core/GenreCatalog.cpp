/**
 * @file GenreCatalog.cpp
 * @brief Built-in genre presets and catalog lookup.
 */

#include "GenreCatalog.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace tonegen {

using json = nlohmann::json;

std::string_view to_string(SynthesisMode mode) {
    switch (mode) {
        case SynthesisMode::Additive: return "additive";
        case SynthesisMode::Waveform: return "waveform";
    }
    return "additive";
}

namespace {

std::vector<GenrePreset> builtin_presets() {
    std::vector<GenrePreset> presets;

    presets.push_back(GenrePreset{
        "jazz", "Jazz", "Smooth, warm tones with rich harmonics",
        {0, 2, 3, 5, 7, 9, 10}, // Minor blues
        {Waveform::Sine, Waveform::Triangle},
        {1.0f, 0.3f, 0.2f, 0.15f, 0.1f},
        AdsrSpec{0.02, 0.15, 0.6, 0.3},
        0.4f, 5.5, 0.015, 0.7f,
        SynthesisMode::Additive});

    presets.push_back(GenrePreset{
        "rock", "Rock & Roll", "Punchy, energetic tones with sustain",
        {0, 2, 4, 5, 7, 9, 11},
        {Waveform::Square, Waveform::Sawtooth},
        {1.0f, 0.6f, 0.4f, 0.3f, 0.2f, 0.15f},
        AdsrSpec{0.005, 0.08, 0.8, 0.15},
        0.3f, 6.0, 0.02, 0.8f,
        SynthesisMode::Waveform});

    presets.push_back(GenrePreset{
        "metal", "Heavy Metal", "Aggressive, distorted tones with heavy sustain",
        {0, 2, 3, 5, 7, 8, 10}, // Natural minor
        {Waveform::Square, Waveform::Pulse},
        {1.0f, 0.8f, 0.7f, 0.6f, 0.5f, 0.4f, 0.3f},
        AdsrSpec{0.001, 0.05, 0.9, 0.1},
        0.5f, 0.0, 0.0, 0.95f,
        SynthesisMode::Waveform});

    presets.push_back(GenrePreset{
        "classical", "Classical", "Pure, elegant tones with natural decay",
        {0, 2, 4, 5, 7, 9, 11}, // Major
        {Waveform::Sine, Waveform::Triangle},
        {1.0f, 0.4f, 0.25f, 0.15f, 0.1f, 0.05f},
        AdsrSpec{0.05, 0.2, 0.5, 0.4},
        0.6f, 4.5, 0.012, 0.75f,
        SynthesisMode::Additive});

    presets.push_back(GenrePreset{
        "electronic", "Electronic", "Synthetic, digital tones with character",
        {0, 2, 4, 7, 9}, // Major pentatonic
        {Waveform::Square, Waveform::Sawtooth, Waveform::Pulse},
        {1.0f, 0.5f, 0.6f, 0.4f, 0.3f, 0.25f, 0.2f},
        AdsrSpec{0.001, 0.12, 0.7, 0.25},
        0.45f, 7.0, 0.025, 0.85f,
        SynthesisMode::Waveform});

    presets.push_back(GenrePreset{
        "ambient", "Ambient", "Ethereal, atmospheric soundscapes",
        {0, 2, 4, 7, 9, 11}, // Major 6th
        {Waveform::Sine, Waveform::Triangle},
        {1.0f, 0.25f, 0.2f, 0.15f, 0.1f, 0.08f, 0.05f},
        AdsrSpec{0.3, 0.4, 0.4, 0.8},
        0.8f, 3.0, 0.01, 0.6f,
        SynthesisMode::Additive});

    return presets;
}

} // namespace

void to_json(json& j, const GenrePreset& preset) {
    std::vector<std::string> waves;
    for (Waveform wave : preset.waveforms) {
        waves.emplace_back(to_string(wave));
    }
    j = json{
        {"key", preset.key},
        {"name", preset.name},
        {"description", preset.description},
        {"scale", preset.scale},
        {"waveforms", waves},
        {"harmonics", preset.harmonics},
        {"envelope", {
            {"attack", preset.envelope.attack},
            {"decay", preset.envelope.decay},
            {"sustain", preset.envelope.sustain},
            {"release", preset.envelope.release}
        }},
        {"reverb", preset.reverb},
        {"vibrato_rate", preset.vibrato_rate},
        {"vibrato_depth", preset.vibrato_depth},
        {"filter_cutoff", preset.filter_cutoff},
        {"synthesis", std::string(to_string(preset.synthesis))}
    };
}

const GenreCatalog& GenreCatalog::instance() {
    static const GenreCatalog catalog(builtin_presets());
    return catalog;
}

GenreCatalog::GenreCatalog(std::vector<GenrePreset> presets)
    : presets_(std::move(presets))
{
    if (presets_.empty()) {
        throw std::invalid_argument("Genre catalog cannot be empty");
    }
    for (size_t i = 0; i < presets_.size(); ++i) {
        validate(presets_[i]);
        for (size_t j = 0; j < i; ++j) {
            if (presets_[j].key == presets_[i].key) {
                throw std::invalid_argument("Duplicate genre key: " + presets_[i].key);
            }
        }
    }
}

void GenreCatalog::validate(const GenrePreset& preset) {
    if (preset.key.empty()) {
        throw std::invalid_argument("Genre key cannot be empty");
    }
    if (preset.scale.empty()) {
        throw std::invalid_argument("Genre '" + preset.key + "' has an empty scale");
    }
    for (int step : preset.scale) {
        if (step < 0 || step > 11) {
            throw std::invalid_argument("Genre '" + preset.key + "' has a pitch class outside 0..11");
        }
    }
    if (preset.harmonics.empty()) {
        throw std::invalid_argument("Genre '" + preset.key + "' has no fundamental");
    }
    if (preset.waveforms.empty()) {
        throw std::invalid_argument("Genre '" + preset.key + "' has no waveforms");
    }
    if (!preset.envelope.is_valid()) {
        throw std::invalid_argument("Genre '" + preset.key + "' has an invalid envelope");
    }
    if (preset.vibrato_rate < 0.0 || preset.vibrato_depth < 0.0) {
        throw std::invalid_argument("Genre '" + preset.key + "' has negative vibrato");
    }
}

const GenrePreset* GenreCatalog::find(std::string_view key) const {
    auto it = std::find_if(presets_.begin(), presets_.end(),
                           [key](const GenrePreset& p) { return p.key == key; });
    return (it != presets_.end()) ? &*it : nullptr;
}

const GenrePreset& GenreCatalog::lookup(std::string_view key) const {
    if (const GenrePreset* preset = find(key)) {
        return *preset;
    }
    throw UnknownGenre(std::string(key));
}

std::vector<GenreInfo> GenreCatalog::list() const {
    std::vector<GenreInfo> result;
    result.reserve(presets_.size());
    for (const auto& preset : presets_) {
        result.push_back(GenreInfo{preset.key, preset.name, preset.description});
    }
    return result;
}

std::string GenreCatalog::to_json_string(int indent) const {
    json j = json::array();
    for (const auto& preset : presets_) {
        j.push_back(preset);
    }
    return j.dump(indent);
}

} // namespace tonegen
