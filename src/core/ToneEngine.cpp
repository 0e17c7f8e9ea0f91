#include "ToneEngine.hpp"
#include "ConfigStore.hpp"

namespace tonegen {

namespace {

EngineConfig sanitized(EngineConfig config) {
    ConfigStore::sanitize(config);
    return config;
}

} // namespace

ToneEngine::ToneEngine(const EngineConfig& config, const GenreCatalog& catalog)
    : config_(sanitized(config))
    , registry_(catalog, config_)
    , mixer_(registry_, config_)
{
}

ToneEngine::~ToneEngine() {
    close();
}

void ToneEngine::note_on(int note, int velocity, std::string_view instrument_id) {
    registry_.note_on(note, velocity, instrument_id);
}

void ToneEngine::note_off(int note, std::string_view instrument_id) {
    registry_.note_off(note, instrument_id);
}

void ToneEngine::all_notes_off() {
    registry_.all_notes_off();
}

void ToneEngine::set_genre(std::string_view key) {
    registry_.set_genre(key);
}

void ToneEngine::set_volume(double value) {
    registry_.set_volume(value);
}

void ToneEngine::set_expression(double level) {
    registry_.set_expression(level);
}

void ToneEngine::set_vibrato_scale(double scale) {
    registry_.set_vibrato_scale(scale);
}

std::vector<GenreInfo> ToneEngine::list_genres() const {
    return registry_.list_genres();
}

std::vector<float> ToneEngine::render_block(size_t num_samples) {
    return mixer_.render_block(num_samples);
}

void ToneEngine::render_block(std::span<float> output) {
    mixer_.render_block(output);
}

void ToneEngine::close() {
    registry_.close();
}

} // namespace tonegen
