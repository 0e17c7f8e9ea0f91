/**
 * @file ToneEngine.hpp
 * @brief Control surface and render entry point of the tone generator.
 */

#ifndef TONEGEN_TONE_ENGINE_HPP
#define TONEGEN_TONE_ENGINE_HPP

#include "EngineConfig.hpp"
#include "GenreCatalog.hpp"
#include "Mixer.hpp"
#include "VoiceRegistry.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tonegen {

/**
 * @brief Polyphonic genre-timbre tone generator.
 *
 * Control methods are thread-safe and never throw; render_block() is meant to be
 * called from one real-time context at the configured cadence. Device binding is
 * left to the caller (see hal::AudioDriver).
 */
class ToneEngine {
public:
    explicit ToneEngine(const EngineConfig& config = EngineConfig{},
                        const GenreCatalog& catalog = GenreCatalog::instance());
    ToneEngine(const EngineConfig& config, GenreCatalog&& catalog) = delete;
    ~ToneEngine();

    ToneEngine(const ToneEngine&) = delete;
    ToneEngine& operator=(const ToneEngine&) = delete;

    void note_on(int note, int velocity, std::string_view instrument_id);
    void note_off(int note, std::string_view instrument_id);
    void all_notes_off();
    void set_genre(std::string_view key);
    void set_volume(double value);
    void set_expression(double level);
    void set_vibrato_scale(double scale);
    std::vector<GenreInfo> list_genres() const;

    std::vector<float> render_block(size_t num_samples);
    void render_block(std::span<float> output);

    /**
     * @brief Stop rendering and discard all voices. Later calls are no-ops and
     * render_block() returns silence.
     */
    void close();
    bool is_closed() const { return registry_.is_closed(); }

    std::string active_genre() const { return registry_.active_genre(); }
    std::vector<int> active_scale() const { return registry_.active_scale(); }
    size_t voice_count() const { return registry_.voice_count(); }
    float master_volume() const { return registry_.master_volume(); }

    const EngineConfig& config() const { return config_; }
    VoiceRegistry& registry() { return registry_; }
    const Mixer& mixer() const { return mixer_; }

private:
    EngineConfig config_;
    VoiceRegistry registry_;
    Mixer mixer_;
};

} // namespace tonegen

#endif // TONEGEN_TONE_ENGINE_HPP
