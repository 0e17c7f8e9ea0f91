/**
 * @file VoiceRegistry.hpp
 * @brief Owns the live voices, the active genre and the master gain state.
 */

#ifndef TONEGEN_VOICE_REGISTRY_HPP
#define TONEGEN_VOICE_REGISTRY_HPP

#include "EngineConfig.hpp"
#include "GenreCatalog.hpp"
#include "TuningSystem.hpp"
#include "Voice.hpp"
#include "VoiceKey.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tonegen {

/**
 * @brief Voice map and active preset, guarded by a single mutex.
 *
 * Control calls may come from any thread. The renderer reaches the same state through
 * with_locked_state(), so a control call is either fully visible to a render pass or
 * not at all. Every operation is O(live voices) under the lock.
 */
class VoiceRegistry {
public:
    using VoiceMap = std::unordered_map<VoiceKey, std::unique_ptr<Voice>, VoiceKeyHash>;

    /**
     * @brief State shared between the control surface and the renderer.
     */
    struct State {
        VoiceMap voices;
        const GenrePreset* preset = nullptr;
        float master_volume = 1.0f;
        float expression = 1.0f;
        double vibrato_scale = 1.0;
        bool closed = false;
    };

    VoiceRegistry(const GenreCatalog& catalog, const EngineConfig& config);
    VoiceRegistry(GenreCatalog&& catalog, const EngineConfig& config) = delete;

    /**
     * @brief Start a voice on the active preset's scale.
     *
     * Note and velocity are clamped to 0..127 and 1..127. Re-triggering an identity
     * replaces the previous voice outright.
     */
    void note_on(int note, int velocity, std::string_view instrument_id);

    /**
     * @brief Release the voice at the quantized identity, if any.
     */
    void note_off(int note, std::string_view instrument_id);

    /**
     * @brief Drop every voice immediately, skipping release.
     */
    void all_notes_off();

    /**
     * @brief Switch the active preset and clear all voices.
     *
     * @return false (state unchanged) if the key is unknown.
     */
    bool set_genre(std::string_view key);

    void set_volume(double value);
    void set_expression(double level);
    void set_vibrato_scale(double scale);

    std::vector<GenreInfo> list_genres() const { return catalog_.list(); }

    std::string active_genre() const;
    std::vector<int> active_scale() const;
    size_t voice_count() const;
    float master_volume() const;
    float expression() const;
    double vibrato_scale() const;

    /**
     * @brief Quantize against the active preset (what note_on would use).
     */
    int quantize(int note) const;

    /**
     * @brief Discard all voices and refuse further control calls.
     */
    void close();
    bool is_closed() const;

    /**
     * @brief Run fn(State&) while holding the registry lock.
     */
    template<typename Fn>
    decltype(auto) with_locked_state(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(state_);
    }

    /**
     * @brief Remove every finished voice. Caller must hold the lock.
     *
     * @return Number of voices removed.
     */
    static size_t prune_finished(State& state);

    const GenreCatalog& catalog() const { return catalog_; }

private:
    VoiceSettings voice_settings(const GenrePreset& preset, int note, std::string_view instrument_id) const;

    const GenreCatalog& catalog_;
    EngineConfig config_;
    TwelveToneEqual tuning_;

    mutable std::mutex mutex_;
    State state_;
};

} // namespace tonegen

#endif // TONEGEN_VOICE_REGISTRY_HPP
