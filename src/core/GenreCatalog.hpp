/**
 * @file GenreCatalog.hpp
 * @brief Immutable table of genre timbre presets.
 */

#ifndef TONEGEN_GENRE_CATALOG_HPP
#define TONEGEN_GENRE_CATALOG_HPP

#include "envelope/AdsrEnvelope.hpp"
#include "oscillator/Waveform.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tonegen {

/**
 * @brief How a voice turns its phase into a raw sample.
 */
enum class SynthesisMode {
    Additive,  // Sum of the preset's harmonic series
    Waveform   // One pure waveform picked from the preset's list
};

std::string_view to_string(SynthesisMode mode);

/**
 * @brief Timbre profile of one genre.
 */
struct GenrePreset {
    std::string key;
    std::string name;
    std::string description;
    std::vector<int> scale;            // Pitch-class offsets 0..11, in definition order
    std::vector<Waveform> waveforms;   // Permitted single-waveform shapes
    std::vector<float> harmonics;      // harmonics[0] is the fundamental
    AdsrSpec envelope;
    float reverb = 0.0f;               // Wet amount of the master delay
    double vibrato_rate = 0.0;         // Hz, 0 disables vibrato
    double vibrato_depth = 0.0;        // Fractional frequency deviation
    float filter_cutoff = 1.0f;        // Normalized brightness hint 0..1
    SynthesisMode synthesis = SynthesisMode::Additive;
};

/**
 * @brief Entry returned by GenreCatalog::list().
 */
struct GenreInfo {
    std::string key;
    std::string name;
    std::string description;
};

/**
 * @brief Thrown by GenreCatalog::lookup() for a key the catalog does not hold.
 */
class UnknownGenre : public std::out_of_range {
public:
    explicit UnknownGenre(const std::string& key)
        : std::out_of_range("Unknown genre: " + key)
        , key_(key)
    {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Read-only preset table, built once and shared process-wide.
 *
 * Presets never move after construction, so references handed out by find() and
 * lookup() stay valid for the life of the catalog. Registries and engines borrow
 * the catalog they are given; it must outlive them.
 */
class GenreCatalog {
public:
    /**
     * @brief The built-in catalog (jazz, rock, metal, classical, electronic, ambient).
     */
    static const GenreCatalog& instance();

    /**
     * @brief Build a catalog from explicit presets.
     *
     * @throws std::invalid_argument if a preset breaks an invariant or a key repeats.
     */
    explicit GenreCatalog(std::vector<GenrePreset> presets);

    /**
     * @throws UnknownGenre if the key is absent.
     */
    const GenrePreset& lookup(std::string_view key) const;

    /**
     * @brief Non-throwing lookup; nullptr if the key is absent.
     */
    const GenrePreset* find(std::string_view key) const;

    /**
     * @brief (key, name, description) in definition order.
     */
    std::vector<GenreInfo> list() const;

    const GenrePreset& front() const { return presets_.front(); }
    size_t size() const { return presets_.size(); }

    /**
     * @brief Serialize every preset as a JSON array, in definition order.
     */
    std::string to_json_string(int indent = 4) const;

private:
    static void validate(const GenrePreset& preset);

    std::vector<GenrePreset> presets_;
};

} // namespace tonegen

#endif // TONEGEN_GENRE_CATALOG_HPP
