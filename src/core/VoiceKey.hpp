/**
 * @file VoiceKey.hpp
 * @brief Identity of a sounding note: (instrument, quantized note).
 */

#ifndef TONEGEN_VOICE_KEY_HPP
#define TONEGEN_VOICE_KEY_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tonegen {

/**
 * @brief 32-bit FNV-1a. Stable across platforms and runs.
 */
inline uint32_t fnv1a32(std::string_view text) {
    uint32_t hash = 2166136261u;
    for (char c : text) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

struct VoiceKey {
    std::string instrument_id;
    int note = 0;

    bool operator==(const VoiceKey& other) const = default;
};

struct VoiceKeyHash {
    size_t operator()(const VoiceKey& key) const {
        return std::hash<std::string>{}(key.instrument_id) ^ (static_cast<size_t>(key.note) * 0x9e3779b97f4a7c15ull);
    }
};

} // namespace tonegen

#endif // TONEGEN_VOICE_KEY_HPP
