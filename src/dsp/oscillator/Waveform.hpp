/**
 * @file Waveform.hpp
 * @brief Closed set of oscillator shapes and their per-phase sample functions.
 */

#ifndef TONEGEN_WAVEFORM_HPP
#define TONEGEN_WAVEFORM_HPP

#include <cmath>
#include <optional>
#include <span>
#include <string_view>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace tonegen {

enum class Waveform {
    Sine,
    Square,
    Sawtooth,
    Triangle,
    Pulse
};

inline constexpr double kPulseDutyCycle = 0.3;

inline std::string_view to_string(Waveform wave) {
    switch (wave) {
        case Waveform::Sine: return "sine";
        case Waveform::Square: return "square";
        case Waveform::Sawtooth: return "sawtooth";
        case Waveform::Triangle: return "triangle";
        case Waveform::Pulse: return "pulse";
    }
    return "sine";
}

inline std::optional<Waveform> waveform_from_string(std::string_view name) {
    if (name == "sine") return Waveform::Sine;
    if (name == "square") return Waveform::Square;
    if (name == "sawtooth") return Waveform::Sawtooth;
    if (name == "triangle") return Waveform::Triangle;
    if (name == "pulse") return Waveform::Pulse;
    return std::nullopt;
}

/**
 * @brief Naive (non band-limited) waveform value at a phase in [0, 1).
 *
 * Non-sine shapes are pre-scaled so their perceived loudness sits close to the sine.
 */
inline double waveform_sample(Waveform wave, double phase) {
    switch (wave) {
        case Waveform::Sine:
            return std::sin(2.0 * M_PI * phase);
        case Waveform::Square:
            return (phase < 0.5) ? 0.5 : -0.5;
        case Waveform::Sawtooth:
            return 2.0 * (phase - std::floor(phase + 0.5)) * 0.4;
        case Waveform::Triangle:
            return (2.0 * std::abs(2.0 * (phase - std::floor(phase + 0.5))) - 1.0) * 0.6;
        case Waveform::Pulse:
            return (phase < kPulseDutyCycle) ? 0.5 : -0.5;
    }
    return 0.0;
}

/**
 * @brief Sum of sine partials, harmonic k at k times the fundamental.
 *
 * Partial k is weighted by harmonics[k-1] / k and the sum is normalized by the total
 * weight, so the result stays within [-1, 1].
 */
inline double additive_sample(std::span<const float> harmonics, double phase) {
    const double theta = 2.0 * M_PI * phase;
    const double two_cos = 2.0 * std::cos(theta);

    // sin(k*theta) by the Chebyshev recurrence: one sin/cos pair per sample.
    double sin_prev = 0.0;
    double sin_k = std::sin(theta);
    double sum = 0.0;
    double norm = 0.0;
    for (size_t i = 0; i < harmonics.size(); ++i) {
        const double weight = static_cast<double>(harmonics[i]) / static_cast<double>(i + 1);
        sum += weight * sin_k;
        norm += std::abs(weight);

        const double sin_next = two_cos * sin_k - sin_prev;
        sin_prev = sin_k;
        sin_k = sin_next;
    }
    return norm > 0.0 ? sum / norm : 0.0;
}

} // namespace tonegen

#endif // TONEGEN_WAVEFORM_HPP
