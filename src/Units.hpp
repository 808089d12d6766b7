#pragma once

#include <cmath>
#include <cstddef>

// Amplitude (linear gain) from decibels
inline float db_to_linear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

// Decibels from amplitude, clamped at floor_db for silence
inline float linear_to_db(float gain, float floor_db = -140.0f) {
    const float eps = 1e-20f;
    float db = 20.0f * std::log10(std::abs(gain) + eps);
    return db < floor_db ? floor_db : db;
}

// Number of whole samples covered by ms at sample_rate.
// NaN, inf and non-positive inputs give 0 instead of an undefined cast.
inline size_t samples_for_ms(float sample_rate, float ms) {
    double n = (double)sample_rate * ((double)ms / 1000.0);
    if (!(n > 0.0) || !std::isfinite(n)) return 0;
    return (size_t)n;
}
