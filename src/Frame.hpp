#pragma once

#include <array>
#include <cstddef>

using StereoFrame = std::array<float, 2>;

// Describes how a sample frame is split into float lanes for transport.
template <typename T>
struct FrameTraits {};

template <>
struct FrameTraits<float> {
    static constexpr size_t channels = 1;

    static float get(const float& frame, size_t) { return frame; }
    static void set(float& frame, size_t, float value) { frame = value; }
};

template <size_t N>
struct FrameTraits<std::array<float, N>> {
    static_assert(N > 0, "Expected at least one channel per frame.");
    static constexpr size_t channels = N;

    static float get(const std::array<float, N>& frame, size_t ch) { return frame[ch]; }
    static void set(std::array<float, N>& frame, size_t ch, float value) { frame[ch] = value; }
};
