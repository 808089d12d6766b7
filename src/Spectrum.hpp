#pragma once

#include <fftw3.h>
#include <array>
#include <vector>
#include <memory>
#include <utility>
#include "TripleBuffer.hpp"

constexpr size_t kSpectrumWindowSize = 2048;
constexpr size_t kSpectrumOverlap = 2;
constexpr size_t kSpectrumBins = kSpectrumWindowSize / 2 + 1;

// Magnitudes of all bins of one windowed FFT frame
using Spectrum = std::array<float, kSpectrumBins>;

// Center frequency of a spectrum bin in Hz
inline float bin_frequency(size_t bin, float sample_rate) {
    return (float)bin * sample_rate / (float)kSpectrumWindowSize;
}

// UI side of a SpectrumInput
class SpectrumOutput {
public:
    // Latest complete spectrum, never blocks the audio thread
    const Spectrum& read() { return buffer_->read(); }

    bool updated() const { return buffer_->updated(); }

private:
    friend class SpectrumInput;

    explicit SpectrumOutput(std::shared_ptr<TripleBuffer<Spectrum>> buffer)
        : buffer_(std::move(buffer)) {}

    std::shared_ptr<TripleBuffer<Spectrum>> buffer_;
};

// Computes a decaying magnitude spectrum on the audio thread.
//
// A Hann-windowed STFT runs over every channel with kSpectrumOverlap overlap.
// Channels are merged per bin like a peak meter: higher magnitudes snap,
// lower ones decay, so a transient in either channel stays visible. The merged
// spectrum is published to the paired SpectrumOutput after every hop.
class SpectrumInput {
public:
    // decay in ms for a bin to fall by -12dB
    static std::pair<std::unique_ptr<SpectrumInput>, SpectrumOutput> create(size_t num_channels, float decay);

    ~SpectrumInput();

    SpectrumInput(const SpectrumInput&) = delete;
    SpectrumInput& operator=(const SpectrumInput&) = delete;

    // Call before compute(), and again whenever the host changes rate
    void update_sample_rate(float sample_rate);
    void set_decay(float decay);

    // Audio thread, planar: one pointer per channel
    void compute(const float* const* channels, size_t num_samples);

    // Audio thread, interleaved num_channels() floats per frame
    void compute_interleaved(const float* interleaved, size_t frames);

    size_t num_channels() const { return num_channels_; }
    float decay_weight() const { return smoothing_decay_weight; }

private:
    SpectrumInput(size_t num_channels, float decay, std::shared_ptr<TripleBuffer<Spectrum>> output);

    void advance();
    void analyze(size_t channel);

    size_t num_channels_;
    float decay;
    float sample_rate = 0.0f;
    float smoothing_decay_weight = 0.0f;

    std::vector<float> window;      // Hann with 1/N gain compensation baked in
    std::vector<float> history;     // num_channels * N, circular per channel
    size_t pos = 0;
    size_t until_hop;

    float* in;
    fftwf_complex* out;
    fftwf_plan plan;

    Spectrum result{};
    std::shared_ptr<TripleBuffer<Spectrum>> output;
};
