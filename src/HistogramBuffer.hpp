#pragma once

#include <vector>
#include <mutex>
#include <cmath>

constexpr float kHistogramMinDb = -96.0f;
constexpr float kHistogramMaxDb = 24.0f;

// Amplitude histogram with exponential forgetting.
//
// Bins are spaced evenly in dB between kHistogramMinDb and kHistogramMaxDb.
// Every non-silent sample scales all bins by decay_weight() and adds
// 1 - decay_weight() to the bin it falls into, so recent signal dominates.
// Values are not normalized; dividing by the largest bin is up to the view.
class HistogramBuffer {
public:
    // bins > 0, decay in ms for a bin to fall by -12dB
    HistogramBuffer(size_t bins, float decay);

    void set_sample_rate(float sample_rate);
    void set_decay(float decay);

    // Clears the bins
    void resize(size_t bins);
    void clear();

    void enqueue(float sample);

    // Same result as enqueueing every sample, with one pass over the bins
    void enqueue(const float* samples, size_t count);

    size_t find_bin(float value) const;

    float operator[](size_t bin) const;
    void linearize(std::vector<float>& out) const;

    std::vector<float> edges() const;
    float decay_weight() const;
    float sample_rate() const;
    size_t size() const;

private:
    void update_locked();
    size_t find_bin_locked(float value) const;

    size_t bins;
    float decay;
    float sample_rate_ = NAN;
    float decay_weight_ = 1.0f;

    std::vector<float> data;
    std::vector<float> edges_;   // bins - 1 linear thresholds, ascending

    mutable std::mutex mtx;
};
