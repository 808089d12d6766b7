#pragma once

#include <cmath>
#include <limits>
#include <utility>
#include <optional>
#include "RingBuffer.hpp"
#include "Frame.hpp"

// Input samples per output value
float sample_delta(size_t size, float sample_rate, float duration);

// Per-output-step weight for a value to fall by -12dB (x0.25) in decay ms
float decay_weight(float decay, size_t size, float duration);

// Counts input samples down to the next window boundary.
// The fractional remainder is carried into the next window.
class WindowClock {
public:
    void configure(size_t size, float sample_rate, float duration) {
        delta_ = sample_delta(size, sample_rate, duration);
        t_ = delta_;
    }

    bool tick() {
        t_ -= 1.0f;
        if (t_ <= 0.0f) {
            t_ += delta_;
            return true;
        }
        return false;
    }

    float delta() const { return delta_; }

private:
    float delta_ = 0.0f;
    float t_ = 0.0f;
};

// Reduces a stream of In samples to one Out value per window of
// sample_delta() samples, for a display of size() values spanning duration seconds.
//
// Changing size, duration or sample rate recomputes the window and discards
// the partially accumulated one.
template <typename In, typename Out>
class Accumulator {
public:
    using Input = In;
    using Output = Out;

    explicit Accumulator(float duration) : duration_(duration) {}
    virtual ~Accumulator() = default;

    // Returns a value when a window closes
    virtual std::optional<Out> accumulate(In sample) = 0;

    // Last emitted value
    Out prev() const { return prev_; }

    void set_sample_rate(float sample_rate) {
        sample_rate_ = sample_rate;
        update();
    }

    void set_size(size_t size) {
        size_ = size;
        update();
    }

    void set_duration(float duration) {
        duration_ = duration;
        update();
    }

    void reset() { update(); }

    float sample_rate() const { return sample_rate_; }
    size_t size() const { return size_; }
    float duration() const { return duration_; }
    float sample_delta() const { return clock_.delta(); }

protected:
    virtual void update() {
        clock_.configure(size_, sample_rate_, duration_);
    }

    size_t size_ = 1;
    float duration_;
    float sample_rate_ = NAN;
    Out prev_{};
    WindowClock clock_;
};

using MinMax = std::pair<float, float>;

// Rectified peak with instant attack and exponential release
class PeakAccumulator : public Accumulator<float, float> {
public:
    // duration in seconds, decay in ms to fall by -12dB
    PeakAccumulator(float duration, float decay);

    std::optional<float> accumulate(float sample) override;

    void set_decay(float decay);
    float decay_weight() const { return decay_weight_; }

protected:
    void update() override;

private:
    float decay_;
    float decay_weight_ = 0.0f;
    float max_acc_ = 0.0f;
};

// Rectified minimum, drops instantly and recovers exponentially (gain reduction)
class MinimumAccumulator : public Accumulator<float, float> {
public:
    MinimumAccumulator(float duration, float decay);

    std::optional<float> accumulate(float sample) override;

    void set_decay(float decay);
    float decay_weight() const { return decay_weight_; }

protected:
    void update() override;

private:
    float decay_;
    float decay_weight_ = 0.0f;
    float min_acc_ = std::numeric_limits<float>::max();
    bool seeded_ = false;         // prev_ holds a measured floor
};

// Windowed RMS over the last rms_window ms, sampled once per window
class RMSAccumulator : public Accumulator<float, float> {
public:
    // duration in seconds, rms_window in ms
    RMSAccumulator(float duration, float rms_window);

    std::optional<float> accumulate(float sample) override;

    void set_rms_window(float rms_window);
    size_t window_samples() const { return squared_.size(); }

protected:
    void update() override;

private:
    float rms_window_;
    float sum_acc_ = 0.0f;
    size_t since_rebase_ = 0;     // samples since sum_acc_ was recomputed
    RingBuffer<float> squared_;   // squared samples currently in the window
};

// Signed (min, max) of the raw signal per window, for peak waveform displays
class WaveformAccumulator : public Accumulator<float, MinMax> {
public:
    explicit WaveformAccumulator(float duration);

    std::optional<MinMax> accumulate(float sample) override;

protected:
    void update() override;

private:
    float min_acc_ = std::numeric_limits<float>::max();
    float max_acc_ = std::numeric_limits<float>::lowest();
};

// Stereo correlation in [-1, 1], +1 mono, 0 uncorrelated, -1 out of phase
class CorrelationAccumulator : public Accumulator<StereoFrame, float> {
public:
    // duration in seconds, integration in ms
    CorrelationAccumulator(float duration, float integration);

    std::optional<float> accumulate(StereoFrame frame) override;

    void set_integration(float integration);

protected:
    void update() override;

private:
    float integration_;
    float pole_ = 0.0f;
    float lr_ = 0.0f, ll_ = 0.0f, rr_ = 0.0f;   // averaged products
};
