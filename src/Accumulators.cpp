#include "Accumulators.hpp"

#include <algorithm>
#include "Units.hpp"

float sample_delta(size_t size, float sample_rate, float duration) {
    return (float)(((double)sample_rate * (double)duration) / (double)size);
}

float decay_weight(float decay, size_t size, float duration) {
    return (float)std::pow(0.25, 1.0 / ((double)decay / 1000.0 * ((double)size / (double)duration)));
}

////////////////////////////////////////////////////////
// Peak
////////////////////////////////////////////////////////

PeakAccumulator::PeakAccumulator(float duration, float decay)
    : Accumulator(duration), decay_(decay) {
    update();
}

void PeakAccumulator::set_decay(float decay) {
    decay_ = decay;
    update();
}

void PeakAccumulator::update() {
    Accumulator::update();
    decay_weight_ = ::decay_weight(decay_, size_, duration_);
    max_acc_ = 0.0f;
}

std::optional<float> PeakAccumulator::accumulate(float sample) {
    max_acc_ = std::max(max_acc_, std::abs(sample));   // NaN samples are ignored

    if (!clock_.tick()) return std::nullopt;

    float peak = max_acc_;
    max_acc_ = 0.0f;

    // Louder peaks snap, quieter ones decay towards the new level
    float next = peak >= prev_ ? peak : prev_ * decay_weight_ + peak * (1.0f - decay_weight_);
    if (std::isnan(next)) next = peak;

    prev_ = next;
    return next;
}

////////////////////////////////////////////////////////
// Minimum
////////////////////////////////////////////////////////

MinimumAccumulator::MinimumAccumulator(float duration, float decay)
    : Accumulator(duration), decay_(decay) {
    update();
}

void MinimumAccumulator::set_decay(float decay) {
    decay_ = decay;
    update();
}

void MinimumAccumulator::update() {
    Accumulator::update();
    decay_weight_ = ::decay_weight(decay_, size_, duration_);
    min_acc_ = std::numeric_limits<float>::max();
}

std::optional<float> MinimumAccumulator::accumulate(float sample) {
    min_acc_ = std::min(min_acc_, std::abs(sample));

    if (!clock_.tick()) return std::nullopt;

    float minimum = min_acc_;
    min_acc_ = std::numeric_limits<float>::max();

    // Window held only NaNs: hold the floor
    if (minimum == std::numeric_limits<float>::max()) return prev_;

    // The first window sets the floor instead of recovering up from 0
    float next = !seeded_ || minimum <= prev_
        ? minimum
        : prev_ * decay_weight_ + minimum * (1.0f - decay_weight_);
    if (std::isnan(next)) next = minimum;
    seeded_ = true;

    prev_ = next;
    return next;
}

////////////////////////////////////////////////////////
// RMS
////////////////////////////////////////////////////////

RMSAccumulator::RMSAccumulator(float duration, float rms_window)
    : Accumulator(duration), rms_window_(rms_window) {
    update();
}

void RMSAccumulator::set_rms_window(float rms_window) {
    rms_window_ = rms_window;
    update();
}

void RMSAccumulator::update() {
    Accumulator::update();
    squared_.resize(samples_for_ms(sample_rate_, rms_window_));
    squared_.clear();
    sum_acc_ = 0.0f;
    since_rebase_ = 0;
}

std::optional<float> RMSAccumulator::accumulate(float sample) {
    float squared = sample * sample;
    if (!std::isfinite(squared)) squared = 0.0f;

    if (!squared_.empty()) {
        sum_acc_ -= squared_[0];   // oldest, about to be overwritten
        squared_.enqueue(squared);
        sum_acc_ += squared;

        // Recompute once per lap so rounding error does not build up
        if (++since_rebase_ >= squared_.size()) {
            double sum = 0.0;
            for (size_t i = 0; i < squared_.size(); i++) sum += squared_[i];
            sum_acc_ = (float)sum;
            since_rebase_ = 0;
        }
    }

    if (!clock_.tick()) return std::nullopt;

    // Rounding can leave the running sum slightly negative
    float rms = std::sqrt(std::max(sum_acc_, 0.0f) / (float)squared_.size());
    if (std::isnan(rms)) rms = 0.0f;

    prev_ = rms;
    return rms;
}

////////////////////////////////////////////////////////
// Waveform
////////////////////////////////////////////////////////

WaveformAccumulator::WaveformAccumulator(float duration)
    : Accumulator(duration) {
    update();
}

void WaveformAccumulator::update() {
    Accumulator::update();
    min_acc_ = std::numeric_limits<float>::max();
    max_acc_ = std::numeric_limits<float>::lowest();
}

std::optional<MinMax> WaveformAccumulator::accumulate(float sample) {
    if (sample > max_acc_) max_acc_ = sample;
    if (sample < min_acc_) min_acc_ = sample;

    if (!clock_.tick()) return std::nullopt;

    MinMax out{min_acc_, max_acc_};
    // Window held only NaNs
    if (out.first > out.second) out = {0.0f, 0.0f};

    min_acc_ = std::numeric_limits<float>::max();
    max_acc_ = std::numeric_limits<float>::lowest();

    prev_ = out;
    return out;
}

////////////////////////////////////////////////////////
// Correlation
////////////////////////////////////////////////////////

CorrelationAccumulator::CorrelationAccumulator(float duration, float integration)
    : Accumulator(duration), integration_(integration) {
    update();
}

void CorrelationAccumulator::set_integration(float integration) {
    integration_ = integration;
    update();
}

void CorrelationAccumulator::update() {
    Accumulator::update();

    // One-pole averager, y = x + pole * (y - x)
    double tau_samples = (double)integration_ / 1000.0 * (double)sample_rate_;
    pole_ = tau_samples > 0.0 ? (float)std::exp(-1.0 / tau_samples) : 0.0f;

    lr_ = ll_ = rr_ = 0.0f;
}

std::optional<float> CorrelationAccumulator::accumulate(StereoFrame frame) {
    float l = frame[0];
    float r = frame[1];
    if (std::isfinite(l) && std::isfinite(r)) {
        float lr = l * r, ll = l * l, rr = r * r;
        lr_ = lr + pole_ * (lr_ - lr);
        ll_ = ll + pole_ * (ll_ - ll);
        rr_ = rr + pole_ * (rr_ - rr);
    }

    if (!clock_.tick()) return std::nullopt;

    float energy = std::sqrt(ll_ * rr_);
    float corr = energy > 0.0f ? lr_ / energy : 0.0f;
    if (std::isnan(corr)) corr = 0.0f;
    corr = std::clamp(corr, -1.0f, 1.0f);

    prev_ = corr;
    return corr;
}
