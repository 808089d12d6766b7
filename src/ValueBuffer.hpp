#pragma once

#include <vector>
#include <memory>
#include <mutex>
#include <cmath>
#include "RingBuffer.hpp"
#include "Accumulators.hpp"
#include "Bus.hpp"

// Ring buffer of accumulated values, shared between the bus dispatcher that
// fills it and the view that draws it.
template <typename Acc>
class ValueBuffer {
public:
    using Input = typename Acc::Input;
    using Output = typename Acc::Output;

    template <typename... Args>
    explicit ValueBuffer(size_t size, Args&&... args)
        : acc(std::forward<Args>(args)...), ring(size) {
        acc.set_size(size);
    }

    void enqueue(Input sample) {
        std::lock_guard<std::mutex> lock(mtx);
        if (auto value = acc.accumulate(sample)) ring.enqueue(*value);
    }

    void enqueue(const Input* samples, size_t count) {
        std::lock_guard<std::mutex> lock(mtx);
        for (size_t i = 0; i < count; i++) {
            if (auto value = acc.accumulate(samples[i])) ring.enqueue(*value);
        }
    }

    // Keeps the newest values, e.g. when the view width changes
    void set_size(size_t size) {
        std::lock_guard<std::mutex> lock(mtx);
        if (ring.size() == size) return;
        ring.resize(size);
        acc.set_size(size);
    }

    // Old values span a different time base, so they are discarded
    void set_duration(float duration) {
        std::lock_guard<std::mutex> lock(mtx);
        acc.set_duration(duration);
        ring.clear();
    }

    void set_sample_rate(float sample_rate) {
        std::lock_guard<std::mutex> lock(mtx);
        acc.set_sample_rate(sample_rate);
        ring.clear();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx);
        acc.reset();
        ring.clear();
    }

    // UI thread pulls buffer, oldest -> newest
    void linearize(std::vector<Output>& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        ring.linearize(out);
    }

    Output latest() const {
        std::lock_guard<std::mutex> lock(mtx);
        return ring.peek();
    }

    float sample_rate() const {
        std::lock_guard<std::mutex> lock(mtx);
        return acc.sample_rate();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return ring.size();
    }

    // Direct access for configuration not covered above
    template <typename F>
    void with_accumulator(F&& f) {
        std::lock_guard<std::mutex> lock(mtx);
        f(acc);
    }

private:
    Acc acc;
    RingBuffer<Output> ring;
    mutable std::mutex mtx;
};

using PeakBuffer = ValueBuffer<PeakAccumulator>;
using MinimaBuffer = ValueBuffer<MinimumAccumulator>;
using RMSBuffer = ValueBuffer<RMSAccumulator>;
using WaveformBuffer = ValueBuffer<WaveformAccumulator>;
using CorrelationBuffer = ValueBuffer<CorrelationAccumulator>;

// Raw frames, newest last. Used for lissajous and oscilloscope point clouds.
template <typename T>
class FrameBuffer {
public:
    using Input = T;

    explicit FrameBuffer(size_t size) : ring(size) {}

    void enqueue(const T& frame) {
        std::lock_guard<std::mutex> lock(mtx);
        ring.enqueue(frame);
    }

    void enqueue(const T* frames, size_t count) {
        std::lock_guard<std::mutex> lock(mtx);
        for (size_t i = 0; i < count; i++) ring.enqueue(frames[i]);
    }

    void set_size(size_t size) {
        std::lock_guard<std::mutex> lock(mtx);
        ring.resize(size);
    }

    void set_sample_rate(float sample_rate) {
        std::lock_guard<std::mutex> lock(mtx);
        sample_rate_ = sample_rate;
        ring.clear();
    }

    float sample_rate() const {
        std::lock_guard<std::mutex> lock(mtx);
        return sample_rate_;
    }

    void linearize(std::vector<T>& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        ring.linearize(out);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return ring.size();
    }

private:
    RingBuffer<T> ring;
    float sample_rate_ = NAN;
    mutable std::mutex mtx;
};

// Same rate, treating NaN ("unknown") as equal to itself
inline bool same_rate(float a, float b) {
    return a == b || (std::isnan(a) && std::isnan(b));
}

// Feeds every batch drained by the bus into buffer. The dispatcher holds the
// buffer weakly and applies sample rate changes before the batch.
// Keep the returned handle alive for as long as the buffer should be fed.
template <typename B, typename Buffer>
typename B::Handle connect(B& bus, const std::shared_ptr<Buffer>& buffer) {
    std::weak_ptr<Buffer> weak = buffer;
    B* source = &bus;

    return bus.register_dispatcher([weak, source](const auto& batch) {
        std::shared_ptr<Buffer> target = weak.lock();
        if (!target) return;

        float sample_rate = source->sample_rate();
        if (!same_rate(sample_rate, target->sample_rate())) {
            target->set_sample_rate(sample_rate);
        }

        target->enqueue(batch.data(), batch.size());
    });
}
