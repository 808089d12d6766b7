#pragma once

#include <vector>
#include <atomic>
#include <memory>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <stdexcept>
#include "Frame.hpp"

// Bounded broadcast log with one realtime producer and any number of consumers.
//
// The producer never blocks and never allocates: when the log is full the oldest
// frames are overwritten. Every consumer owns its own read cursor, starting at the
// write position it was created at, and drains whatever was published since its
// last call. A consumer that falls more than capacity() frames behind skips ahead
// and counts the loss in dropped().
template <typename T>
class Channel {
    using Traits = FrameTraits<T>;

    struct Log {
        explicit Log(size_t capacity)
            : lanes(capacity * Traits::channels), mask(capacity - 1) {}

        std::vector<std::atomic<float>> lanes;   // capacity * channels floats
        size_t mask;
        std::atomic<uint64_t> begin_{0};         // frames claimed by the writer
        std::atomic<uint64_t> end_{0};           // frames fully published
        std::atomic<float> sample_rate_{NAN};
    };

public:
    class Consumer {
    public:
        // Appends every frame published since the last call, oldest first.
        // Returns the number of frames appended.
        size_t receive(std::vector<T>& out) {
            Log& l = *log_;
            const uint64_t cap = l.mask + 1;

            uint64_t e = l.end_.load(std::memory_order_acquire);
            uint64_t r = read_;

            // Fell behind by more than one lap: skip what was overwritten
            if (e - r > cap) {
                dropped_ += e - r - cap;
                r = e - cap;
            }

            const size_t start = out.size();
            out.resize(start + (size_t)(e - r));

            for (uint64_t i = r; i < e; i++) {
                T& frame = out[start + (size_t)(i - r)];
                size_t base = (size_t)(i & l.mask) * Traits::channels;
                for (size_t ch = 0; ch < Traits::channels; ch++) {
                    Traits::set(frame, ch, l.lanes[base + ch].load(std::memory_order_relaxed));
                }
            }

            // Frames the writer started overwriting while we copied are discarded
            std::atomic_thread_fence(std::memory_order_acquire);
            uint64_t b = l.begin_.load(std::memory_order_relaxed);
            if (b > cap && b - cap > r) {
                uint64_t torn = std::min<uint64_t>(b - cap - r, e - r);
                out.erase(out.begin() + start, out.begin() + start + (size_t)torn);
                dropped_ += torn;
            }

            read_ = e;
            return out.size() - start;
        }

        size_t available() const {
            uint64_t e = log_->end_.load(std::memory_order_acquire);
            return (size_t)std::min<uint64_t>(e - read_, log_->mask + 1);
        }

        uint64_t dropped() const { return dropped_; }

        float sample_rate() const {
            return log_->sample_rate_.load(std::memory_order_relaxed);
        }

    private:
        friend class Channel;

        explicit Consumer(std::shared_ptr<Log> log)
            : log_(std::move(log)), read_(log_->end_.load(std::memory_order_acquire)) {}

        std::shared_ptr<Log> log_;
        uint64_t read_;
        uint64_t dropped_ = 0;
    };

    explicit Channel(size_t capacity) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            throw std::invalid_argument("Channel capacity must be a power of 2");
        }
        log_ = std::make_shared<Log>(capacity);
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Producer function, wait-free
    void send(const T& frame) {
        Log& l = *log_;
        uint64_t w = l.end_.load(std::memory_order_relaxed);

        l.begin_.store(w + 1, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);

        size_t base = (size_t)(w & l.mask) * Traits::channels;
        for (size_t ch = 0; ch < Traits::channels; ch++) {
            l.lanes[base + ch].store(Traits::get(frame, ch), std::memory_order_relaxed);
        }

        l.end_.store(w + 1, std::memory_order_release);
    }

    void send(const T* frames, size_t count) {
        for (size_t i = 0; i < count; i++) send(frames[i]);
    }

    // New reader that only sees frames sent from now on
    Consumer consumer() const {
        return Consumer(log_);
    }

    void set_sample_rate(float sample_rate) {
        log_->sample_rate_.store(sample_rate, std::memory_order_relaxed);
    }

    float sample_rate() const {
        return log_->sample_rate_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return log_->mask + 1; }

    uint64_t sent() const { return log_->end_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<Log> log_;
};
