#pragma once

#include <vector>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <algorithm>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include "Channel.hpp"
#include "Frame.hpp"

// Fans realtime audio out to visualizers.
//
// The audio thread calls send(); a UI-owned context calls update() periodically,
// which drains everything sent since the last call and hands the batch to every
// registered dispatcher. The Bus only holds dispatchers weakly: a dispatcher is
// called for as long as the Handle returned by register_dispatcher() is alive.
template <typename T>
class Bus {
public:
    using Frame = T;
    using Dispatcher = std::function<void(const std::vector<T>&)>;
    using Handle = std::shared_ptr<Dispatcher>;

    explicit Bus(size_t capacity = 4096)
        : channel_(capacity), consumer_(channel_.consumer()) {}

    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    // Audio thread. Never blocks, the oldest frames are lost when the UI lags.
    void send(const T& frame) { channel_.send(frame); }
    void send(const T* frames, size_t count) { channel_.send(frames, count); }

    void set_sample_rate(float sample_rate) { channel_.set_sample_rate(sample_rate); }
    float sample_rate() const { return channel_.sample_rate(); }

    Handle register_dispatcher(Dispatcher dispatcher) {
        Handle handle = std::make_shared<Dispatcher>(std::move(dispatcher));
        std::weak_ptr<Dispatcher> weak = handle;

        std::unique_lock<std::shared_mutex> lock(mtx_);

        auto dead = std::find_if(dispatchers_.begin(), dispatchers_.end(),
                                 [](const std::weak_ptr<Dispatcher>& d) { return d.expired(); });
        if (dead != dispatchers_.end()) {
            *dead = weak;
            prune_locked();
        } else {
            dispatchers_.push_back(weak);
        }

        return handle;
    }

    // Drains the channel and calls every live dispatcher with the batch.
    // Returns the number of frames drained. Not reentrant.
    size_t update() {
        batch_.clear();
        consumer_.receive(batch_);
        dropped_.store(consumer_.dropped(), std::memory_order_relaxed);

        bool any_dead = false;
        live_.clear();
        {
            std::shared_lock<std::shared_mutex> lock(mtx_);
            for (const auto& d : dispatchers_) {
                if (Handle strong = d.lock()) live_.push_back(std::move(strong));
                else any_dead = true;
            }
        }

        // Called outside the lock so a dispatcher may register others
        if (!batch_.empty()) {
            for (const auto& d : live_) (*d)(batch_);
        }
        live_.clear();

        if (any_dead) {
            std::unique_lock<std::shared_mutex> lock(mtx_);
            prune_locked();
        }

        return batch_.size();
    }

    size_t dispatcher_count() const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return (size_t)std::count_if(dispatchers_.begin(), dispatchers_.end(),
                                     [](const std::weak_ptr<Dispatcher>& d) { return !d.expired(); });
    }

    // Frames lost because update() fell a whole channel behind
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    size_t capacity() const { return channel_.capacity(); }

    // Extra reader with its own cursor, for consumers that poll on their own schedule
    typename Channel<T>::Consumer consumer() const { return channel_.consumer(); }

private:
    void prune_locked() {
        dispatchers_.erase(std::remove_if(dispatchers_.begin(), dispatchers_.end(),
                                          [](const std::weak_ptr<Dispatcher>& d) { return d.expired(); }),
                           dispatchers_.end());
    }

    Channel<T> channel_;
    typename Channel<T>::Consumer consumer_;

    mutable std::shared_mutex mtx_;
    std::vector<std::weak_ptr<Dispatcher>> dispatchers_;

    // update() scratch
    std::vector<T> batch_;
    std::vector<Handle> live_;

    std::atomic<uint64_t> dropped_{0};
};

// Mono signal path
class MonoBus : public Bus<float> {
public:
    using Bus<float>::Bus;
    using Bus<float>::send;

    // Interleaved block, each frame is averaged over all channels
    void send_summing(const float* interleaved, size_t frames, size_t channels) {
        if (channels == 0) return;
        const float norm = 1.0f / (float)channels;
        for (size_t i = 0; i < frames; i++) {
            float sum = 0.0f;
            for (size_t ch = 0; ch < channels; ch++) sum += interleaved[i * channels + ch];
            send(sum * norm);
        }
    }

    // Planar block, one pointer per channel
    void send_summing(const float* const* data, size_t channels, size_t frames) {
        if (channels == 0) return;
        const float norm = 1.0f / (float)channels;
        for (size_t i = 0; i < frames; i++) {
            float sum = 0.0f;
            for (size_t ch = 0; ch < channels; ch++) sum += data[ch][i];
            send(sum * norm);
        }
    }
};

// Stereo signal path, frames are {left, right}
class StereoBus : public Bus<StereoFrame> {
public:
    using Bus<StereoFrame>::Bus;
    using Bus<StereoFrame>::send;

    void send(const float* left, const float* right, size_t frames) {
        for (size_t i = 0; i < frames; i++) send(StereoFrame{left[i], right[i]});
    }

    // Interleaved block with at least 2 channels, extra channels are ignored
    void send_interleaved(const float* interleaved, size_t frames, size_t channels) {
        if (channels == 0) return;
        for (size_t i = 0; i < frames; i++) {
            const float* f = interleaved + i * channels;
            send(StereoFrame{f[0], channels > 1 ? f[1] : f[0]});
        }
    }
};

template <size_t N>
float downmix_mean(const std::array<float, N>& frame) {
    float sum = 0.0f;
    for (float x : frame) sum += x;
    return sum / (float)N;
}

// Mono view of a multichannel bus. Dispatchers registered here receive every
// drained frame reduced to a single float by the downmix function.
template <size_t N>
class IntoMonoBus {
public:
    using Source = Bus<std::array<float, N>>;
    using Downmix = std::function<float(const std::array<float, N>&)>;
    using Dispatcher = std::function<void(const std::vector<float>&)>;
    using Handle = typename Source::Handle;

    explicit IntoMonoBus(std::shared_ptr<Source> source, Downmix downmix = downmix_mean<N>)
        : source_(std::move(source)), downmix_(std::move(downmix)) {}

    Handle register_dispatcher(Dispatcher dispatcher) {
        Downmix downmix = downmix_;
        std::vector<float> mono;
        return source_->register_dispatcher(
            [downmix, dispatcher, mono](const std::vector<std::array<float, N>>& frames) mutable {
                mono.resize(frames.size());
                std::transform(frames.begin(), frames.end(), mono.begin(), downmix);
                dispatcher(mono);
            });
    }

    size_t update() { return source_->update(); }

    void set_sample_rate(float sample_rate) { source_->set_sample_rate(sample_rate); }
    float sample_rate() const { return source_->sample_rate(); }

private:
    std::shared_ptr<Source> source_;
    Downmix downmix_;
};

// Calls update() on a fixed period from its own thread until destroyed
class BusUpdater {
public:
    template <typename B>
    explicit BusUpdater(std::shared_ptr<B> bus,
                        std::chrono::milliseconds period = std::chrono::milliseconds(15))
        : running_(true) {
        thread_ = std::thread([this, bus, period] {
            while (running_.load(std::memory_order_relaxed)) {
                bus->update();
                std::this_thread::sleep_for(period);
            }
        });
    }

    BusUpdater(const BusUpdater&) = delete;
    BusUpdater& operator=(const BusUpdater&) = delete;

    ~BusUpdater() { stop(); }

    void stop() {
        running_.store(false, std::memory_order_relaxed);
        if (thread_.joinable()) thread_.join();
    }

private:
    std::atomic<bool> running_;
    std::thread thread_;
};
