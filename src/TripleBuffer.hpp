#pragma once

#include <atomic>
#include <cstdint>

// Wait-free single producer / single consumer handoff of the latest value.
//
// The producer always owns one slot, the consumer another, and the third is
// the "back" slot they swap through. Neither side ever waits; the reader sees
// the most recently published value and intermediate ones are skipped.
template <typename T>
class TripleBuffer {
public:
    TripleBuffer() = default;
    explicit TripleBuffer(const T& initial) : slots_{initial, initial, initial} {}

    TripleBuffer(const TripleBuffer&) = delete;
    TripleBuffer& operator=(const TripleBuffer&) = delete;

    // Producer buffer, valid until the next publish()
    T& write_slot() {
        return slots_[write_idx_];
    }

    void publish() {
        uint8_t prev = back_.exchange((uint8_t)(write_idx_ | kDirty), std::memory_order_acq_rel);
        write_idx_ = prev & kIndexMask;
    }

    void write(const T& value) {
        write_slot() = value;
        publish();
    }

    // Consumer: true if a value was published since the last read()
    bool updated() const {
        return (back_.load(std::memory_order_acquire) & kDirty) != 0;
    }

    const T& read() {
        if (updated()) {
            uint8_t prev = back_.exchange(read_idx_, std::memory_order_acq_rel);
            read_idx_ = prev & kIndexMask;
        }
        return slots_[read_idx_];
    }

private:
    static constexpr uint8_t kDirty = 0x4;
    static constexpr uint8_t kIndexMask = 0x3;

    T slots_[3]{};
    uint8_t write_idx_ = 0;            // producer only
    uint8_t read_idx_ = 1;             // consumer only
    std::atomic<uint8_t> back_{2};     // index of the spare slot, plus dirty flag
};
