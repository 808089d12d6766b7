#pragma once

#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>

// Fixed-size FIFO. Enqueue overwrites the oldest element.
// Logical index 0 is the oldest element, size()-1 the newest.
// Not thread safe: owned by one thread or guarded by its owner.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t size = 0) : data(size, T{}) {}

    void enqueue(const T& value) {
        if (data.empty()) return;
        data[head] = value;
        head = (head + 1) % data.size();
    }

    // Newest element
    T peek() const {
        if (data.empty()) return T{};
        return data[(head + data.size() - 1) % data.size()];
    }

    T& operator[](size_t i) {
        check_index(i);
        return data[(head + i) % data.size()];
    }

    const T& operator[](size_t i) const {
        check_index(i);
        return data[(head + i) % data.size()];
    }

    // Keeps the newest `size` elements, laid out from index 0
    void shrink(size_t size) {
        if (size >= data.size()) return;

        std::vector<T> out;
        out.reserve(size);

        if (size <= head) {
            out.insert(out.end(), data.begin() + (head - size), data.begin() + head);
        } else {
            // Tail end of the storage first, then everything before the head
            out.insert(out.end(), data.end() - (size - head), data.end());
            out.insert(out.end(), data.begin(), data.begin() + head);
        }

        data.swap(out);
        head = 0;
    }

    // Keeps every element in order, new default slots are the next to be written
    void grow(size_t size) {
        if (size <= data.size()) return;

        std::vector<T> out;
        out.reserve(size);

        out.insert(out.end(), data.begin() + head, data.end());
        out.insert(out.end(), data.begin(), data.begin() + head);

        size_t old_size = data.size();
        out.resize(size, T{});

        data.swap(out);
        head = old_size % data.size();
    }

    void resize(size_t size) {
        if (size < data.size()) shrink(size);
        else if (size > data.size()) grow(size);
    }

    void clear() {
        std::fill(data.begin(), data.end(), T{});
    }

    // Copy oldest -> newest
    void linearize(std::vector<T>& out) const {
        out.resize(data.size());
        for (size_t i = 0; i < data.size(); i++) {
            out[i] = data[(head + i) % data.size()];
        }
    }

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

private:
    void check_index(size_t i) const {
        if (i >= data.size()) {
            throw std::out_of_range("RingBuffer index " + std::to_string(i) +
                                    " out of range for size " + std::to_string(data.size()));
        }
    }

    std::vector<T> data;
    size_t head = 0;
};
