#include <iostream>
#include <vector>
#include <stdexcept>

#include "../src/RingBuffer.hpp"

static void print(const std::vector<float>& v) {
    std::cerr << "       Got [";
    for (size_t i = 0; i < v.size(); i++) std::cerr << (i ? ", " : "") << v[i];
    std::cerr << "]\n";
}

int main() {
    std::cout << "[TEST] Starting RingBuffer Test...\n";

    std::vector<float> out;

    ////////////////////////////////////////////////////////
    // FIFO order
    ////////////////////////////////////////////////////////

    RingBuffer<float> rb(4);
    rb.enqueue(1.0f);
    rb.enqueue(2.0f);
    rb.enqueue(3.0f);

    rb.linearize(out);
    if (out != std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f}) {
        std::cerr << "[FAIL] Partially filled buffer should read [0, 1, 2, 3]\n";
        print(out);
        return 1;
    }

    rb.enqueue(4.0f);
    rb.enqueue(5.0f);
    rb.enqueue(6.0f);

    rb.linearize(out);
    if (out != std::vector<float>{3.0f, 4.0f, 5.0f, 6.0f}) {
        std::cerr << "[FAIL] Wrapped buffer should read [3, 4, 5, 6]\n";
        print(out);
        return 1;
    }

    if (rb[0] != 3.0f || rb[3] != 6.0f || rb.peek() != 6.0f) {
        std::cerr << "[FAIL] Index 0 should be the oldest and peek() the newest\n";
        return 1;
    }
    std::cout << "[PASS] Enqueue keeps FIFO order across the wrap.\n";

    ////////////////////////////////////////////////////////
    // Resize
    ////////////////////////////////////////////////////////

    rb.resize(2);
    rb.linearize(out);
    if (out != std::vector<float>{5.0f, 6.0f}) {
        std::cerr << "[FAIL] Shrink should keep the newest elements\n";
        print(out);
        return 1;
    }

    rb.resize(4);
    rb.linearize(out);
    if (out != std::vector<float>{0.0f, 0.0f, 5.0f, 6.0f}) {
        std::cerr << "[FAIL] Grow should keep order and add empty slots before the data\n";
        print(out);
        return 1;
    }

    rb.enqueue(7.0f);
    rb.linearize(out);
    if (out != std::vector<float>{0.0f, 5.0f, 6.0f, 7.0f}) {
        std::cerr << "[FAIL] Enqueue after grow overwrote live data\n";
        print(out);
        return 1;
    }
    std::cout << "[PASS] Shrink and grow preserve order.\n";

    // Shrinking a wrapped buffer takes from both ends of the storage
    RingBuffer<int> wrapped(5);
    for (int i = 1; i <= 7; i++) wrapped.enqueue(i);
    wrapped.resize(4);
    std::vector<int> ints;
    wrapped.linearize(ints);
    if (ints != std::vector<int>{4, 5, 6, 7}) {
        std::cerr << "[FAIL] Shrinking a wrapped buffer lost order\n";
        return 1;
    }

    // Resizing to the same size is a no-op
    wrapped.resize(4);
    wrapped.linearize(ints);
    if (ints != std::vector<int>{4, 5, 6, 7}) {
        std::cerr << "[FAIL] Same-size resize changed contents\n";
        return 1;
    }
    std::cout << "[PASS] Wrapped shrink.\n";

    ////////////////////////////////////////////////////////
    // Edge cases
    ////////////////////////////////////////////////////////

    bool threw = false;
    try {
        (void)rb[4];
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[FAIL] Index past the end should throw std::out_of_range\n";
        return 1;
    }

    RingBuffer<float> empty;
    empty.enqueue(1.0f);
    if (!empty.empty() || empty.peek() != 0.0f) {
        std::cerr << "[FAIL] Enqueue into a zero-sized buffer should be a no-op\n";
        return 1;
    }

    rb.clear();
    rb.linearize(out);
    if (out != std::vector<float>(4, 0.0f)) {
        std::cerr << "[FAIL] clear() should reset every slot\n";
        return 1;
    }
    std::cout << "[PASS] Out of range, empty buffer and clear.\n";

    std::cout << "[SUCCESS] All RingBuffer Tests Passed.\n";
    return 0;
}
