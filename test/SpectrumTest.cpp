#include <iostream>
#include <vector>
#include <thread>
#include <atomic>
#include <cmath>
#include <stdexcept>

#include "../src/Spectrum.hpp"
#include "../src/TripleBuffer.hpp"

const float pi = 3.14159265f;
const float fs = 48000.0f;

static size_t peak_bin(const Spectrum& s, float& magnitude) {
    size_t best = 0;
    for (size_t b = 1; b < s.size(); b++) {
        if (s[b] > s[best]) best = b;
    }
    magnitude = s[best];
    return best;
}

int main() {
    std::cout << "[TEST] Starting Spectrum Test...\n";

    ////////////////////////////////////////////////////////
    // Triple buffer handoff
    ////////////////////////////////////////////////////////

    TripleBuffer<int> tb;
    if (tb.updated()) {
        std::cerr << "[FAIL] Fresh triple buffer should not report an update\n";
        return 1;
    }
    tb.write(1);
    tb.write(2);
    if (!tb.updated() || tb.read() != 2 || tb.updated() || tb.read() != 2) {
        std::cerr << "[FAIL] Reader should get the latest value exactly once as an update\n";
        return 1;
    }

    // Writer and reader never share a slot: values only move forward
    TripleBuffer<std::vector<int>> big(std::vector<int>(64, 0));
    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 1; i <= 100000; i++) {
            std::vector<int>& slot = big.write_slot();
            std::fill(slot.begin(), slot.end(), i);
            big.publish();
        }
        done.store(true);
    });

    int last = 0;
    bool consistent = true;
    while (!done.load() || big.updated()) {
        const std::vector<int>& v = big.read();
        for (int x : v) {
            if (x != v[0]) consistent = false;
        }
        if (v[0] < last) consistent = false;
        last = v[0];
    }
    writer.join();

    if (!consistent || big.read()[0] != 100000) {
        std::cerr << "[FAIL] Triple buffer handed out a torn or stale slot (last " << last << ")\n";
        return 1;
    }
    std::cout << "[PASS] Triple buffer.\n";

    ////////////////////////////////////////////////////////
    // Peak bin detection
    ////////////////////////////////////////////////////////

    auto created = SpectrumInput::create(1, 1000.0f);
    std::unique_ptr<SpectrumInput> input = std::move(created.first);
    SpectrumOutput output = std::move(created.second);
    input->update_sample_rate(fs);

    // Exactly on bin 43
    const size_t target = 43;
    const float freq = bin_frequency(target, fs);
    std::vector<float> tone(48000);
    for (size_t i = 0; i < tone.size(); i++) {
        tone[i] = std::sin(2.0f * pi * freq * (float)i / fs);
    }

    const float* planar[1] = {tone.data()};
    input->compute(planar, tone.size());

    if (!output.updated()) {
        std::cerr << "[FAIL] No spectrum published after one second of input\n";
        return 1;
    }

    float magnitude = 0.0f;
    size_t bin = peak_bin(output.read(), magnitude);
    std::cout << "[INFO] Peak at bin " << bin << " (" << bin_frequency(bin, fs) << " Hz), magnitude " << magnitude << "\n";

    if (bin != target) {
        std::cerr << "[FAIL] Expected the peak at bin " << target << "\n";
        return 1;
    }

    // Hann coherent gain 0.5 times half the amplitude for a real sine
    if (std::abs(magnitude - 0.25f) > 0.02f) {
        std::cerr << "[FAIL] Full scale sine should read about 0.25 after normalization\n";
        return 1;
    }
    std::cout << "[PASS] Peak frequency detector.\n";

    ////////////////////////////////////////////////////////
    // Decay
    ////////////////////////////////////////////////////////

    std::vector<float> silence(48000, 0.0f);
    const float* quiet[1] = {silence.data()};
    input->compute(quiet, silence.size());

    float decayed = output.read()[target];
    float ratio = decayed / magnitude;
    std::cout << "[INFO] Bin " << target << " after 1000 ms of silence: " << ratio << " of peak\n";
    if (!(ratio > 0.15f && ratio < 0.4f)) {
        std::cerr << "[FAIL] Bin should have fallen by about -12dB after the decay time\n";
        return 1;
    }
    std::cout << "[PASS] Spectrum decay.\n";

    ////////////////////////////////////////////////////////
    // Stereo merge and bad input
    ////////////////////////////////////////////////////////

    auto stereo = SpectrumInput::create(2, 100.0f);
    stereo.first->update_sample_rate(fs);

    std::vector<float> interleaved(2 * 8192, 0.0f);
    for (size_t i = 0; i < 8192; i++) {
        interleaved[2 * i + 1] = std::sin(2.0f * pi * freq * (float)i / fs);   // right only
    }
    interleaved[0] = NAN;
    stereo.first->compute_interleaved(interleaved.data(), 8192);

    const Spectrum& merged = stereo.second.read();
    for (float m : merged) {
        if (!std::isfinite(m)) {
            std::cerr << "[FAIL] Non-finite sample leaked into the spectrum\n";
            return 1;
        }
    }
    if (peak_bin(merged, magnitude) != target) {
        std::cerr << "[FAIL] A tone in one channel should show in the merged spectrum\n";
        return 1;
    }

    bool threw = false;
    try {
        SpectrumInput::create(0, 100.0f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[FAIL] Zero channels should throw\n";
        return 1;
    }
    std::cout << "[PASS] Stereo merge and input validation.\n";

    std::cout << "[SUCCESS] All Spectrum Tests Passed.\n";
    return 0;
}
