#include <iostream>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <cmath>

#include "../src/Bus.hpp"
#include "../src/ValueBuffer.hpp"

int main() {
    std::cout << "[TEST] Starting Bus Test...\n";

    ////////////////////////////////////////////////////////
    // Fan-out
    ////////////////////////////////////////////////////////

    MonoBus bus(64);
    std::vector<float> first, second;

    auto h1 = bus.register_dispatcher([&](const std::vector<float>& batch) {
        first.insert(first.end(), batch.begin(), batch.end());
    });
    auto h2 = bus.register_dispatcher([&](const std::vector<float>& batch) {
        second.insert(second.end(), batch.begin(), batch.end());
    });

    const float block[4] = {0.1f, 0.2f, 0.3f, 0.4f};
    bus.send(block, 4);
    size_t drained = bus.update();

    if (drained != 4 || first != second || first.size() != 4 || first[3] != 0.4f) {
        std::cerr << "[FAIL] Every dispatcher should receive the same batch\n";
        return 1;
    }

    // Nothing new: dispatchers are not called
    first.clear();
    if (bus.update() != 0 || !first.empty()) {
        std::cerr << "[FAIL] Empty update should not dispatch\n";
        return 1;
    }
    std::cout << "[PASS] Fan-out to every dispatcher.\n";

    ////////////////////////////////////////////////////////
    // Weak lifetime
    ////////////////////////////////////////////////////////

    h2.reset();
    second.clear();
    bus.send(1.0f);
    bus.update();

    if (!second.empty() || bus.dispatcher_count() != 1) {
        std::cerr << "[FAIL] Dropping the handle should unregister the dispatcher\n";
        return 1;
    }

    // Dead slots are reused
    auto h3 = bus.register_dispatcher([](const std::vector<float>&) {});
    if (bus.dispatcher_count() != 2) {
        std::cerr << "[FAIL] Expected 2 live dispatchers, got " << bus.dispatcher_count() << "\n";
        return 1;
    }
    std::cout << "[PASS] Dispatchers live as long as their handle.\n";

    // A dispatcher may register another one during update
    MonoBus nested(16);
    std::vector<MonoBus::Handle> late;
    auto outer = nested.register_dispatcher([&](const std::vector<float>&) {
        if (late.empty()) late.push_back(nested.register_dispatcher([](const std::vector<float>&) {}));
    });
    nested.send(1.0f);
    nested.update();
    if (nested.dispatcher_count() != 2) {
        std::cerr << "[FAIL] Registering from inside a dispatcher failed\n";
        return 1;
    }
    std::cout << "[PASS] Reentrant registration.\n";

    ////////////////////////////////////////////////////////
    // Summing and stereo
    ////////////////////////////////////////////////////////

    MonoBus summing(16);
    std::vector<float> mono;
    auto hs = summing.register_dispatcher([&](const std::vector<float>& batch) { mono = batch; });

    const float interleaved[6] = {1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f};
    summing.send_summing(interleaved, 3, 2);
    summing.update();
    if (mono != std::vector<float>{0.5f, 0.5f, 0.0f}) {
        std::cerr << "[FAIL] send_summing should average the channels of each frame\n";
        return 1;
    }

    const float left[2] = {1.0f, 0.2f};
    const float right[2] = {0.0f, 0.4f};
    const float* planar[2] = {left, right};
    summing.send_summing(planar, 2, 2);
    summing.update();
    if (mono.size() != 2 || mono[0] != 0.5f || std::abs(mono[1] - 0.3f) > 1e-6f) {
        std::cerr << "[FAIL] Planar send_summing mismatch\n";
        return 1;
    }
    std::cout << "[PASS] Summing to mono.\n";

    auto stereo = std::make_shared<StereoBus>(16);
    std::vector<StereoFrame> frames;
    auto hst = stereo->register_dispatcher([&](const std::vector<StereoFrame>& batch) { frames = batch; });
    stereo->send(left, right, 2);
    stereo->update();
    if (frames.size() != 2 || frames[1] != StereoFrame{0.2f, 0.4f}) {
        std::cerr << "[FAIL] Stereo bus should keep left and right apart\n";
        return 1;
    }

    IntoMonoBus<2> downmixed(stereo);
    std::vector<float> down;
    auto hd = downmixed.register_dispatcher([&](const std::vector<float>& batch) { down = batch; });
    stereo->send(StereoFrame{1.0f, 0.0f});
    stereo->send(StereoFrame{-0.5f, 0.5f});
    downmixed.update();
    if (down != std::vector<float>{0.5f, 0.0f} || frames.size() != 2 || frames[0] != StereoFrame{1.0f, 0.0f}) {
        std::cerr << "[FAIL] IntoMonoBus should downmix while the stereo listener still sees frames\n";
        return 1;
    }

    // Custom downmix: left channel only
    IntoMonoBus<2> left_only(stereo, [](const StereoFrame& f) { return f[0]; });
    auto hl = left_only.register_dispatcher([&](const std::vector<float>& batch) { down = batch; });
    stereo->send(StereoFrame{0.25f, 1.0f});
    left_only.update();
    if (down != std::vector<float>{0.25f}) {
        std::cerr << "[FAIL] Custom downmix not applied\n";
        return 1;
    }
    std::cout << "[PASS] Stereo bus and mono downmix.\n";

    ////////////////////////////////////////////////////////
    // Buffers follow the bus sample rate
    ////////////////////////////////////////////////////////

    auto meters = std::make_shared<MonoBus>(1024);
    auto peak = std::make_shared<PeakBuffer>(10, 1.0f, 100.0f);
    auto handle = connect(*meters, peak);

    meters->send(1.0f);
    meters->update();
    if (!std::isnan(peak->sample_rate())) {
        std::cerr << "[FAIL] Buffer sample rate should stay unknown until the bus has one\n";
        return 1;
    }

    meters->set_sample_rate(100.0f);
    for (int i = 0; i < 100; i++) meters->send(0.5f);
    meters->update();

    std::vector<float> values;
    peak->linearize(values);
    if (peak->sample_rate() != 100.0f || values.size() != 10 || values.back() != 0.5f) {
        std::cerr << "[FAIL] connect() should apply the new rate and fill the buffer\n";
        return 1;
    }

    // Narrower view keeps the newest values, a new time base clears them
    peak->set_size(5);
    peak->linearize(values);
    if (values.size() != 5 || values.front() != 0.5f || peak->latest() != 0.5f) {
        std::cerr << "[FAIL] set_size() should keep the newest values\n";
        return 1;
    }
    peak->set_duration(2.0f);
    peak->linearize(values);
    if (values != std::vector<float>(5, 0.0f)) {
        std::cerr << "[FAIL] set_duration() should clear the buffer\n";
        return 1;
    }

    auto lissajous = std::make_shared<FrameBuffer<StereoFrame>>(4);
    auto hlis = connect(*stereo, lissajous);
    stereo->set_sample_rate(100.0f);
    for (int i = 0; i < 6; i++) stereo->send(StereoFrame{(float)i, -(float)i});
    stereo->update();
    std::vector<StereoFrame> points;
    lissajous->linearize(points);
    if (lissajous->sample_rate() != 100.0f || points.size() != 4 ||
        points.front() != StereoFrame{2.0f, -2.0f} || points.back() != StereoFrame{5.0f, -5.0f}) {
        std::cerr << "[FAIL] FrameBuffer should hold the newest raw frames\n";
        return 1;
    }

    // The bus does not keep the buffer alive
    std::weak_ptr<PeakBuffer> weak_peak = peak;
    peak.reset();
    meters->send(0.5f);
    meters->update();
    if (!weak_peak.expired()) {
        std::cerr << "[FAIL] The bus kept the buffer alive\n";
        return 1;
    }
    std::cout << "[PASS] connect() polls the sample rate and holds buffers weakly.\n";

    ////////////////////////////////////////////////////////
    // Lag and the periodic updater
    ////////////////////////////////////////////////////////

    MonoBus small(8);
    auto hsmall = small.register_dispatcher([](const std::vector<float>&) {});
    for (int i = 0; i < 20; i++) small.send((float)i);
    small.update();
    if (small.dropped() != 12) {
        std::cerr << "[FAIL] Expected 12 dropped frames, got " << small.dropped() << "\n";
        return 1;
    }

    auto ticking = std::make_shared<MonoBus>(4096);
    std::atomic<size_t> seen{0};
    auto ht = ticking->register_dispatcher([&](const std::vector<float>& batch) { seen += batch.size(); });
    {
        BusUpdater updater(ticking, std::chrono::milliseconds(5));
        for (int i = 0; i < 1000; i++) ticking->send(0.0f);
        for (int i = 0; i < 200 && seen.load() < 1000; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    if (seen.load() != 1000) {
        std::cerr << "[FAIL] Updater delivered " << seen.load() << " of 1000 frames\n";
        return 1;
    }
    std::cout << "[PASS] Lag accounting and periodic updater.\n";

    std::cout << "[SUCCESS] All Bus Tests Passed.\n";
    return 0;
}
