#pragma once

#include <atomic>
#include <memory>
#include <cstdint>
#include <functional>
#include "ValueBuffer.hpp"
#include "HistogramBuffer.hpp"
#include "Spectrum.hpp"

struct UiAppConfig {
    std::atomic<bool>* ui_open;     // audio thread skips sending while false
    float sample_rate;
    float duration;                 // seconds of history in the graphs
    std::function<uint64_t()> dropped;
};

// Buffers the window draws from. All are fed by bus dispatchers.
struct UiViews {
    std::shared_ptr<WaveformBuffer> waveform;
    std::shared_ptr<PeakBuffer> peak;
    std::shared_ptr<RMSBuffer> rms;
    std::shared_ptr<MinimaBuffer> minima;
    std::shared_ptr<HistogramBuffer> histogram;
    std::shared_ptr<FrameBuffer<StereoFrame>> lissajous;
    std::shared_ptr<CorrelationBuffer> correlation;
    SpectrumOutput* spectrum;
};

class UiApp {
public:
    // Blocks until window closes. Returns false if SDL could not open a window.
    static bool Run(const UiAppConfig& cfg, UiViews& views);
};
