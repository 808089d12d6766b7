#include <iostream>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <csignal>
#include <string>
#include <vector>
#include <algorithm>
#include <portaudio.h>
#include "AudioFile.h"
#include "Bus.hpp"
#include "ValueBuffer.hpp"
#include "HistogramBuffer.hpp"
#include "Spectrum.hpp"
#include "Units.hpp"
#include "UiApp.hpp"


static std::atomic<bool> g_stop_requested{false};
static std::atomic<uint64_t> g_callback_overruns{0};

// Visualizers only need data while something is looking at them
static std::atomic<bool> g_ui_open{false};

struct AppConfig {
    std::string file;               // empty: capture from the default input
    unsigned long frames_per_buffer = 512;
    float sample_rate = 48000.0f;
    float duration = 5.0f;          // seconds of history in the graphs
    float decay = 50.0f;            // peak / minimum release, ms to -12dB
    float histogram_decay = 2000.0f;
    float rms_window = 300.0f;
    float correlation_window = 300.0f;
    size_t bins = 120;
    double headless = 0.0;          // > 0: no window, log for this many seconds
};

// Context struct for the PortAudio callback
struct AudioContext {
    MonoBus* mono;
    StereoBus* stereo;
    SpectrumInput* spectrum;
    size_t channels;

    const AudioFile<float>* wav;    // playback source, or null when capturing
    size_t wav_pos = 0;
};

// Publish one interleaved block to every visualizer
static void analyze(AudioContext* ctx, const float* data, unsigned long frames) {
    if (!g_ui_open.load(std::memory_order_relaxed)) return;

    ctx->mono->send_summing(data, frames, ctx->channels);
    ctx->stereo->send_interleaved(data, frames, ctx->channels);
    ctx->spectrum->compute_interleaved(data, frames);
}

// Capture callback
static int paInputCallback(const void* input, void*,
                           unsigned long frameCount,
                           const PaStreamCallbackTimeInfo*,
                           PaStreamCallbackFlags statusFlags,
                           void* userData)
{
    auto* ctx = reinterpret_cast<AudioContext*>(userData);

    if (statusFlags & paInputOverflow) {
        g_callback_overruns.fetch_add(1, std::memory_order_relaxed);
    }

    if (input) {
        analyze(ctx, (const float*)input, frameCount);
    }
    return paContinue;
}

// Playback callback, loops the file
static int paOutputCallback(const void*, void* output,
                            unsigned long frameCount,
                            const PaStreamCallbackTimeInfo*,
                            PaStreamCallbackFlags statusFlags,
                            void* userData)
{
    auto* ctx = reinterpret_cast<AudioContext*>(userData);
    float* out = (float*)output;

    if (statusFlags & paOutputUnderflow) {
        g_callback_overruns.fetch_add(1, std::memory_order_relaxed);
    }

    const auto& samples = ctx->wav->samples;
    const size_t length = samples.empty() ? 0 : samples[0].size();
    const size_t file_channels = samples.size();

    for (unsigned long i = 0; i < frameCount; i++) {
        for (size_t ch = 0; ch < ctx->channels; ch++) {
            // Mono files are played on both sides
            size_t src = std::min(ch, file_channels - 1);
            out[i * ctx->channels + ch] = length ? samples[src][ctx->wav_pos] : 0.0f;
        }
        if (length && ++ctx->wav_pos == length) ctx->wav_pos = 0;
    }

    analyze(ctx, out, frameCount);
    return paContinue;
}


//Ctrl-C signal handler
void ctrlC_Invoked(int)
{
    g_stop_requested.store(true, std::memory_order_relaxed);
}


static void usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--stream | --file <path.wav>] [--buffer <frames>]\n"
              << "       [--duration <s>] [--decay <ms>] [--bins <n>] [--headless <s>]" << std::endl;
}

static bool parse_args(int argc, char* argv[], AppConfig& cfg) {
    for (int i = 1; i < argc; i++) {
        bool has_value = i + 1 < argc;

        if (std::strcmp(argv[i], "--stream") == 0) cfg.file.clear();
        else if (std::strcmp(argv[i], "--file") == 0 && has_value) cfg.file = argv[++i];
        else if (std::strcmp(argv[i], "--buffer") == 0 && has_value) cfg.frames_per_buffer = std::strtoul(argv[++i], nullptr, 10);
        else if (std::strcmp(argv[i], "--duration") == 0 && has_value) cfg.duration = std::strtof(argv[++i], nullptr);
        else if (std::strcmp(argv[i], "--decay") == 0 && has_value) cfg.decay = std::strtof(argv[++i], nullptr);
        else if (std::strcmp(argv[i], "--bins") == 0 && has_value) cfg.bins = std::strtoul(argv[++i], nullptr, 10);
        else if (std::strcmp(argv[i], "--headless") == 0 && has_value) cfg.headless = std::strtod(argv[++i], nullptr);
        else {
            std::cerr << "[FAIL] Unknown or incomplete argument: " << argv[i] << std::endl;
            return false;
        }
    }

    if (cfg.frames_per_buffer == 0 || !(cfg.duration > 0.0f) || !(cfg.decay > 0.0f) || cfg.bins == 0) {
        std::cerr << "[FAIL] --buffer, --duration, --decay and --bins must be positive" << std::endl;
        return false;
    }
    return true;
}


int main(int argc, char* argv[]) {

    // ctrl+c signal handler
    std::signal(SIGINT, ctrlC_Invoked);

    AppConfig app;
    if (!parse_args(argc, argv, app)) {
        usage(argv[0]);
        return 1;
    }

    ////////////////////////////////////////////////////////
    // Audio source
    ////////////////////////////////////////////////////////

    AudioFile<float> wav;
    bool playback = !app.file.empty();

    if (playback) {
        if (!wav.load(app.file) || wav.getNumChannels() == 0) {
            std::cerr << "[FAIL] Could not load " << app.file << std::endl;
            return 1;
        }
        app.sample_rate = (float)wav.getSampleRate();
        std::cout << "[INFO] Playing " << app.file << ": " << wav.getNumChannels() << " ch, "
                  << wav.getSampleRate() << " Hz, " << wav.getLengthInSeconds() << " s" << std::endl;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[FAIL] PortAudio Init Error: " << Pa_GetErrorText(err) << std::endl;
        return 1;
    }

    // Two channels unless the capture device only has one
    size_t channels = 2;
    if (!playback) {
        PaDeviceIndex dev = Pa_GetDefaultInputDevice();
        if (dev == paNoDevice) {
            std::cerr << "[FAIL] No default input device" << std::endl;
            Pa_Terminate();
            return 1;
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(dev);
        channels = std::clamp<size_t>((size_t)info->maxInputChannels, 1, 2);
        std::cout << "[INFO] Capturing from " << info->name << ", " << channels << " ch" << std::endl;
    }

    ////////////////////////////////////////////////////////
    // Buses and visualizers
    ////////////////////////////////////////////////////////

    const size_t bus_capacity = 1 << 15;
    auto mono = std::make_shared<MonoBus>(bus_capacity);
    auto stereo = std::make_shared<StereoBus>(bus_capacity);
    IntoMonoBus<2> downmixed(stereo);

    std::unique_ptr<SpectrumInput> spectrum_in;
    std::unique_ptr<SpectrumOutput> spectrum_out;
    try {
        auto spectrum = SpectrumInput::create(channels, app.decay * 4.0f);
        spectrum_in = std::move(spectrum.first);
        spectrum_out = std::make_unique<SpectrumOutput>(std::move(spectrum.second));
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Spectrum: " << e.what() << std::endl;
        Pa_Terminate();
        return 1;
    }

    const size_t width = 800;
    UiViews views;
    views.waveform = std::make_shared<WaveformBuffer>(width, app.duration);
    views.peak = std::make_shared<PeakBuffer>(width, app.duration, app.decay);
    views.rms = std::make_shared<RMSBuffer>(width, app.duration, app.rms_window);
    views.minima = std::make_shared<MinimaBuffer>(width, app.duration, app.decay);
    views.histogram = std::make_shared<HistogramBuffer>(app.bins, app.histogram_decay);
    views.lissajous = std::make_shared<FrameBuffer<StereoFrame>>(2048);
    views.correlation = std::make_shared<CorrelationBuffer>(width, app.duration, app.correlation_window);
    views.spectrum = spectrum_out.get();

    // Dispatchers stay registered while their handles live
    std::vector<MonoBus::Handle> mono_handles;
    mono_handles.push_back(connect(*mono, views.waveform));
    mono_handles.push_back(connect(*mono, views.peak));
    mono_handles.push_back(connect(*mono, views.rms));
    mono_handles.push_back(connect(*mono, views.minima));

    std::vector<StereoBus::Handle> stereo_handles;
    stereo_handles.push_back(connect(downmixed, views.histogram));
    stereo_handles.push_back(connect(*stereo, views.lissajous));
    stereo_handles.push_back(connect(*stereo, views.correlation));

    AudioContext actx{mono.get(), stereo.get(), spectrum_in.get(), channels, playback ? &wav : nullptr};

    ////////////////////////////////////////////////////////
    // PortAudio stream
    ////////////////////////////////////////////////////////

    PaStream* stream = nullptr;
    err = Pa_OpenDefaultStream(
        &stream,
        playback ? 0 : (int)channels,      // input
        playback ? (int)channels : 0,      // output
        paFloat32,
        app.sample_rate,
        app.frames_per_buffer,
        playback ? paOutputCallback : paInputCallback,
        &actx);
    if (err != paNoError) {
        std::cerr << "[FAIL] PortAudio Open Stream Error: " << Pa_GetErrorText(err) << std::endl;
        Pa_Terminate();
        return 1;
    }

    // The host may not give us the rate we asked for
    const PaStreamInfo* stream_info = Pa_GetStreamInfo(stream);
    float sample_rate = stream_info ? (float)stream_info->sampleRate : app.sample_rate;

    mono->set_sample_rate(sample_rate);
    stereo->set_sample_rate(sample_rate);
    spectrum_in->update_sample_rate(sample_rate);

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        std::cerr << "[FAIL] PortAudio Start Stream Error: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(stream);
        Pa_Terminate();
        return 1;
    }
    std::cout << "[INFO] Stream running at " << sample_rate << " Hz, "
              << app.frames_per_buffer << " frames per buffer" << std::endl;

    bool ui_ok = true;
    auto dropped = [&]() -> uint64_t { return mono->dropped() + stereo->dropped(); };

    {
        // Drain the buses into the visualizers on their own threads
        BusUpdater mono_updater(mono);
        BusUpdater stereo_updater(stereo);

        if (app.headless > 0.0) {
            g_ui_open.store(true);
            std::cout << "[INFO] Headless for " << app.headless << " s. Press Ctrl+C to stop" << std::endl;

            auto start = std::chrono::steady_clock::now();
            while (!g_stop_requested.load(std::memory_order_relaxed)) {
                std::this_thread::sleep_for(std::chrono::seconds(1));

                std::cout << "[INFO] peak " << linear_to_db(views.peak->latest()) << " dB"
                          << "  rms " << linear_to_db(views.rms->latest()) << " dB"
                          << "  corr " << views.correlation->latest()
                          << "  dropped " << dropped()
                          << "  xruns " << g_callback_overruns.load(std::memory_order_relaxed)
                          << std::endl;

                double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                if (elapsed >= app.headless) break;
            }
            g_ui_open.store(false);
        } else {
            UiAppConfig cfg;
            cfg.ui_open = &g_ui_open;
            cfg.sample_rate = sample_rate;
            cfg.duration = app.duration;
            cfg.dropped = dropped;

            ui_ok = UiApp::Run(cfg, views);
        }
    }

    err = Pa_StopStream(stream);
    if (err != paNoError) {
        std::cerr << "[WARN] PortAudio Stop Stream Error: " << Pa_GetErrorText(err) << std::endl;
    }
    Pa_CloseStream(stream);
    Pa_Terminate();

    std::cout << "[INFO] Dropped frames: " << dropped()
              << ", callback over/underruns: " << g_callback_overruns.load() << std::endl;

    return ui_ok ? 0 : 1;
}
