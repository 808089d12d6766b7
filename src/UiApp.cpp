#include "UiApp.hpp"

#include <iostream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <SDL.h>
#include <SDL_opengl.h>
#include "imgui.h"
#include "implot.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_opengl3.h"
#include "Units.hpp"


static void BuildTimeAxis(std::vector<float>& x_time, size_t n, float duration) {
    x_time.resize(n);
    for (size_t i = 0; i < n; i++) {
        x_time[i] = -duration + duration * (float)i / (float)std::max<size_t>(n - 1, 1);
    }
}

static void ToDb(std::vector<float>& values, float floor_db) {
    for (float& v : values) v = linear_to_db(v, floor_db);
}

// Graph width follows the window, one value per pixel
static size_t PlotWidth() {
    float w = ImGui::GetContentRegionAvail().x;
    return (size_t)std::max(w, 16.0f);
}


bool UiApp::Run(const UiAppConfig& cfg, UiViews& views) {

    // SDL + GL Initialize
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "[FAIL] SDL_Init: " << SDL_GetError() << std::endl;
        return false;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "vizbus",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 800,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);

    if (!window) {
        std::cerr << "[FAIL] SDL_CreateWindow: " << SDL_GetError() << std::endl;
        SDL_Quit();
        return false;
    }

    SDL_GLContext gl_ctx = SDL_GL_CreateContext(window);
    SDL_GL_MakeCurrent(window, gl_ctx);
    SDL_GL_SetSwapInterval(1); // vsync

    // ImGui + ImPlot init
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGui::StyleColorsDark();

    ImGui_ImplSDL2_InitForOpenGL(window, gl_ctx);
    ImGui_ImplOpenGL3_Init("#version 330");

    // Visualizers receive data only while the window is up
    cfg.ui_open->store(true);

    std::vector<MinMax> wave;
    std::vector<float> wave_min, wave_max;
    std::vector<float> peak, rms;
    std::vector<float> hist, hist_x, hist_edges;
    std::vector<StereoFrame> points;
    std::vector<float> points_x, points_y;
    std::vector<float> x_time;
    std::vector<float> x_freq(kSpectrumBins);
    std::vector<float> spec_db(kSpectrumBins);

    for (size_t b = 0; b < kSpectrumBins; b++) {
        x_freq[b] = std::max(bin_frequency(b, cfg.sample_rate), 1.0f);
    }

    float db_min = -60.0f;
    float db_max = 6.0f;
    float decay_ms = 50.0f;
    bool quit = false;

    const float rot = std::sqrt(0.5f);  // 45 degrees, mono on the vertical axis

    while (!quit) {
        // Events
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);
            if (e.type == SDL_QUIT) quit = true;
            if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE) quit = true;
        }

        // New frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        // ---- Controls ----
        ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(260, 800), ImGuiCond_FirstUseEver);
        ImGui::Begin("Controls");

        ImGui::Text("Sample rate: %.0f Hz", cfg.sample_rate);
        ImGui::Text("History: %.1f s", cfg.duration);
        if (cfg.dropped) {
            ImGui::Text("Dropped frames: %llu", (unsigned long long)cfg.dropped());
        }

        ImGui::Separator();
        ImGui::SliderFloat("dB min", &db_min, -120.0f, 0.0f);
        ImGui::SliderFloat("dB max", &db_max, -60.0f, 24.0f);
        if (ImGui::SliderFloat("Decay (ms)", &decay_ms, 1.0f, 1000.0f)) {
            views.peak->with_accumulator([&](PeakAccumulator& acc) { acc.set_decay(decay_ms); });
            views.minima->with_accumulator([&](MinimumAccumulator& acc) { acc.set_decay(decay_ms); });
            views.histogram->set_decay(decay_ms * 20.0f);
        }

        // ---- Correlation ----
        ImGui::Separator();
        float c = views.correlation->latest();
        ImGui::Text("Correlation: %+.2f", c);
        ImGui::ProgressBar(0.5f * (c + 1.0f), ImVec2(-1, 0), "");

        ImGui::Text("Gain floor: %.1f dB", linear_to_db(views.minima->latest()));

        // ---- Lissajous ----
        views.lissajous->linearize(points);
        points_x.resize(points.size());
        points_y.resize(points.size());
        for (size_t i = 0; i < points.size(); i++) {
            float l = std::clamp(points[i][0], -1.0f, 1.0f);
            float r = std::clamp(points[i][1], -1.0f, 1.0f);
            points_x[i] = (l - r) * rot;
            points_y[i] = (l + r) * rot;
        }

        if (ImPlot::BeginPlot("##Lissajous", ImVec2(-1, 240), ImPlotFlags_Equal)) {
            ImPlot::SetupAxes(nullptr, nullptr, ImPlotAxisFlags_NoDecorations, ImPlotAxisFlags_NoDecorations);
            ImPlot::SetupAxesLimits(-1.5, 1.5, -1.5, 1.5, ImGuiCond_Always);
            ImPlot::SetNextMarkerStyle(ImPlotMarker_Circle, 1.0f);
            ImPlot::PlotScatter("L/R", points_x.data(), points_y.data(), (int)points_x.size());
            ImPlot::EndPlot();
        }

        ImGui::End();

        // ---- Graphs ----
        ImGui::SetNextWindowPos(ImVec2(260, 0), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(1020, 800), ImGuiCond_FirstUseEver);
        ImGui::Begin("Signal");

        size_t width = PlotWidth();
        views.waveform->set_size(width);
        views.peak->set_size(width);
        views.rms->set_size(width);
        views.minima->set_size(width);
        views.correlation->set_size(width);

        views.waveform->linearize(wave);
        wave_min.resize(wave.size());
        wave_max.resize(wave.size());
        for (size_t i = 0; i < wave.size(); i++) {
            wave_min[i] = wave[i].first;
            wave_max[i] = wave[i].second;
        }

        views.peak->linearize(peak);
        views.rms->linearize(rms);
        ToDb(peak, db_min);
        ToDb(rms, db_min);

        if (ImPlot::BeginPlot("Waveform", ImVec2(-1, 180))) {
            ImPlot::SetupAxes("s", nullptr);
            ImPlot::SetupAxisLimits(ImAxis_Y1, -1.0, 1.0, ImGuiCond_Always);
            BuildTimeAxis(x_time, wave.size(), cfg.duration);
            ImPlot::SetupAxisLimits(ImAxis_X1, -cfg.duration, 0.0, ImGuiCond_Always);
            ImPlot::PlotShaded("min/max", x_time.data(), wave_min.data(), wave_max.data(), (int)wave.size());
            ImPlot::EndPlot();
        }

        if (ImPlot::BeginPlot("Peak / RMS", ImVec2(-1, 180))) {
            ImPlot::SetupAxes("s", "dB");
            ImPlot::SetupAxisLimits(ImAxis_Y1, db_min, db_max, ImGuiCond_Always);
            BuildTimeAxis(x_time, peak.size(), cfg.duration);
            ImPlot::SetupAxisLimits(ImAxis_X1, -cfg.duration, 0.0, ImGuiCond_Always);
            ImPlot::PlotLine("Peak", x_time.data(), peak.data(), (int)peak.size());
            if (rms.size() == peak.size()) {
                ImPlot::PlotLine("RMS", x_time.data(), rms.data(), (int)rms.size());
            }
            ImPlot::EndPlot();
        }

        // ---- Spectrum ----
        const Spectrum& spec = views.spectrum->read();
        for (size_t b = 0; b < kSpectrumBins; b++) {
            spec_db[b] = linear_to_db(spec[b], -120.0f);
        }

        if (ImPlot::BeginPlot("Spectrum", ImVec2(-1, 200))) {
            ImPlot::SetupAxes("Hz", "dB");
            ImPlot::SetupAxisScale(ImAxis_X1, ImPlotScale_Log10);
            ImPlot::SetupAxisLimits(ImAxis_X1, 20.0, cfg.sample_rate / 2.0, ImGuiCond_Always);
            ImPlot::SetupAxisLimits(ImAxis_Y1, -120.0, 0.0, ImGuiCond_Always);
            // Skip DC, it has no place on a log axis
            ImPlot::PlotLine("Spectrum", x_freq.data() + 1, spec_db.data() + 1, (int)kSpectrumBins - 1);
            ImPlot::EndPlot();
        }

        // ---- Histogram, normalized to the largest bin ----
        views.histogram->linearize(hist);
        float largest = hist.empty() ? 0.0f : *std::max_element(hist.begin(), hist.end());
        if (largest > 0.0f) {
            for (float& h : hist) h /= largest;
        }

        if (ImPlot::BeginPlot("Level histogram", ImVec2(-1, -1))) {
            ImPlot::SetupAxes("dB", nullptr);
            // Bin i sits between edges i-1 and i; the first and last bins
            // catch everything outside the edge range
            hist_edges = views.histogram->edges();
            float bin_width = hist_edges.size() > 1
                ? (kHistogramMaxDb - kHistogramMinDb) / (float)(hist_edges.size() - 1)
                : 1.0f;
            hist_x.resize(hist.size());
            for (size_t i = 0; i < hist.size() && !hist_edges.empty(); i++) {
                if (i == 0) {
                    hist_x[i] = linear_to_db(hist_edges.front()) - 0.5f * bin_width;
                } else if (i >= hist_edges.size()) {
                    hist_x[i] = linear_to_db(hist_edges.back()) + 0.5f * bin_width;
                } else {
                    hist_x[i] = 0.5f * (linear_to_db(hist_edges[i - 1]) + linear_to_db(hist_edges[i]));
                }
            }
            ImPlot::SetupAxisLimits(ImAxis_X1, kHistogramMinDb - bin_width, kHistogramMaxDb + bin_width, ImGuiCond_Always);
            ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.05, ImGuiCond_Always);
            ImPlot::PlotBars("Level", hist_x.data(), hist.data(), (int)hist.size(), bin_width);
            ImPlot::EndPlot();
        }

        ImGui::End();

        // Render
        ImGui::Render();
        int w, h;
        SDL_GetWindowSize(window, &w, &h);
        glViewport(0, 0, w, h);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    cfg.ui_open->store(false);

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();

    SDL_GL_DeleteContext(gl_ctx);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return true;
}
