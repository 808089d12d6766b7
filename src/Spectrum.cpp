#include "Spectrum.hpp"

#include <cmath>
#include <new>
#include <stdexcept>

namespace {
constexpr size_t kHop = kSpectrumWindowSize / kSpectrumOverlap;
}

std::pair<std::unique_ptr<SpectrumInput>, SpectrumOutput> SpectrumInput::create(size_t num_channels, float decay) {
    auto buffer = std::make_shared<TripleBuffer<Spectrum>>();
    std::unique_ptr<SpectrumInput> input(new SpectrumInput(num_channels, decay, buffer));
    return {std::move(input), SpectrumOutput(buffer)};
}

SpectrumInput::SpectrumInput(size_t num_channels, float decay, std::shared_ptr<TripleBuffer<Spectrum>> output)
    : num_channels_(num_channels), decay(decay),
      window(kSpectrumWindowSize),
      history(num_channels * kSpectrumWindowSize, 0.0f),
      until_hop(kHop),
      output(std::move(output))
{
    if (num_channels == 0) {
        throw std::invalid_argument("Spectrum needs at least one channel");
    }

    const size_t N = kSpectrumWindowSize;
    for (size_t n = 0; n < N; ++n) {
        float hann = 0.5f - 0.5f * std::cos(2.0f * 3.141592654f * n / (N - 1));
        window[n] = hann / (float)N;
    }

    in = (float*)fftwf_malloc(sizeof(float) * N);
    out = (fftwf_complex*)fftwf_malloc(sizeof(fftwf_complex) * kSpectrumBins);
    if (!in || !out) {
        fftwf_free(in);
        fftwf_free(out);
        throw std::bad_alloc();
    }

    plan = fftwf_plan_dft_r2c_1d((int)N, in, out, FFTW_MEASURE);
    if (!plan) {
        fftwf_free(in);
        fftwf_free(out);
        throw std::runtime_error("fftwf_plan_dft_r2c_1d failed");
    }
}

SpectrumInput::~SpectrumInput() {
    fftwf_destroy_plan(plan);
    fftwf_free(in);
    fftwf_free(out);
}

void SpectrumInput::update_sample_rate(float sample_rate) {
    this->sample_rate = sample_rate;

    // The smoothing runs once per hop and per channel, not once per sample
    double effective_sample_rate = (double)sample_rate / kSpectrumWindowSize
                                 * kSpectrumOverlap * (double)num_channels_;
    double decay_samples = (double)decay / 1000.0 * effective_sample_rate;

    smoothing_decay_weight = decay_samples > 0.0 ? (float)std::pow(0.25, 1.0 / decay_samples) : 0.0f;
}

void SpectrumInput::set_decay(float decay) {
    this->decay = decay;
    update_sample_rate(sample_rate);
}

void SpectrumInput::compute(const float* const* channels, size_t num_samples) {
    for (size_t i = 0; i < num_samples; i++) {
        for (size_t ch = 0; ch < num_channels_; ch++) {
            history[ch * kSpectrumWindowSize + pos] = channels[ch][i];
        }
        advance();
    }
}

void SpectrumInput::compute_interleaved(const float* interleaved, size_t frames) {
    for (size_t i = 0; i < frames; i++) {
        const float* frame = interleaved + i * num_channels_;
        for (size_t ch = 0; ch < num_channels_; ch++) {
            history[ch * kSpectrumWindowSize + pos] = frame[ch];
        }
        advance();
    }
}

void SpectrumInput::advance() {
    pos = (pos + 1) % kSpectrumWindowSize;

    if (--until_hop > 0) return;
    until_hop = kHop;

    for (size_t ch = 0; ch < num_channels_; ch++) {
        analyze(ch);
    }
    output->write(result);
}

void SpectrumInput::analyze(size_t channel) {
    const size_t N = kSpectrumWindowSize;
    const float* src = &history[channel * N];

    // Oldest sample first: pos is the next write position
    for (size_t k = 0; k < N; ++k) {
        in[k] = src[(pos + k) % N] * window[k];
    }

    fftwf_execute(plan);

    // Peak meter ballistics per bin, which also merges the channels
    const float w = smoothing_decay_weight;
    for (size_t b = 0; b < kSpectrumBins; ++b) {
        float re = out[b][0];
        float im = out[b][1];
        float magnitude = std::sqrt(re * re + im * im);
        if (!std::isfinite(magnitude)) magnitude = 0.0f;

        if (magnitude > result[b]) {
            result[b] = magnitude;
        } else {
            result[b] = result[b] * w + magnitude * (1.0f - w);
        }
    }
}
