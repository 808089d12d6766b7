#include "HistogramBuffer.hpp"

#include <string>
#include <algorithm>
#include <stdexcept>
#include "Units.hpp"

HistogramBuffer::HistogramBuffer(size_t bins, float decay)
    : bins(bins), decay(decay) {
    if (bins == 0) {
        throw std::invalid_argument("Histogram needs at least one bin");
    }
    data.assign(bins, 0.0f);
    update_locked();
}

void HistogramBuffer::set_sample_rate(float sample_rate) {
    std::lock_guard<std::mutex> lock(mtx);
    sample_rate_ = sample_rate;
    update_locked();
    std::fill(data.begin(), data.end(), 0.0f);
}

void HistogramBuffer::set_decay(float decay) {
    std::lock_guard<std::mutex> lock(mtx);
    this->decay = decay;
    update_locked();
}

void HistogramBuffer::resize(size_t bins) {
    if (bins == 0) {
        throw std::invalid_argument("Histogram needs at least one bin");
    }
    std::lock_guard<std::mutex> lock(mtx);
    this->bins = bins;
    data.assign(bins, 0.0f);
    update_locked();
}

void HistogramBuffer::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    std::fill(data.begin(), data.end(), 0.0f);
}

void HistogramBuffer::update_locked() {
    // Linear edge values evenly spaced in the dB domain
    const size_t nr_edges = bins - 1;
    edges_.resize(nr_edges);
    if (nr_edges == 1) {
        edges_[0] = db_to_linear(kHistogramMinDb);
    } else {
        const float step = (kHistogramMaxDb - kHistogramMinDb) / (float)(nr_edges - 1);
        for (size_t i = 0; i < nr_edges; i++) {
            edges_[i] = db_to_linear(kHistogramMinDb + (float)i * step);
        }
    }

    // Per-sample weight so a bin falls by -12dB after decay ms
    double decay_samples = (double)decay / 1000.0 * (double)sample_rate_;
    decay_weight_ = decay_samples > 0.0 ? (float)std::pow(0.25, 1.0 / decay_samples) : 0.0f;
}

size_t HistogramBuffer::find_bin_locked(float value) const {
    // Index of the first edge above value; past the last edge is the last bin
    return (size_t)(std::upper_bound(edges_.begin(), edges_.end(), value) - edges_.begin());
}

size_t HistogramBuffer::find_bin(float value) const {
    std::lock_guard<std::mutex> lock(mtx);
    return find_bin_locked(value);
}

void HistogramBuffer::enqueue(float sample) {
    float value = std::abs(sample);
    // Silence leaves the histogram untouched
    if (value == 0.0f || std::isnan(value)) return;

    std::lock_guard<std::mutex> lock(mtx);
    for (float& bin : data) bin *= decay_weight_;
    data[find_bin_locked(value)] += 1.0f - decay_weight_;
}

void HistogramBuffer::enqueue(const float* samples, size_t count) {
    std::lock_guard<std::mutex> lock(mtx);

    size_t m = 0;
    for (size_t i = 0; i < count; i++) {
        float value = std::abs(samples[i]);
        if (value != 0.0f && !std::isnan(value)) m++;
    }
    if (m == 0) return;

    const float scale = (float)std::pow((double)decay_weight_, (double)m);
    for (float& bin : data) bin *= scale;

    // Newest sample gets the full increment, each older one another factor of decay_weight
    float weight = 1.0f - decay_weight_;
    for (size_t i = count; i-- > 0;) {
        float value = std::abs(samples[i]);
        if (value == 0.0f || std::isnan(value)) continue;
        data[find_bin_locked(value)] += weight;
        weight *= decay_weight_;
    }
}

float HistogramBuffer::operator[](size_t bin) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (bin >= data.size()) {
        throw std::out_of_range("Histogram bin " + std::to_string(bin) +
                                " out of range for size " + std::to_string(data.size()));
    }
    return data[bin];
}

void HistogramBuffer::linearize(std::vector<float>& out) const {
    std::lock_guard<std::mutex> lock(mtx);
    out = data;
}

std::vector<float> HistogramBuffer::edges() const {
    std::lock_guard<std::mutex> lock(mtx);
    return edges_;
}

float HistogramBuffer::decay_weight() const {
    std::lock_guard<std::mutex> lock(mtx);
    return decay_weight_;
}

float HistogramBuffer::sample_rate() const {
    std::lock_guard<std::mutex> lock(mtx);
    return sample_rate_;
}

size_t HistogramBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.size();
}
