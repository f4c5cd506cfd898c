#include "streaming_stats.hpp"
#include <algorithm>
#include <cmath>

void RunningVariance::add(double value) {
    ++count_;
    double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (value - mean_);
}

void RunningVariance::reset() {
    count_ = 0;
    mean_ = 0.0;
    m2_ = 0.0;
}

double RunningVariance::variance() const {
    if (count_ < 2) {
        return 0.0;
    }
    double var = m2_ / static_cast<double>(count_);
    return var > 0.0 ? var : 0.0;  // rounding can push m2_ slightly negative
}

double RunningVariance::stddev() const {
    return std::sqrt(variance());
}

void PortReservoir::add(uint16_t value, std::mt19937_64& rng) {
    ++seen_;
    if (capacity_ == 0) {
        return;
    }
    if (samples_.size() < capacity_) {
        samples_.push_back(value);
        return;
    }

    std::uniform_int_distribution<uint64_t> slot(0, seen_ - 1);
    uint64_t j = slot(rng);
    if (j < capacity_) {
        samples_[static_cast<size_t>(j)] = value;
    }
}

double shannon_entropy(const std::vector<uint16_t>& samples) {
    if (samples.size() < 2) {
        return 0.0;
    }

    // Sorted copy gives a stable accumulation order independent of hashing
    std::vector<uint16_t> sorted(samples);
    std::sort(sorted.begin(), sorted.end());

    const double total = static_cast<double>(sorted.size());
    double entropy = 0.0;
    size_t run_start = 0;
    for (size_t i = 1; i <= sorted.size(); ++i) {
        if (i == sorted.size() || sorted[i] != sorted[run_start]) {
            double p = static_cast<double>(i - run_start) / total;
            entropy -= p * std::log2(p);
            run_start = i;
        }
    }

    return entropy > 0.0 ? entropy : 0.0;
}

double series_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double series_stddev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = series_mean(values);
    double sq = 0.0;
    for (double v : values) {
        double d = v - mean;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(values.size()));
}
