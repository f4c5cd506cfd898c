#ifndef STREAMING_STATS_H
#define STREAMING_STATS_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include <random>

// Welford's online mean/variance. Variance is the population variance of the
// values added so far.
class RunningVariance {
public:
    void add(double value);
    void reset();

    uint64_t count() const { return count_; }
    double mean() const { return mean_; }
    double variance() const;
    double stddev() const;

private:
    uint64_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

// Fixed-capacity uniform sample of a value stream (Algorithm R). Once the
// reservoir is full, the i-th value replaces a uniformly chosen slot with
// probability capacity / i. The generator is owned by the caller so that a
// single seeded engine drives every reservoir of a shard.
class PortReservoir {
public:
    explicit PortReservoir(size_t capacity) : capacity_(capacity) { samples_.reserve(capacity); }

    void add(uint16_t value, std::mt19937_64& rng);

    const std::vector<uint16_t>& samples() const { return samples_; }
    uint64_t seen() const { return seen_; }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    uint64_t seen_ = 0;
    std::vector<uint16_t> samples_;
};

// Shannon entropy in bits of the empirical distribution of samples.
// Returns 0 for fewer than two samples. Result lies in [0, log2(distinct)].
double shannon_entropy(const std::vector<uint16_t>& samples);

// Population mean and standard deviation of a series, summed in index order
double series_mean(const std::vector<double>& values);
double series_stddev(const std::vector<double>& values);

#endif // STREAMING_STATS_H
