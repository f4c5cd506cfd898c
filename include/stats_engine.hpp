#ifndef STATS_ENGINE_H
#define STATS_ENGINE_H

#include <vector>
#include <cstdint>
#include "window_record.hpp"

// Computes the inter-window feature vector of a history tail. Stateless apart
// from the window length, so one engine can be shared by every shard.
class StatsEngine {
public:
    // Throws ConfigError unless window_length is a positive finite number
    explicit StatsEngine(double window_length);

    // Pure: the same tail always yields a bit-identical vector. Sums are taken
    // in index order and deviations use a two-pass population formula.
    // recorded_span is the span of the source's whole retained history and
    // defaults to the tail's own span.
    [[nodiscard]] FeatureVector summarize(const std::vector<WindowRecord>& tail,
                                          uint64_t recorded_span = 0) const;

    double get_window_length() const { return window_length; }

private:
    double window_length;
};

#endif // STATS_ENGINE_H
