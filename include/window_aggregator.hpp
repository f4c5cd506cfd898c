#ifndef WINDOW_AGGREGATOR_H
#define WINDOW_AGGREGATOR_H

#include <string>
#include <vector>
#include <array>
#include <optional>
#include <random>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include "packet_record.hpp"
#include "streaming_stats.hpp"
#include "window_record.hpp"
#include "windower_config.hpp"

// Accumulates packets into one open window per source and turns each window
// into a WindowRecord once time has moved past it. Owned by a single shard.
class WindowAggregator {
public:
    struct Counters {
        uint64_t packets_observed = 0;
        uint64_t malformed_skipped = 0;
        uint64_t late_dropped = 0;
        uint64_t windows_finalized = 0;
        uint64_t windows_discarded = 0;   // below packets_min
        size_t open_buckets = 0;
    };

    // Throws ConfigError unless window_length is a positive finite number
    WindowAggregator(double window_length, uint32_t packets_min = 20,
                     uint32_t samples_size = 40, uint64_t seed = 42);

    // Window index of the newest representable window. Timestamps beyond it
    // cannot be given an exact id and are skipped as malformed.
    static constexpr double MAX_WINDOW_INDEX = 9007199254740992.0;   // 2^53

    static bool timestamp_in_range(double timestamp, double window_length) {
        return timestamp / window_length < MAX_WINDOW_INDEX;
    }
    bool timestamp_in_range(double timestamp) const {
        return timestamp_in_range(timestamp, window_length_);
    }

    // Adds a packet to its source's open window. Returns the source's previous
    // window when this packet crosses into a later one and that window holds
    // at least packets_min packets.
    [[nodiscard]] std::optional<WindowRecord> observe(const PacketRecord& pkt);

    // Finalizes every open window that ends at or before `now` and seals
    // those window ids. Records come back ordered by source address.
    std::vector<WindowRecord> expire(double now);

    // End of stream: finalizes all open windows with whatever they hold
    std::vector<WindowRecord> flush();

    int64_t window_id_of(double timestamp) const;
    double window_length() const { return window_length_; }
    Counters counters() const;

private:
    struct WindowBucket {
        int64_t window_id;
        uint64_t pkts = 0;
        uint64_t bytes = 0;
        std::array<uint64_t, 5> proto_counts{};
        uint64_t frag_count = 0;
        double hdr_ratio_sum = 0.0;
        uint32_t size_min = 0;
        uint32_t size_max = 0;
        double first_ts = 0.0;
        double last_ts = 0.0;
        RunningVariance sizes;
        RunningVariance arrivals;
        PortReservoir port_samples;
        std::unordered_set<uint16_t> unique_ports;
        std::unordered_map<std::string, uint64_t> connections;

        WindowBucket(int64_t id, size_t samples_size)
            : window_id(id), port_samples(samples_size) {}
    };

    void update_bucket(WindowBucket& bucket, const PacketRecord& pkt);
    std::optional<WindowRecord> finalize(const std::string& src_ip, const WindowBucket& bucket);
    WindowRecord build_record(const std::string& src_ip, const WindowBucket& bucket) const;
    std::vector<WindowRecord> finalize_where(int64_t below_id);

    double window_length_;
    uint32_t packets_min_;
    uint32_t samples_size_;
    std::mt19937_64 rng_;

    std::unordered_map<std::string, WindowBucket> open_;
    int64_t sealed_below_ = INT64_MIN;   // windows below this id are closed for every source
    int64_t newest_window_ = INT64_MIN;

    Counters counters_;
};

#endif // WINDOW_AGGREGATOR_H
