#ifndef WINDOWER_CONFIG_H
#define WINDOWER_CONFIG_H

#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

// Raised for out-of-range configuration; fatal at startup
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Centralized engine configuration
struct WindowerConfig {
    // Windowing and history
    double window_length = 0.0;          // seconds, required
    uint32_t history_min = 6;            // windows needed before a source is summarized
    size_t history_size = 0;             // max windows kept per source, 0 = unbounded
    double history_timeout = 120.0;      // seconds, 0 disables the staleness cap
    uint32_t packets_min = 20;           // packets for a window to count as valid
    uint32_t samples_size = 40;          // source-port reservoir per window
    size_t max_tracked_sources = 1000000;

    // Mitigation
    double threshold = 10.0;             // score at or above is anomalous
    size_t denylist_size = 1000000;

    // Scoring
    std::string scorer_type = "zscore";
    std::string model_file;              // empty: vectors are emitted but never classified
    bool async_scoring = true;
    uint32_t scorer_threads = 1;
    size_t scorer_queue_size = 4096;
    uint32_t scorer_timeout_ms = 250;

    // Sharding
    uint32_t shards = 1;
    size_t shard_queue_size = 65536;
    uint64_t random_seed = 42;

    // Output files
    bool use_env_files = true;
    std::string metrics_file = "/var/log/ddos_windower/windower_stats";
    std::string denylist_file = "/var/log/ddos_windower/denylist.log";
    std::string detections_file = "/var/log/ddos_windower/detections.log";
    std::string log_level = "info";

    // Throws ConfigError naming the first offending option
    void validate() const;

    // WINDOWER_METRICS_FILE, WINDOWER_DENYLIST_FILE, WINDOWER_DETECTIONS_FILE
    void applyEnvironmentOverrides();

    std::string describe() const;
    void logConfiguration() const;

    // Absolute, no parent traversal; empty disables the file
    static bool isSafePath(const std::string& path);
};

#endif // WINDOWER_CONFIG_H
