#ifndef MITIGATION_ENGINE_H
#define MITIGATION_ENGINE_H

#include <string>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <list>
#include <memory>
#include <vector>
#include <optional>
#include <atomic>
#include <cstdint>
#include "lru_map.hpp"

enum class Verdict : std::uint8_t {
    ALLOW = 0,
    DENY = 1
};

// Per-source mitigation counters
struct SourceStats {
    double first_seen = -1.0;       // stream time of the first packet, negative until seen
    double detected_after = -1.0;   // seconds from first packet to first detection, negative if never
    uint64_t detections_pos = 0;
    uint64_t detections_neg = 0;
    uint64_t pkts_allowed = 0;
    uint64_t pkts_denied = 0;
    double last_score = 0.0;
    bool denylisted = false;
};

// Central allow/deny enforcement. A source moves from monitored to denylisted
// on its first anomalous classification and stays there; the only way back
// is eviction when the bounded denylist must admit a newer detection.
//
// Monitored sources are spread over STATS_STRIPES independently locked LRU
// maps so allowed packets of different sources rarely share a lock. Each
// stripe holds ceil(max_tracked_sources / STATS_STRIPES) sources.
//
// Lock order: denylist_mutex_ before a stripe mutex. At most one stripe
// mutex is held at a time.
class MitigationEngine {
public:
    static constexpr size_t STATS_STRIPES = 16;

    explicit MitigationEngine(size_t denylist_size = 1000000, size_t max_tracked_sources = 0);

    MitigationEngine(const MitigationEngine&) = delete;
    MitigationEngine& operator=(const MitigationEngine&) = delete;

    // Packet path. Denylisted sources only take the shared lock.
    Verdict decide(const std::string& src_ip, double timestamp);

    // Records one classification. detection_time is the stream time the
    // result applies at; it sets detected_after on the first positive one.
    void apply_classification(const std::string& src_ip, bool anomalous,
                              double detection_time, double score = 0.0);

    bool is_denylisted(const std::string& src_ip) const;
    std::optional<SourceStats> get_stats(const std::string& src_ip) const;

    // Every tracked source, ordered by address
    std::vector<std::pair<std::string, SourceStats>> snapshot() const;
    // Denylisted sources, oldest detection first
    std::vector<std::string> get_denylisted_sources() const;
    size_t get_denylist_count() const;
    size_t get_denylist_capacity() const { return denylist_size; }

    struct Metrics {
        size_t denylisted_sources;
        size_t monitored_sources;
        uint64_t pkts_allowed;
        uint64_t pkts_denied;
        uint64_t detections_pos;
        uint64_t detections_neg;
        uint64_t denylist_evictions;
    };
    Metrics get_metrics() const;

private:
    struct DenyEntry {
        SourceStats stats;                      // guarded by the exclusive lock
        std::atomic<uint64_t> pkts_denied{0};   // bumped under the shared lock
        std::list<std::string>::iterator order_it;
    };

    struct StatsStripe {
        explicit StatsStripe(size_t capacity) : sources(capacity) {}
        std::mutex mutex;
        LruMap<std::string, SourceStats> sources;
    };

    SourceStats export_entry(const DenyEntry& entry) const;
    void evict_oldest_locked();
    StatsStripe& stripe_for(const std::string& src_ip) const;

    size_t denylist_size;

    mutable std::shared_mutex denylist_mutex_;
    std::unordered_map<std::string, DenyEntry> denylist_;
    std::list<std::string> detection_order_;    // front is the oldest detection

    std::vector<std::unique_ptr<StatsStripe>> stripes_;

    std::atomic<uint64_t> pkts_allowed_total{0};
    std::atomic<uint64_t> pkts_denied_total{0};
    std::atomic<uint64_t> detections_pos_total{0};
    std::atomic<uint64_t> detections_neg_total{0};
    std::atomic<uint64_t> denylist_evictions{0};
};

const char* verdict_name(Verdict verdict);

#endif // MITIGATION_ENGINE_H
