#ifndef WINDOW_RECORD_H
#define WINDOW_RECORD_H

#include <string>
#include <vector>
#include <cstdint>

// Statistics of one source over one finalized window. Immutable once built.
struct WindowRecord {
    std::string src_ip;
    int64_t window_id = 0;
    double window_start = 0.0;       // window_id * window_length
    double window_end = 0.0;         // (window_id + 1) * window_length
    double first_packet_ts = 0.0;
    double last_packet_ts = 0.0;

    uint64_t pkts_total = 0;
    uint64_t bytes_total = 0;
    double pkt_rate = 0.0;           // pkts_total / window_length
    double byte_rate = 0.0;          // bytes_total / window_length

    double pkt_arrivals_avg = 0.0;   // mean inter-arrival time
    double pkt_arrivals_std = 0.0;
    uint32_t pkt_size_min = 0;
    uint32_t pkt_size_max = 0;
    double pkt_size_avg = 0.0;
    double pkt_size_std = 0.0;

    uint64_t tcp_pkt_count = 0;
    uint64_t udp_pkt_count = 0;
    uint64_t icmp_pkt_count = 0;
    uint64_t arp_pkt_count = 0;
    uint64_t other_pkt_count = 0;
    double proto_tcp_share = 0.0;
    double proto_udp_share = 0.0;
    double proto_icmp_share = 0.0;
    double proto_arp_share = 0.0;
    double proto_other_share = 0.0;

    uint32_t port_src_unique = 0;
    double port_src_entropy = 0.0;   // bits, over the sampled ports
    double conn_pkts_avg = 0.0;      // packets per distinct connection key
    uint64_t pkts_frag_count = 0;
    double pkts_frag_share = 0.0;
    double hdrs_payload_ratio_avg = 0.0;  // mean of header_length / length
};

// Inter-window summary of the eligible tail of a source's history.
// This is the row handed to the anomaly scorer.
struct FeatureVector {
    std::string src_ip;
    int64_t window_id = 0;           // window whose finalization produced it
    double emitted_at = 0.0;         // stream time of emission

    uint32_t window_count = 0;
    uint64_t window_span = 0;

    // Means over the tail
    double pkts_total = 0.0;
    double bytes_total = 0.0;
    double pkt_rate = 0.0;
    double byte_rate = 0.0;
    double pkt_arrivals_avg = 0.0;
    double pkt_arrivals_std = 0.0;
    double pkt_size_min = 0.0;
    double pkt_size_max = 0.0;
    double pkt_size_avg = 0.0;
    double pkt_size_std = 0.0;
    double proto_tcp_share = 0.0;
    double proto_udp_share = 0.0;
    double proto_icmp_share = 0.0;
    double proto_arp_share = 0.0;
    double proto_other_share = 0.0;
    double port_src_unique = 0.0;
    double port_src_entropy = 0.0;
    double conn_pkts_avg = 0.0;
    double pkts_frag_share = 0.0;
    double hdrs_payload_ratio_avg = 0.0;

    // Dispersion across the tail
    double pkts_total_std = 0.0;
    double bytes_total_std = 0.0;
    double pkt_size_avg_std = 0.0;
    double pkt_size_std_std = 0.0;
    double pkt_arrivals_avg_std = 0.0;
    double port_src_unique_std = 0.0;
    double port_src_entropy_std = 0.0;
    double conn_pkts_avg_std = 0.0;
    double pkts_frag_share_std = 0.0;
    double hdrs_payload_ratio_avg_std = 0.0;
    double dominant_proto_ratio_std = 0.0;

    double intrawindow_activity_ratio = 0.0;
    // Share of the summarized windows' time between each window's first and last packet
    double intrawindow_active_time_ratio = 0.0;
    double interwindow_activity_ratio = 0.0;

    // Fixed column order of to_row(). Identification columns (source,
    // window_count, window_span) are not part of the row.
    static const std::vector<std::string>& feature_names();
    std::vector<double> to_row() const;

    // Column index of a feature name, -1 if unknown
    static int feature_index(const std::string& name);
};

#endif // WINDOW_RECORD_H
