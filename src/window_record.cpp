#include "window_record.hpp"

const std::vector<std::string>& FeatureVector::feature_names() {
    static const std::vector<std::string> names = {
        "pkts_total", "bytes_total", "pkt_rate", "byte_rate",
        "pkt_arrivals_avg", "pkt_arrivals_std",
        "pkt_size_min", "pkt_size_max", "pkt_size_avg", "pkt_size_std",
        "proto_tcp_share", "proto_udp_share", "proto_icmp_share", "proto_arp_share", "proto_other_share",
        "port_src_unique", "port_src_entropy", "conn_pkts_avg",
        "pkts_frag_share", "hdrs_payload_ratio_avg",
        "pkts_total_std", "bytes_total_std", "pkt_size_avg_std", "pkt_size_std_std",
        "pkt_arrivals_avg_std", "port_src_unique_std", "port_src_entropy_std",
        "conn_pkts_avg_std", "pkts_frag_share_std", "hdrs_payload_ratio_avg_std",
        "dominant_proto_ratio_std",
        "intrawindow_activity_ratio", "intrawindow_active_time_ratio", "interwindow_activity_ratio"
    };
    return names;
}

std::vector<double> FeatureVector::to_row() const {
    return {
        pkts_total, bytes_total, pkt_rate, byte_rate,
        pkt_arrivals_avg, pkt_arrivals_std,
        pkt_size_min, pkt_size_max, pkt_size_avg, pkt_size_std,
        proto_tcp_share, proto_udp_share, proto_icmp_share, proto_arp_share, proto_other_share,
        port_src_unique, port_src_entropy, conn_pkts_avg,
        pkts_frag_share, hdrs_payload_ratio_avg,
        pkts_total_std, bytes_total_std, pkt_size_avg_std, pkt_size_std_std,
        pkt_arrivals_avg_std, port_src_unique_std, port_src_entropy_std,
        conn_pkts_avg_std, pkts_frag_share_std, hdrs_payload_ratio_avg_std,
        dominant_proto_ratio_std,
        intrawindow_activity_ratio, intrawindow_active_time_ratio, interwindow_activity_ratio
    };
}

int FeatureVector::feature_index(const std::string& name) {
    const auto& names = feature_names();
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}
