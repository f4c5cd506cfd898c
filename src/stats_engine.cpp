#include "stats_engine.hpp"
#include "streaming_stats.hpp"
#include "windower_config.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace {
    std::vector<double> column(const std::vector<WindowRecord>& tail,
                               const std::function<double(const WindowRecord&)>& field) {
        std::vector<double> values;
        values.reserve(tail.size());
        for (const auto& rec : tail) {
            values.push_back(field(rec));
        }
        return values;
    }

    // Share of the protocol with the most packets across the tail.
    // Ties resolve TCP, then UDP, then ICMP.
    std::vector<double> dominant_protocol_shares(const std::vector<WindowRecord>& tail) {
        uint64_t tcp = 0;
        uint64_t udp = 0;
        uint64_t icmp = 0;
        for (const auto& rec : tail) {
            tcp += rec.tcp_pkt_count;
            udp += rec.udp_pkt_count;
            icmp += rec.icmp_pkt_count;
        }

        const uint64_t top = std::max({tcp, udp, icmp});
        if (top == tcp) {
            return column(tail, [](const WindowRecord& r) { return r.proto_tcp_share; });
        }
        if (top == udp) {
            return column(tail, [](const WindowRecord& r) { return r.proto_udp_share; });
        }
        return column(tail, [](const WindowRecord& r) { return r.proto_icmp_share; });
    }
}

StatsEngine::StatsEngine(double window_length) : window_length(window_length) {
    if (!std::isfinite(window_length) || window_length <= 0.0) {
        throw ConfigError("window_length must be a positive number of seconds");
    }
}

FeatureVector StatsEngine::summarize(const std::vector<WindowRecord>& tail, uint64_t recorded_span) const {
    FeatureVector fv;
    if (tail.empty()) {
        return fv;
    }

    const WindowRecord& newest = tail.back();
    fv.src_ip = newest.src_ip;
    fv.window_id = newest.window_id;
    fv.emitted_at = newest.window_end;

    fv.window_count = static_cast<uint32_t>(tail.size());
    fv.window_span = static_cast<uint64_t>(newest.window_id - tail.front().window_id + 1);
    if (recorded_span < fv.window_span) {
        recorded_span = fv.window_span;
    }

    const auto pkts = column(tail, [](const WindowRecord& r) { return static_cast<double>(r.pkts_total); });
    const auto bytes = column(tail, [](const WindowRecord& r) { return static_cast<double>(r.bytes_total); });
    const auto arrivals_avg = column(tail, [](const WindowRecord& r) { return r.pkt_arrivals_avg; });
    const auto size_avg = column(tail, [](const WindowRecord& r) { return r.pkt_size_avg; });
    const auto size_std = column(tail, [](const WindowRecord& r) { return r.pkt_size_std; });
    const auto ports_unique = column(tail, [](const WindowRecord& r) { return static_cast<double>(r.port_src_unique); });
    const auto ports_entropy = column(tail, [](const WindowRecord& r) { return r.port_src_entropy; });
    const auto conn_avg = column(tail, [](const WindowRecord& r) { return r.conn_pkts_avg; });
    const auto frag_share = column(tail, [](const WindowRecord& r) { return r.pkts_frag_share; });
    const auto hdr_ratio = column(tail, [](const WindowRecord& r) { return r.hdrs_payload_ratio_avg; });

    // Means
    fv.pkts_total = series_mean(pkts);
    fv.bytes_total = series_mean(bytes);
    fv.pkt_arrivals_avg = series_mean(arrivals_avg);
    fv.pkt_arrivals_std = series_mean(column(tail, [](const WindowRecord& r) { return r.pkt_arrivals_std; }));
    fv.pkt_size_avg = series_mean(size_avg);
    fv.pkt_size_std = series_mean(size_std);
    fv.proto_tcp_share = series_mean(column(tail, [](const WindowRecord& r) { return r.proto_tcp_share; }));
    fv.proto_udp_share = series_mean(column(tail, [](const WindowRecord& r) { return r.proto_udp_share; }));
    fv.proto_icmp_share = series_mean(column(tail, [](const WindowRecord& r) { return r.proto_icmp_share; }));
    fv.proto_arp_share = series_mean(column(tail, [](const WindowRecord& r) { return r.proto_arp_share; }));
    fv.proto_other_share = series_mean(column(tail, [](const WindowRecord& r) { return r.proto_other_share; }));
    fv.port_src_unique = series_mean(ports_unique);
    fv.port_src_entropy = series_mean(ports_entropy);
    fv.conn_pkts_avg = series_mean(conn_avg);
    fv.pkts_frag_share = series_mean(frag_share);
    fv.hdrs_payload_ratio_avg = series_mean(hdr_ratio);

    uint32_t size_min = tail.front().pkt_size_min;
    uint32_t size_max = tail.front().pkt_size_max;
    for (const auto& rec : tail) {
        size_min = std::min(size_min, rec.pkt_size_min);
        size_max = std::max(size_max, rec.pkt_size_max);
    }
    fv.pkt_size_min = static_cast<double>(size_min);
    fv.pkt_size_max = static_cast<double>(size_max);

    // Rates over the covered time, gaps included
    double pkt_sum = 0.0;
    double byte_sum = 0.0;
    for (size_t i = 0; i < tail.size(); ++i) {
        pkt_sum += pkts[i];
        byte_sum += bytes[i];
    }
    const double covered = static_cast<double>(fv.window_span) * window_length;
    fv.pkt_rate = pkt_sum / covered;
    fv.byte_rate = byte_sum / covered;

    // Dispersion across windows
    fv.pkts_total_std = series_stddev(pkts);
    fv.bytes_total_std = series_stddev(bytes);
    fv.pkt_size_avg_std = series_stddev(size_avg);
    fv.pkt_size_std_std = series_stddev(size_std);
    fv.pkt_arrivals_avg_std = series_stddev(arrivals_avg);
    fv.port_src_unique_std = series_stddev(ports_unique);
    fv.port_src_entropy_std = series_stddev(ports_entropy);
    fv.conn_pkts_avg_std = series_stddev(conn_avg);
    fv.pkts_frag_share_std = series_stddev(frag_share);
    fv.hdrs_payload_ratio_avg_std = series_stddev(hdr_ratio);
    fv.dominant_proto_ratio_std = series_stddev(dominant_protocol_shares(tail));

    // Activity estimates. Sparse windows never reach history, so the active
    // window ratio equals window_count / window_span; the time ratio measures
    // how much of each window the source actually spent sending.
    size_t active = 0;
    double active_time = 0.0;
    for (const auto& rec : tail) {
        if (rec.pkts_total > 0) {
            active++;
        }
        active_time += std::max(0.0, rec.last_packet_ts - rec.first_packet_ts);
    }
    fv.intrawindow_activity_ratio = static_cast<double>(active) / static_cast<double>(fv.window_span);
    fv.intrawindow_active_time_ratio =
        active_time / (static_cast<double>(fv.window_count) * window_length);
    fv.interwindow_activity_ratio = static_cast<double>(fv.window_count) / static_cast<double>(recorded_span);

    return fv;
}
