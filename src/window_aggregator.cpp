#include "window_aggregator.hpp"
#include <algorithm>
#include <cmath>

WindowAggregator::WindowAggregator(double window_length, uint32_t packets_min,
                                   uint32_t samples_size, uint64_t seed)
    : window_length_(window_length), packets_min_(packets_min),
      samples_size_(samples_size), rng_(seed) {
    if (!std::isfinite(window_length) || window_length <= 0.0) {
        throw ConfigError("window_length must be a positive number of seconds");
    }
}

int64_t WindowAggregator::window_id_of(double timestamp) const {
    return static_cast<int64_t>(std::floor(timestamp / window_length_));
}

std::optional<WindowRecord> WindowAggregator::observe(const PacketRecord& pkt) {
    if (pkt.is_malformed() || !timestamp_in_range(pkt.timestamp)) {
        counters_.malformed_skipped++;
        return std::nullopt;
    }

    const int64_t wid = window_id_of(pkt.timestamp);
    if (wid < sealed_below_) {
        counters_.late_dropped++;
        return std::nullopt;
    }

    std::optional<WindowRecord> finished;
    auto it = open_.find(pkt.src_ip);
    if (it != open_.end()) {
        WindowBucket& current = it->second;
        if (wid < current.window_id) {
            counters_.late_dropped++;
            return std::nullopt;
        }
        if (wid > current.window_id) {
            finished = finalize(pkt.src_ip, current);
            open_.erase(it);
            it = open_.end();
        }
    }

    if (it == open_.end()) {
        it = open_.try_emplace(pkt.src_ip, wid, samples_size_).first;
    }

    update_bucket(it->second, pkt);
    counters_.packets_observed++;
    newest_window_ = std::max(newest_window_, wid);
    return finished;
}

void WindowAggregator::update_bucket(WindowBucket& bucket, const PacketRecord& pkt) {
    if (bucket.pkts == 0) {
        bucket.first_ts = pkt.timestamp;
        bucket.last_ts = pkt.timestamp;
        bucket.size_min = pkt.length;
        bucket.size_max = pkt.length;
    } else {
        // Slight reordering inside a window must not yield negative gaps
        double gap = pkt.timestamp - bucket.last_ts;
        bucket.arrivals.add(gap > 0.0 ? gap : 0.0);
        bucket.last_ts = std::max(bucket.last_ts, pkt.timestamp);
        bucket.size_min = std::min(bucket.size_min, pkt.length);
        bucket.size_max = std::max(bucket.size_max, pkt.length);
    }

    bucket.pkts++;
    bucket.bytes += pkt.length;
    bucket.sizes.add(static_cast<double>(pkt.length));
    bucket.proto_counts[static_cast<size_t>(pkt.protocol)]++;
    if (pkt.is_fragment) {
        bucket.frag_count++;
    }
    bucket.hdr_ratio_sum += static_cast<double>(pkt.header_length) / static_cast<double>(pkt.length);

    if (pkt.src_port) {
        bucket.port_samples.add(*pkt.src_port, rng_);
        bucket.unique_ports.insert(*pkt.src_port);
    }
    bucket.connections[pkt.connection_key()]++;
}

std::optional<WindowRecord> WindowAggregator::finalize(const std::string& src_ip, const WindowBucket& bucket) {
    if (bucket.pkts < packets_min_) {
        counters_.windows_discarded++;
        return std::nullopt;
    }
    counters_.windows_finalized++;
    return build_record(src_ip, bucket);
}

WindowRecord WindowAggregator::build_record(const std::string& src_ip, const WindowBucket& bucket) const {
    WindowRecord rec;
    const double pkts = static_cast<double>(bucket.pkts);

    rec.src_ip = src_ip;
    rec.window_id = bucket.window_id;
    rec.window_start = static_cast<double>(bucket.window_id) * window_length_;
    rec.window_end = static_cast<double>(bucket.window_id + 1) * window_length_;
    rec.first_packet_ts = bucket.first_ts;
    rec.last_packet_ts = bucket.last_ts;

    rec.pkts_total = bucket.pkts;
    rec.bytes_total = bucket.bytes;
    rec.pkt_rate = pkts / window_length_;
    rec.byte_rate = static_cast<double>(bucket.bytes) / window_length_;

    rec.pkt_arrivals_avg = bucket.arrivals.mean();
    rec.pkt_arrivals_std = bucket.arrivals.stddev();
    rec.pkt_size_min = bucket.size_min;
    rec.pkt_size_max = bucket.size_max;
    rec.pkt_size_avg = bucket.sizes.mean();
    rec.pkt_size_std = bucket.sizes.stddev();

    rec.tcp_pkt_count = bucket.proto_counts[static_cast<size_t>(TransportProtocol::TCP)];
    rec.udp_pkt_count = bucket.proto_counts[static_cast<size_t>(TransportProtocol::UDP)];
    rec.icmp_pkt_count = bucket.proto_counts[static_cast<size_t>(TransportProtocol::ICMP)];
    rec.arp_pkt_count = bucket.proto_counts[static_cast<size_t>(TransportProtocol::ARP)];
    rec.other_pkt_count = bucket.proto_counts[static_cast<size_t>(TransportProtocol::OTHER)];

    if (bucket.pkts > 0) {
        rec.proto_tcp_share = static_cast<double>(rec.tcp_pkt_count) / pkts;
        rec.proto_udp_share = static_cast<double>(rec.udp_pkt_count) / pkts;
        rec.proto_icmp_share = static_cast<double>(rec.icmp_pkt_count) / pkts;
        rec.proto_arp_share = static_cast<double>(rec.arp_pkt_count) / pkts;
        rec.proto_other_share = static_cast<double>(rec.other_pkt_count) / pkts;
        rec.pkts_frag_share = static_cast<double>(bucket.frag_count) / pkts;
        rec.hdrs_payload_ratio_avg = bucket.hdr_ratio_sum / pkts;
    }

    rec.port_src_unique = static_cast<uint32_t>(bucket.unique_ports.size());
    rec.port_src_entropy = shannon_entropy(bucket.port_samples.samples());
    rec.conn_pkts_avg = bucket.connections.empty()
        ? 0.0 : pkts / static_cast<double>(bucket.connections.size());
    rec.pkts_frag_count = bucket.frag_count;

    return rec;
}

std::vector<WindowRecord> WindowAggregator::finalize_where(int64_t below_id) {
    std::vector<std::string> due;
    for (const auto& [src, bucket] : open_) {
        if (bucket.window_id < below_id) {
            due.push_back(src);
        }
    }
    std::sort(due.begin(), due.end());

    std::vector<WindowRecord> records;
    for (const auto& src : due) {
        auto it = open_.find(src);
        auto rec = finalize(src, it->second);
        if (rec) {
            records.push_back(std::move(*rec));
        }
        open_.erase(it);
    }
    return records;
}

std::vector<WindowRecord> WindowAggregator::expire(double now) {
    const int64_t below = window_id_of(now);
    if (below <= sealed_below_) {
        return {};
    }
    sealed_below_ = below;
    return finalize_where(below);
}

std::vector<WindowRecord> WindowAggregator::flush() {
    if (open_.empty()) {
        return {};
    }
    // Everything seen so far is closed; later packets for these ids are late
    sealed_below_ = std::max(sealed_below_, newest_window_ + 1);
    return finalize_where(INT64_MAX);
}

WindowAggregator::Counters WindowAggregator::counters() const {
    Counters c = counters_;
    c.open_buckets = open_.size();
    return c;
}
