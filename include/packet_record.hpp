#ifndef PACKET_RECORD_H
#define PACKET_RECORD_H

#include <string>
#include <optional>
#include <cstdint>
#include <cmath>

enum class TransportProtocol : std::uint8_t {
    TCP = 0,
    UDP = 1,
    ICMP = 2,
    ARP = 3,
    OTHER = 4
};

inline const char* transport_protocol_name(TransportProtocol proto) {
    switch (proto) {
        case TransportProtocol::TCP: return "tcp";
        case TransportProtocol::UDP: return "udp";
        case TransportProtocol::ICMP: return "icmp";
        case TransportProtocol::ARP: return "arp";
        default: return "other";
    }
}

// Parsed packet as handed over by the capture layer. Owns its strings, so it
// can be queued across threads after the capture buffer is gone.
struct PacketRecord {
    double timestamp = 0.0;          // seconds, fractional
    uint32_t length = 0;             // whole packet in bytes
    uint32_t header_length = 0;      // L3 + L4 headers in bytes
    std::string src_ip;
    std::string dst_ip;
    std::optional<uint16_t> src_port;
    std::optional<uint16_t> dst_port;
    TransportProtocol protocol = TransportProtocol::OTHER;
    bool is_fragment = false;

    bool is_malformed() const {
        return src_ip.empty() || !std::isfinite(timestamp) || timestamp < 0.0 ||
               length == 0 || header_length > length;
    }

    // Socket pair used to group packets of one transfer
    std::string connection_key() const {
        std::string key;
        key.reserve(src_ip.size() + dst_ip.size() + 20);
        key += src_ip;
        key += ':';
        key += src_port ? std::to_string(*src_port) : "-";
        key += '>';
        key += dst_ip;
        key += ':';
        key += dst_port ? std::to_string(*dst_port) : "-";
        key += '/';
        key += transport_protocol_name(protocol);
        return key;
    }
};

#endif // PACKET_RECORD_H
