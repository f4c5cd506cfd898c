#ifndef DDOS_WINDOWER_HPP
#define DDOS_WINDOWER_HPP

#include <framework/module.h>
#include <framework/inspector.h>
#include <framework/parameter.h>
#include <framework/value.h>
#include <log/messages.h>
#include <protocols/packet.h>
#include <protocols/ip.h>
#include <protocols/tcp.h>
#include <protocols/udp.h>
#include <main/snort_config.h>
#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <string>
#include <chrono>
#include <cstdint>
#include <thread>
#include <mutex>
#include <unordered_map>
#include "anomaly_scorer.hpp"
#include "packet_record.hpp"
#include "windower_config.hpp"

class MitigationEngine;
class ShardedPipeline;

// Hash specialization for IPv6 address arrays
namespace std {
    template<>
    struct hash<std::array<uint8_t, 16>> {
        size_t operator()(const std::array<uint8_t, 16>& arr) const {
            size_t h = 0;
            for (size_t i = 0; i < 16; ++i) {
                h ^= std::hash<uint8_t>{}(arr[i]) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}

class DdosWindowerModule : public snort::Module
{
public:
    DdosWindowerModule();
    ~DdosWindowerModule() override = default;

    bool set(const char*, snort::Value&, snort::SnortConfig*) override;
    bool begin(const char*, int, snort::SnortConfig*) override;
    bool end(const char*, int, snort::SnortConfig*) override;

    Usage get_usage() const override
    { return INSPECT; }

    WindowerConfig config;
    std::string attackers_file;   // ground truth for the end-of-run report, optional

    // Loaded in end() so a broken model aborts configuration
    std::shared_ptr<const scoring::IAnomalyScorer> scorer;
};

class DdosWindower : public snort::Inspector
{
public:
    explicit DdosWindower(DdosWindowerModule*);
    ~DdosWindower() override;

    void eval(snort::Packet*) override;
    bool configure(snort::SnortConfig*) override { return true; }

private:
    WindowerConfig config;
    std::string attackers_file_path;

    std::unique_ptr<MitigationEngine> mitigation_engine;
    std::unique_ptr<ShardedPipeline> pipeline;

    std::atomic<uint64_t> packets_dropped{0};

    // Address string cache
    mutable std::mutex address_cache_mutex;
    std::unordered_map<uint32_t, std::string> ipv4_cache;
    std::unordered_map<std::array<uint8_t, 16>, std::string> ipv6_cache;

    // Background metrics thread
    std::atomic<bool> metrics_running{false};
    std::thread metrics_thread;
    std::mutex metrics_wait_mutex;
    std::condition_variable metrics_cv;
    std::chrono::steady_clock::time_point last_denylist_update;

    void initializeFileLogger();
    void writeMetrics();
    void writeDenylist();
    void writeReport();
    void startMetricsThread();
    void stopMetricsThread();

    std::string getIPv4String(uint32_t addr);
    std::string getIPv6String(const snort::ip::snort_in6_addr* addr);
    std::pair<std::string, std::string> extractAddresses(snort::Packet* p);
    PacketRecord extractPacketRecord(snort::Packet* p);
};

#endif // DDOS_WINDOWER_HPP
