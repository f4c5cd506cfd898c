#include "ddos_windower.hpp"
#include "file_logger.hpp"
#include "mitigation_engine.hpp"
#include "mitigation_report.hpp"
#include "sharded_pipeline.hpp"
#include "windower_stats.hpp"

#ifdef __unix__
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

#include <algorithm>
#include <cstring>
#include <detection/detection_engine.h>
#include <framework/snort_api.h>
#include <fstream>
#include <iomanip>
#include <packet_io/active.h>
#include <sstream>
#include <system_error>

using namespace snort;
using namespace std::chrono_literals;

// Logger abstraction over Snort's message API
class WindowerLogger
{
public:
    enum Level : std::uint8_t
    {
        LOG_DEBUG = 0,
        LOG_INFO = 1,
        LOG_WARNING = 2,
        LOG_ERROR = 3
    };

    static void log(Level level, const std::string &message)
    {
        switch (level)
        {
        case LOG_DEBUG:
            LogMessage("DDoS Windower DEBUG: %s\n", message.c_str());
            break;
        case LOG_INFO:
            LogMessage("DDoS Windower: %s\n", message.c_str());
            break;
        case LOG_WARNING:
            WarningMessage("DDoS Windower: %s\n", message.c_str());
            break;
        case LOG_ERROR:
            ErrorMessage("DDoS Windower: %s\n", message.c_str());
            break;
        default:
            LogMessage("DDoS Windower: %s\n", message.c_str());
            break;
        }
    }

    static void info(const std::string &message) { log(LOG_INFO, message); }
    static void warning(const std::string &message) { log(LOG_WARNING, message); }
    static void error(const std::string &message) { log(LOG_ERROR, message); }
    static void debug(const std::string &message) { log(LOG_DEBUG, message); }
};

static std::atomic<DdosWindower*> g_windower_instance{nullptr};

//-------------------------------------------------------------------------
// module stuff
//-------------------------------------------------------------------------

static const Parameter windower_params[] = {
    {"window_length", Parameter::PT_REAL, "0.0:86400.0", "0.0",
     "length of a traffic window in seconds (required)"},

    {"history_min", Parameter::PT_INT, "1:100000", "6",
     "windows of history needed before a source is summarized"},

    {"history_size", Parameter::PT_INT, "0:1000000", "0",
     "maximum windows kept per source, 0 for unbounded"},

    {"history_timeout", Parameter::PT_REAL, "0.0:86400.0", "120.0",
     "drop history older than this many seconds, 0 to disable"},

    {"packets_min", Parameter::PT_INT, "1:100000000", "20",
     "packets a window needs to count as valid"},

    {"samples_size", Parameter::PT_INT, "1:1000000", "40",
     "source ports sampled per window for the entropy feature"},

    {"max_tracked_sources", Parameter::PT_INT, "0:100000000", "1000000",
     "sources with history kept per shard, 0 for unbounded"},

    {"threshold", Parameter::PT_REAL, nullptr, "10.0",
     "anomaly score at or above which a source is denylisted"},

    {"denylist_size", Parameter::PT_INT, "1:100000000", "1000000",
     "maximum denylisted sources, oldest detection evicted first"},

    {"scorer_type", Parameter::PT_STRING, nullptr, "zscore",
     "anomaly scorer: linear or zscore"},

    {"model_file", Parameter::PT_STRING, nullptr, "",
     "scorer model file, empty to emit features without classifying"},

    {"async_scoring", Parameter::PT_BOOL, nullptr, "true",
     "score feature vectors on a background worker pool"},

    {"scorer_threads", Parameter::PT_INT, "1:64", "1",
     "scorer worker threads"},

    {"scorer_queue_size", Parameter::PT_INT, "1:10000000", "4096",
     "pending scoring jobs before new ones are dropped"},

    {"scorer_timeout_ms", Parameter::PT_INT, "1:60000", "250",
     "deadline for a scoring job in milliseconds"},

    {"shards", Parameter::PT_INT, "1:256", "1",
     "feature extraction worker threads"},

    {"shard_queue_size", Parameter::PT_INT, "1:100000000", "65536",
     "pending packets per shard before feature extraction skips them"},

    {"random_seed", Parameter::PT_INT, "0:4294967295", "42",
     "seed for source port sampling"},

    {"use_env_files", Parameter::PT_BOOL, nullptr, "true",
     "allow WINDOWER_*_FILE environment variables to override file paths"},

    {"metrics_file", Parameter::PT_STRING, nullptr, "/var/log/ddos_windower/windower_stats",
     "path to the stats snapshot file"},

    {"denylist_file", Parameter::PT_STRING, nullptr, "/var/log/ddos_windower/denylist.log",
     "path to the denylist snapshot file"},

    {"detections_file", Parameter::PT_STRING, nullptr, "/var/log/ddos_windower/detections.log",
     "path to the detection log"},

    {"attackers_file", Parameter::PT_STRING, nullptr, "",
     "known attacker addresses used to evaluate mitigation at shutdown"},

    {"log_level", Parameter::PT_STRING, nullptr, "info",
     "file log verbosity: debug, info, warning, error"},

    {nullptr, Parameter::PT_MAX, nullptr, nullptr, nullptr}};

#define WINDOWER_NAME "ddos_windower"
#define WINDOWER_HELP "per-source traffic windowing, anomaly scoring and denylisting"

DdosWindowerModule::DdosWindowerModule() : Module(WINDOWER_NAME, WINDOWER_HELP, windower_params)
{
}

bool DdosWindowerModule::set(const char *, Value &v, SnortConfig *)
{
    if (v.is("window_length"))
        config.window_length = v.get_real();
    else if (v.is("history_min"))
        config.history_min = v.get_uint32();
    else if (v.is("history_size"))
        config.history_size = static_cast<size_t>(v.get_uint64());
    else if (v.is("history_timeout"))
        config.history_timeout = v.get_real();
    else if (v.is("packets_min"))
        config.packets_min = v.get_uint32();
    else if (v.is("samples_size"))
        config.samples_size = v.get_uint32();
    else if (v.is("max_tracked_sources"))
        config.max_tracked_sources = static_cast<size_t>(v.get_uint64());
    else if (v.is("threshold"))
        config.threshold = v.get_real();
    else if (v.is("denylist_size"))
        config.denylist_size = static_cast<size_t>(v.get_uint64());
    else if (v.is("scorer_type"))
        config.scorer_type = v.get_string();
    else if (v.is("model_file"))
        config.model_file = v.get_string();
    else if (v.is("async_scoring"))
        config.async_scoring = v.get_bool();
    else if (v.is("scorer_threads"))
        config.scorer_threads = v.get_uint32();
    else if (v.is("scorer_queue_size"))
        config.scorer_queue_size = static_cast<size_t>(v.get_uint64());
    else if (v.is("scorer_timeout_ms"))
        config.scorer_timeout_ms = v.get_uint32();
    else if (v.is("shards"))
        config.shards = v.get_uint32();
    else if (v.is("shard_queue_size"))
        config.shard_queue_size = static_cast<size_t>(v.get_uint64());
    else if (v.is("random_seed"))
        config.random_seed = v.get_uint64();
    else if (v.is("use_env_files"))
        config.use_env_files = v.get_bool();
    else if (v.is("metrics_file"))
        config.metrics_file = v.get_string();
    else if (v.is("denylist_file"))
        config.denylist_file = v.get_string();
    else if (v.is("detections_file"))
        config.detections_file = v.get_string();
    else if (v.is("attackers_file"))
        attackers_file = v.get_string();
    else if (v.is("log_level"))
        config.log_level = v.get_string();
    else
        return false;

    return true;
}

bool DdosWindowerModule::begin(const char *, int, SnortConfig *)
{
    config = WindowerConfig{};
    attackers_file.clear();
    scorer.reset();
    return true;
}

bool DdosWindowerModule::end(const char *, int, SnortConfig *)
{
    config.applyEnvironmentOverrides();

    try
    {
        config.validate();
    }
    catch (const ConfigError &e)
    {
        WindowerLogger::error(std::string("Invalid configuration: ") + e.what());
        return false;
    }

    if (!attackers_file.empty() && !WindowerConfig::isSafePath(attackers_file))
    {
        WindowerLogger::error("Invalid attackers file path: " + attackers_file);
        return false;
    }

    if (!config.model_file.empty())
    {
        try
        {
            scorer = scoring::ScorerFactory::create(config.scorer_type, config.model_file, config.threshold);
        }
        catch (const scoring::ScorerError &e)
        {
            WindowerLogger::error(std::string("Cannot load scorer model: ") + e.what());
            return false;
        }
    }
    else
    {
        WindowerLogger::warning("No model_file configured, feature vectors will not be classified");
    }

    WindowerLogger::info("DDoS Windower configuration completed successfully");
    return true;
}

//-------------------------------------------------------------------------
// inspector stuff
//-------------------------------------------------------------------------

DdosWindower::DdosWindower(DdosWindowerModule *mod)
    : config(mod->config), attackers_file_path(mod->attackers_file)
{
    initializeFileLogger();
    WindowerLogger::info(config.describe());
    config.logConfiguration();

    mitigation_engine = std::make_unique<MitigationEngine>(config.denylist_size, config.max_tracked_sources);
    pipeline = std::make_unique<ShardedPipeline>(config, *mitigation_engine, mod->scorer);
    pipeline->start();

    last_denylist_update = std::chrono::steady_clock::now();
    g_windower_instance.store(this, std::memory_order_release);
    startMetricsThread();

    WindowerLogger::info("DDoS Windower engine initialized and ready for packet analysis");
}

DdosWindower::~DdosWindower()
{
    stopMetricsThread();
    g_windower_instance.store(nullptr, std::memory_order_release);

    pipeline->shutdown();

    try
    {
        writeMetrics();
        writeDenylist();
        writeReport();
    }
    catch (const std::exception &e)
    {
        WindowerLogger::error(std::string("Failed to write final statistics: ") + e.what());
    }

    g_file_logger.stop();
}

void DdosWindower::initializeFileLogger()
{
    std::unordered_map<FileLogger::FileType, FileLogger::FileConfig> file_configs;

    file_configs[FileLogger::FileType::METRICS] = {
        config.metrics_file, 10 * 1024 * 1024, 1, true,
        std::chrono::milliseconds(5000), true
    };

    file_configs[FileLogger::FileType::DENYLIST] = {
        config.denylist_file, 50 * 1024 * 1024, 1, true,
        std::chrono::milliseconds(2000), true
    };

    file_configs[FileLogger::FileType::DETECTION_LOG] = {
        config.detections_file, 100 * 1024 * 1024, 10, true,
        std::chrono::milliseconds(1000), false
    };

    g_file_logger.set_min_level(FileLogger::parse_log_level(config.log_level));
    if (g_file_logger.initialize(file_configs))
    {
        g_file_logger.start();
        WindowerLogger::info("File logger initialized and started successfully");
    }
    else
    {
        WindowerLogger::error("Failed to initialize file logger - file operations may not work");
    }
}

void DdosWindower::eval(Packet *p)
{
    if (!p || !p->ptrs.ip_api.is_ip())
        return;

    const PacketRecord record = extractPacketRecord(p);
    if (pipeline->process(record) == Verdict::DENY)
    {
        p->active->drop_packet(p);
        DetectionEngine::disable_all(p);
        packets_dropped.fetch_add(1, std::memory_order_relaxed);
    }
}

void DdosWindower::writeMetrics()
{
    std::ostringstream stats;
    stats << render_windower_stats(pipeline->counters(), mitigation_engine->get_metrics(),
                                   pipeline->scorer_metrics());
    stats << "packets_dropped:" << packets_dropped.load(std::memory_order_relaxed) << "\n";
    g_file_logger.write_metrics_file(stats.str());
}

void DdosWindower::writeDenylist()
{
    std::vector<std::string> rows;
    for (const auto &ip : mitigation_engine->get_denylisted_sources())
    {
        const auto stats = mitigation_engine->get_stats(ip);
        if (!stats)
            continue;

        std::ostringstream row;
        row << ip << " detected_after=" << std::fixed << std::setprecision(3) << stats->detected_after
            << " pos=" << stats->detections_pos << " neg=" << stats->detections_neg
            << " allowed=" << stats->pkts_allowed << " denied=" << stats->pkts_denied;
        rows.push_back(row.str());
    }
    g_file_logger.write_denylist_file(rows);
    last_denylist_update = std::chrono::steady_clock::now();
}

void DdosWindower::writeReport()
{
    std::unordered_set<std::string> attackers;
    if (!attackers_file_path.empty())
    {
        std::ifstream in(attackers_file_path);
        if (in.is_open())
        {
            attackers = read_attacker_list(in);
        }
        else
        {
            WindowerLogger::warning("Cannot open attackers file: " + attackers_file_path);
        }
    }

    const auto report = MitigationReport::build(mitigation_engine->snapshot(), attackers);
    const std::string text = report.format();
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::DETECTION_LOG, "Mitigation report\n" + text);
    WindowerLogger::info("Mitigation report\n" + text);
}

void DdosWindower::startMetricsThread()
{
    metrics_running.store(true, std::memory_order_release);
    metrics_thread = std::thread(
        [this]()
        {
            int consecutive_errors = 0;
            const int max_consecutive_errors = 5;

            while (metrics_running.load(std::memory_order_acquire))
            {
                if (g_windower_instance.load(std::memory_order_acquire) != this)
                {
                    break;
                }

                try
                {
                    writeMetrics();
                    if (std::chrono::steady_clock::now() - last_denylist_update >= 30s)
                    {
                        writeDenylist();
                    }
                    consecutive_errors = 0;
                }
                catch (const std::system_error &e)
                {
                    WindowerLogger::error("Metrics thread system error: " + std::string(e.what()));
                    consecutive_errors++;
                }
                catch (const std::exception &e)
                {
                    WindowerLogger::error("Metrics thread unexpected error: " + std::string(e.what()));
                    consecutive_errors++;
                }

                if (consecutive_errors >= max_consecutive_errors)
                {
                    WindowerLogger::error("Too many consecutive metrics errors, stopping metrics thread");
                    metrics_running.store(false, std::memory_order_release);
                    break;
                }

                // Back off on consecutive errors
                auto interval = consecutive_errors > 0
                    ? std::chrono::milliseconds(std::min(1000 * (1 << consecutive_errors), 30000))
                    : std::chrono::milliseconds(5000);

                std::unique_lock<std::mutex> lock(metrics_wait_mutex);
                metrics_cv.wait_for(lock, interval, [this]()
                                    { return !metrics_running.load(std::memory_order_acquire); });
            }
        });
}

void DdosWindower::stopMetricsThread()
{
    {
        std::lock_guard<std::mutex> lock(metrics_wait_mutex);
        metrics_running.store(false, std::memory_order_release);
    }
    metrics_cv.notify_all();
    if (metrics_thread.joinable())
    {
        metrics_thread.join();
    }
}

std::string DdosWindower::getIPv4String(uint32_t addr)
{
    std::lock_guard<std::mutex> lock(address_cache_mutex);
    auto it = ipv4_cache.find(addr);
    if (it != ipv4_cache.end())
    {
        return it->second;
    }

    char buffer[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)))
    {
        std::string addr_str(buffer);
        // Keep cache size bounded
        if (ipv4_cache.size() >= 1000)
        {
            ipv4_cache.clear();
        }
        ipv4_cache[addr] = addr_str;
        return addr_str;
    }

    return "";
}

std::string DdosWindower::getIPv6String(const snort::ip::snort_in6_addr *addr)
{
    std::lock_guard<std::mutex> lock(address_cache_mutex);

    std::array<uint8_t, 16> addr_bytes;
    std::memcpy(addr_bytes.data(), addr, 16);

    auto it = ipv6_cache.find(addr_bytes);
    if (it != ipv6_cache.end())
    {
        return it->second;
    }

    char buffer[INET6_ADDRSTRLEN];
    if (inet_ntop(AF_INET6, addr, buffer, sizeof(buffer)))
    {
        std::string addr_str(buffer);
        if (ipv6_cache.size() >= 1000)
        {
            ipv6_cache.clear();
        }
        ipv6_cache[addr_bytes] = addr_str;
        return addr_str;
    }

    return "";
}

std::pair<std::string, std::string> DdosWindower::extractAddresses(snort::Packet *p)
{
    std::string src_ip, dst_ip;

    if (p->ptrs.ip_api.is_ip4())
    {
        const snort::ip::IP4Hdr *ip4h = p->ptrs.ip_api.get_ip4h();
        src_ip = getIPv4String(ip4h->get_src());
        dst_ip = getIPv4String(ip4h->get_dst());
    }
    else if (p->ptrs.ip_api.is_ip6())
    {
        const snort::ip::IP6Hdr *ip6h = p->ptrs.ip_api.get_ip6h();
        src_ip = getIPv6String(ip6h->get_src());
        dst_ip = getIPv6String(ip6h->get_dst());
    }

    return {src_ip, dst_ip};
}

PacketRecord DdosWindower::extractPacketRecord(snort::Packet *p)
{
    PacketRecord record;
    auto [src_ip, dst_ip] = extractAddresses(p);
    record.src_ip = std::move(src_ip);
    record.dst_ip = std::move(dst_ip);

    if (p->pkth)
    {
        record.timestamp = static_cast<double>(p->pkth->ts.tv_sec) +
                           static_cast<double>(p->pkth->ts.tv_usec) / 1e6;
    }

    // Everything in front of the payload counts as header
    record.length = p->pktlen;
    record.header_length = p->pktlen >= p->dsize ? p->pktlen - p->dsize : 0;

    uint8_t proto = 0;
    if (p->ptrs.ip_api.is_ip4())
        proto = static_cast<uint8_t>(p->ptrs.ip_api.get_ip4h()->proto());
    else if (p->ptrs.ip_api.is_ip6())
        proto = static_cast<uint8_t>(p->ptrs.ip_api.get_ip6h()->next());

    if (p->ptrs.tcph)
    {
        record.protocol = TransportProtocol::TCP;
        record.src_port = ntohs(p->ptrs.tcph->th_sport);
        record.dst_port = ntohs(p->ptrs.tcph->th_dport);
    }
    else if (p->ptrs.udph)
    {
        record.protocol = TransportProtocol::UDP;
        record.src_port = ntohs(p->ptrs.udph->uh_sport);
        record.dst_port = ntohs(p->ptrs.udph->uh_dport);
    }
    else if (proto == IPPROTO_ICMP || proto == IPPROTO_ICMPV6)
    {
        record.protocol = TransportProtocol::ICMP;
    }
    else
    {
        record.protocol = TransportProtocol::OTHER;
    }

    record.is_fragment = p->is_fragment();
    return record;
}

//-------------------------------------------------------------------------
// api stuff
//-------------------------------------------------------------------------

static Module *mod_ctor()
{
    return new DdosWindowerModule;
}

static void mod_dtor(Module *m)
{
    delete m;
}

static Inspector *windower_ctor(Module *m)
{
    DdosWindowerModule *mod = dynamic_cast<DdosWindowerModule *>(m);
    return new DdosWindower(mod);
}

static void windower_dtor(Inspector *p)
{
    delete p;
}

static const InspectApi windower_api = {
    {PT_INSPECTOR, sizeof(InspectApi), INSAPI_VERSION, 0, API_RESERVED, API_OPTIONS, WINDOWER_NAME,
     WINDOWER_HELP, mod_ctor, mod_dtor},
    IT_PACKET,
    PROTO_BIT__ANY_IP,
    nullptr, // buffers
    nullptr, // service
    nullptr, // pinit
    nullptr, // pterm
    nullptr, // tinit
    nullptr, // tterm
    windower_ctor,
    windower_dtor,
    nullptr, // ssn
    nullptr  // reset
};

//-------------------------------------------------------------------------
// plugin
//-------------------------------------------------------------------------

SO_PUBLIC const BaseApi *snort_plugins[] = {&windower_api.base, nullptr};
