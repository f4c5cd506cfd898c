#include <cstdlib>
#include <iostream>
#include <fstream>
#include <string>
#include <map>
#include <thread>
#include <chrono>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include "windower_stats.hpp"

class WindowerMetricsExporter {
private:
    std::shared_ptr<prometheus::Registry> registry;
    prometheus::Exposer exposer;

    prometheus::Family<prometheus::Counter>& packets_family;
    prometheus::Family<prometheus::Counter>& windows_family;
    prometheus::Family<prometheus::Counter>& vectors_family;
    prometheus::Family<prometheus::Counter>& detections_family;
    prometheus::Family<prometheus::Counter>& scorer_family;
    prometheus::Family<prometheus::Counter>& evictions_family;

    prometheus::Family<prometheus::Gauge>& sources_family;
    prometheus::Family<prometheus::Gauge>& open_windows_family;
    prometheus::Family<prometheus::Gauge>& scorer_queue_family;

    // Stats file key -> counter
    std::map<std::string, prometheus::Counter*> counters;
    // Stats file key -> gauge
    std::map<std::string, prometheus::Gauge*> gauges;

    std::string stats_file_path;
    std::map<std::string, double> previous_values;

public:
    WindowerMetricsExporter(const std::string& bind_address = "0.0.0.0:9091",
                            const std::string& stats_file = "/var/log/ddos_windower/windower_stats")
        : registry{std::make_shared<prometheus::Registry>()}
        , exposer{bind_address}
        , packets_family{prometheus::BuildCounter()
                         .Name("ddos_windower_packets_total")
                         .Help("Packets seen by the windower, by outcome")
                         .Register(*registry)}
        , windows_family{prometheus::BuildCounter()
                         .Name("ddos_windower_windows_total")
                         .Help("Closed per-source windows, by outcome")
                         .Register(*registry)}
        , vectors_family{prometheus::BuildCounter()
                         .Name("ddos_windower_feature_vectors_total")
                         .Help("Feature vectors emitted to the scorer")
                         .Register(*registry)}
        , detections_family{prometheus::BuildCounter()
                            .Name("ddos_windower_classifications_total")
                            .Help("Scorer classifications, by result")
                            .Register(*registry)}
        , scorer_family{prometheus::BuildCounter()
                        .Name("ddos_windower_scorer_errors_total")
                        .Help("Feature vectors left unclassified, by reason")
                        .Register(*registry)}
        , evictions_family{prometheus::BuildCounter()
                           .Name("ddos_windower_denylist_evictions_total")
                           .Help("Sources evicted from a full denylist")
                           .Register(*registry)}
        , sources_family{prometheus::BuildGauge()
                         .Name("ddos_windower_sources")
                         .Help("Tracked sources, by state")
                         .Register(*registry)}
        , open_windows_family{prometheus::BuildGauge()
                              .Name("ddos_windower_open_windows")
                              .Help("Windows currently accumulating packets")
                              .Register(*registry)}
        , scorer_queue_family{prometheus::BuildGauge()
                              .Name("ddos_windower_scorer_queue_depth")
                              .Help("Feature vectors waiting for the scorer")
                              .Register(*registry)}
        , stats_file_path{stats_file}
    {
        counters["packets_processed"] = &packets_family.Add({{"outcome", "processed"}});
        counters["packets_allowed"] = &packets_family.Add({{"outcome", "allowed"}});
        counters["packets_denied"] = &packets_family.Add({{"outcome", "denied"}});
        counters["malformed_skipped"] = &packets_family.Add({{"outcome", "malformed"}});
        counters["late_dropped"] = &packets_family.Add({{"outcome", "late"}});
        counters["shard_overflows"] = &packets_family.Add({{"outcome", "shard_overflow"}});
        counters["windows_finalized"] = &windows_family.Add({{"outcome", "finalized"}});
        counters["windows_discarded"] = &windows_family.Add({{"outcome", "discarded"}});
        counters["vectors_emitted"] = &vectors_family.Add({});
        counters["detections_positive"] = &detections_family.Add({{"result", "anomalous"}});
        counters["detections_negative"] = &detections_family.Add({{"result", "normal"}});
        counters["scorer_failures"] = &scorer_family.Add({{"reason", "failed"}});
        counters["scorer_dropped"] = &scorer_family.Add({{"reason", "dropped"}});
        counters["denylist_evictions"] = &evictions_family.Add({});

        gauges["denylisted_sources"] = &sources_family.Add({{"state", "denylisted"}});
        gauges["monitored_sources"] = &sources_family.Add({{"state", "monitored"}});
        gauges["windows_open"] = &open_windows_family.Add({});
        gauges["scorer_queue_depth"] = &scorer_queue_family.Add({});

        exposer.RegisterCollectable(registry);
        std::cout << "DDoS Windower Metrics Exporter started on " << bind_address << "\n";
        std::cout << "Reading stats from: " << stats_file_path << "\n";
    }

    std::map<std::string, double> parseStatsFile() {
        std::ifstream file(stats_file_path);
        if (!file.is_open()) {
            std::cerr << "Warning: Could not open stats file: " << stats_file_path << '\n';
            return {};
        }
        return parse_windower_stats(file);
    }

    void updateMetrics() {
        const auto stats = parseStatsFile();
        if (stats.empty()) {
            return;
        }

        for (auto& [key, counter] : counters) {
            updateCounter(key, stats, *counter);
        }
        for (auto& [key, gauge] : gauges) {
            auto it = stats.find(key);
            if (it != stats.end()) {
                gauge->Set(it->second);
            }
        }
    }

private:
    void updateCounter(const std::string& key, const std::map<std::string, double>& stats,
                       prometheus::Counter& counter) {
        auto it = stats.find(key);
        if (it != stats.end()) {
            double current_value = it->second;
            double previous_value = previous_values[key];

            if (current_value >= previous_value) {
                double increment = current_value - previous_value;
                if (increment > 0) {
                    counter.Increment(increment);
                }
            } else {
                // Snort restarted, its counters began again from zero
                counter.Increment(current_value);
            }

            previous_values[key] = current_value;
        }
    }

public:
    void run() {
        std::cout << "Starting DDoS Windower metrics collection..." << '\n';

        while (true) {
            try {
                updateMetrics();
            } catch (const std::exception& e) {
                std::cerr << "Error updating metrics: " << e.what() << '\n';
            }
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }
};

// Helper function to get environment variable or default
static const char* get_env_or_default(const char* env_var, const char* default_val) {
    const char* value = std::getenv(env_var);
    return value ? value : default_val;
}

int main(int argc, char** argv) {
    try {
        std::string bind_address = get_env_or_default("BIND_ADDRESS", "0.0.0.0:9091");
        std::string stats_file = get_env_or_default("WINDOWER_METRICS_FILE", "/var/log/ddos_windower/windower_stats");

        // Allow overriding with command-line arguments
        if (argc > 1) {
            stats_file = argv[1];
        }
        if (argc > 2) {
            bind_address = argv[2];
        }

        WindowerMetricsExporter exporter(bind_address, stats_file);
        exporter.run(); // Blocking call

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
