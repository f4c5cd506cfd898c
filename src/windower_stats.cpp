#include "windower_stats.hpp"
#include "file_logger.hpp"
#include <chrono>
#include <sstream>

std::string render_windower_stats(const PipelineCounters& pipeline,
                                  const MitigationEngine::Metrics& mitigation,
                                  const std::optional<AsyncScoringService::Metrics>& scorer) {
    std::ostringstream out;
    out << "# DDoS Windower stats - " << FileLogger::format_timestamp(std::chrono::system_clock::now()) << "\n";

    out << "packets_processed:" << pipeline.packets_processed << "\n";
    out << "packets_allowed:" << mitigation.pkts_allowed << "\n";
    out << "packets_denied:" << mitigation.pkts_denied << "\n";
    out << "malformed_skipped:" << pipeline.malformed_skipped << "\n";
    out << "late_dropped:" << pipeline.late_dropped << "\n";
    out << "shard_overflows:" << pipeline.shard_overflows << "\n";

    out << "windows_finalized:" << pipeline.windows_finalized << "\n";
    out << "windows_discarded:" << pipeline.windows_discarded << "\n";
    out << "windows_open:" << pipeline.open_windows << "\n";
    out << "history_rejected:" << pipeline.history_rejected << "\n";
    out << "vectors_emitted:" << pipeline.vectors_emitted << "\n";

    out << "detections_positive:" << mitigation.detections_pos << "\n";
    out << "detections_negative:" << mitigation.detections_neg << "\n";
    out << "denylisted_sources:" << mitigation.denylisted_sources << "\n";
    out << "monitored_sources:" << mitigation.monitored_sources << "\n";
    out << "denylist_evictions:" << mitigation.denylist_evictions << "\n";

    out << "scorer_failures:" << pipeline.scorer_failures << "\n";
    out << "scorer_dropped:" << pipeline.scorer_dropped << "\n";
    if (scorer) {
        out << "scorer_completed:" << scorer->completed << "\n";
        out << "scorer_timed_out:" << scorer->timed_out << "\n";
        out << "scorer_queue_depth:" << scorer->queue_depth << "\n";
    }
    return out.str();
}

std::map<std::string, double> parse_windower_stats(std::istream& in) {
    std::map<std::string, double> stats;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t delimiter_pos = line.find(':');
        if (delimiter_pos == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, delimiter_pos);
        try {
            stats[key] = std::stod(line.substr(delimiter_pos + 1));
        } catch (const std::exception&) {
            FILE_LOG_DEBUG(g_file_logger, FileLogger::FileType::DEBUG_LOG,
                           "Skipping unparseable stats value for " + key);
        }
    }
    return stats;
}
