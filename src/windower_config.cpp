#include "windower_config.hpp"
#include "file_logger.hpp"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {
    std::string path_from_env(const char* env_var_name, const std::string& default_path) {
        const char* env_value = std::getenv(env_var_name);
        if (env_value && std::strlen(env_value) > 0) {
            return std::string(env_value);
        }
        return default_path;
    }

    void require(bool condition, const std::string& message) {
        if (!condition) {
            throw ConfigError(message);
        }
    }
}

void WindowerConfig::validate() const {
    require(std::isfinite(window_length) && window_length > 0.0,
            "window_length must be a positive number of seconds");
    require(history_min >= 1, "history_min must be at least 1");
    require(history_size == 0 || history_size >= history_min,
            "history_size must be 0 (unbounded) or at least history_min");
    require(std::isfinite(history_timeout) && history_timeout >= 0.0,
            "history_timeout must be >= 0 seconds");
    require(packets_min >= 1, "packets_min must be at least 1");
    require(samples_size >= 1, "samples_size must be at least 1");
    require(std::isfinite(threshold), "threshold must be a finite number");
    require(denylist_size >= 1, "denylist_size must be at least 1");
    require(scorer_type == "linear" || scorer_type == "zscore",
            "scorer_type must be linear or zscore");
    require(scorer_threads >= 1, "scorer_threads must be at least 1");
    require(scorer_queue_size >= 1, "scorer_queue_size must be at least 1");
    require(scorer_timeout_ms >= 1, "scorer_timeout_ms must be at least 1");
    require(shards >= 1 && shards <= 256, "shards must be within 1..256");
    require(shard_queue_size >= 1, "shard_queue_size must be at least 1");
    require(isSafePath(metrics_file), "invalid metrics file path: " + metrics_file);
    require(isSafePath(denylist_file), "invalid denylist file path: " + denylist_file);
    require(isSafePath(detections_file), "invalid detections file path: " + detections_file);
}

void WindowerConfig::applyEnvironmentOverrides() {
    if (!use_env_files) {
        return;
    }
    metrics_file = path_from_env("WINDOWER_METRICS_FILE", metrics_file);
    denylist_file = path_from_env("WINDOWER_DENYLIST_FILE", denylist_file);
    detections_file = path_from_env("WINDOWER_DETECTIONS_FILE", detections_file);
}

bool WindowerConfig::isSafePath(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    return path[0] == '/' &&
           path.find("..") == std::string::npos &&
           path.find("//") == std::string::npos;
}

std::string WindowerConfig::describe() const {
    std::ostringstream msg;
    msg << "Windower Configuration:\n"
        << "  - Window Length: " << window_length << "s\n"
        << "  - History Min/Size/Timeout: " << history_min << " / "
        << (history_size == 0 ? std::string("unbounded") : std::to_string(history_size))
        << " / " << history_timeout << "s\n"
        << "  - Packets Min: " << packets_min << "\n"
        << "  - Samples Size: " << samples_size << "\n"
        << "  - Max Tracked Sources: " << max_tracked_sources << "\n"
        << "  - Threshold: " << threshold << "\n"
        << "  - Denylist Size: " << denylist_size << "\n"
        << "  - Scorer: " << scorer_type << " (" << (model_file.empty() ? "no model" : model_file) << ")"
        << (async_scoring ? ", async " : ", inline ") << scorer_timeout_ms << "ms\n"
        << "  - Shards: " << shards << " (queue " << shard_queue_size << ")";
    return msg.str();
}

void WindowerConfig::logConfiguration() const {
    FILE_LOG_INFO(g_file_logger, FileLogger::FileType::DEBUG_LOG, describe());
}
