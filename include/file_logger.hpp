#ifndef FILE_LOGGER_HPP
#define FILE_LOGGER_HPP

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <queue>
#include <atomic>
#include <condition_variable>
#include <chrono>
#include <vector>
#include <unordered_map>
#include <cstdint>

/**
 * @brief Asynchronous file logger for the windower
 *
 * Callers only enqueue; a background thread owns every file handle and does
 * the writing, flushing and size-based rotation, so packet and shard threads
 * never block on disk I/O. Logging before start() or after stop() is a no-op.
 */
class FileLogger {
public:
    enum class LogLevel : uint8_t {
        LOG_DEBUG = 0,
        LOG_INFO = 1,
        LOG_WARNING = 2,
        LOG_ERROR = 3,
        LOG_CRITICAL = 4
    };

    enum class FileType : uint8_t {
        METRICS = 0,
        DENYLIST = 1,
        DETECTION_LOG = 2,
        SCORER_LOG = 3,
        DEBUG_LOG = 4
    };

    struct LogEntry {
        LogLevel level;
        FileType file_type;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string source_file;
        int line_number;

        LogEntry() = default;
        LogEntry(LogLevel lvl, FileType type, std::string msg,
                 const char* file = "", int line = 0)
            : level(lvl), file_type(type), message(std::move(msg)),
              timestamp(std::chrono::system_clock::now()),
              source_file(file ? file : ""), line_number(line) {}
    };

    struct FileConfig {
        std::string file_path;
        size_t max_file_size = 100 * 1024 * 1024;
        int max_backup_files = 5;
        bool auto_flush = true;
        std::chrono::milliseconds flush_interval{5000};
        bool overwrite = false;   // snapshot files are rewritten on every entry
    };

private:
    std::atomic<bool> logger_running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::thread logger_thread_;

    mutable std::mutex queue_mutex_;
    std::queue<LogEntry> log_queue_;
    std::condition_variable queue_cv_;

    mutable std::mutex config_mutex_; // Protects file_configs_
    std::unordered_map<FileType, FileConfig> file_configs_;

    // Touched by the logger thread only
    std::unordered_map<FileType, std::unique_ptr<std::ofstream>> active_files_;
    std::unordered_map<FileType, std::chrono::steady_clock::time_point> last_flush_times_;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::LOG_INFO)};

    std::atomic<uint64_t> total_log_entries_{0};
    std::atomic<uint64_t> dropped_entries_{0};
    std::atomic<uint64_t> flush_operations_{0};
    std::atomic<uint64_t> file_rotations_{0};

    static constexpr size_t MAX_QUEUE_SIZE = 10000;

public:
    FileLogger();
    ~FileLogger();

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;
    FileLogger(FileLogger&&) = delete;
    FileLogger& operator=(FileLogger&&) = delete;

    // Lifecycle management
    bool initialize(const std::unordered_map<FileType, FileConfig>& configs);
    void start();
    void stop();
    bool is_running() const { return logger_running_.load(std::memory_order_acquire); }

    void set_min_level(LogLevel level) { min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed); }
    static LogLevel parse_log_level(const std::string& name);

    void log(LogLevel level, FileType file_type, std::string message,
             const char* source_file = "", int line_number = 0);

    void debug(FileType file_type, std::string message, const char* source_file = "", int line_number = 0);
    void info(FileType file_type, std::string message, const char* source_file = "", int line_number = 0);
    void warning(FileType file_type, std::string message, const char* source_file = "", int line_number = 0);
    void error(FileType file_type, std::string message, const char* source_file = "", int line_number = 0);
    void critical(FileType file_type, std::string message, const char* source_file = "", int line_number = 0);

    // Snapshot files
    void write_metrics_file(const std::string& metrics_data);
    void write_denylist_file(const std::vector<std::string>& denylist_rows);
    void write_detection(const std::string& detection_info);

    void set_file_config(FileType file_type, const FileConfig& config);
    FileConfig get_file_config(FileType file_type) const;

    struct LoggerMetrics {
        uint64_t total_entries;
        uint64_t dropped_entries;
        uint64_t flush_operations;
        uint64_t file_rotations;
        size_t current_queue_size;
        bool is_running;
    };
    LoggerMetrics get_metrics() const;

    static std::string log_level_to_string(LogLevel level);
    static std::string file_type_to_string(FileType type);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

private:
    void logger_loop();
    void process_log_entry(const LogEntry& entry);
    bool open_file(FileType file_type, bool truncate);
    // Replaces the file through a rename so readers see the old or the new
    // snapshot, never a partial one
    bool write_snapshot(const std::string& file_path, const std::string& content);
    void close_file(FileType file_type);
    void ensure_directory_exists(const std::string& file_path);
    bool should_rotate_file(FileType file_type) const;
    void perform_file_rotation(FileType file_type);
    void flush_file(FileType file_type);
    void flush_all_files();
    std::string format_log_message(const LogEntry& entry) const;
};

#define FILE_LOG_DEBUG(logger, file_type, message) \
    (logger).debug(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_INFO(logger, file_type, message) \
    (logger).info(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_WARNING(logger, file_type, message) \
    (logger).warning(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_ERROR(logger, file_type, message) \
    (logger).error(file_type, message, __FILE__, __LINE__)

#define FILE_LOG_CRITICAL(logger, file_type, message) \
    (logger).critical(file_type, message, __FILE__, __LINE__)

// Global file logger instance
extern FileLogger g_file_logger;

#endif // FILE_LOGGER_HPP
