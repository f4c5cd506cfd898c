#include "file_logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>

// Global file logger instance
FileLogger g_file_logger;

FileLogger::FileLogger() {
    file_configs_[FileType::METRICS] = {
        "/var/log/ddos_windower/windower_stats", 10 * 1024 * 1024, 1, true,
        std::chrono::milliseconds(5000), true
    };

    file_configs_[FileType::DENYLIST] = {
        "/var/log/ddos_windower/denylist.log", 50 * 1024 * 1024, 1, true,
        std::chrono::milliseconds(2000), true
    };

    file_configs_[FileType::DETECTION_LOG] = {
        "/var/log/ddos_windower/detections.log", 100 * 1024 * 1024, 10, true,
        std::chrono::milliseconds(1000), false
    };

    file_configs_[FileType::SCORER_LOG] = {
        "/var/log/ddos_windower/scorer.log", 20 * 1024 * 1024, 3, true,
        std::chrono::milliseconds(5000), false
    };

    file_configs_[FileType::DEBUG_LOG] = {
        "/var/log/ddos_windower/debug.log", 50 * 1024 * 1024, 2, false,
        std::chrono::milliseconds(30000), false
    };
}

FileLogger::~FileLogger() {
    stop();
}

bool FileLogger::initialize(const std::unordered_map<FileType, FileConfig>& configs) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (const auto& [type, config] : configs) {
        file_configs_[type] = config;
    }

    for (const auto& [type, config] : file_configs_) {
        try {
            ensure_directory_exists(config.file_path);
        } catch (const std::exception& e) {
            std::cerr << "FileLogger: Failed to create directory for "
                      << file_type_to_string(type) << ": " << e.what() << '\n';
            return false;
        }
    }

    return true;
}

void FileLogger::start() {
    if (logger_running_.load(std::memory_order_acquire)) {
        return;
    }

    shutdown_requested_.store(false, std::memory_order_release);
    logger_running_.store(true, std::memory_order_release);
    logger_thread_ = std::thread(&FileLogger::logger_loop, this);
}

void FileLogger::stop() {
    if (!logger_running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    queue_cv_.notify_all();

    if (logger_thread_.joinable()) {
        logger_thread_.join();
    }

    logger_running_.store(false, std::memory_order_release);
}

FileLogger::LogLevel FileLogger::parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::LOG_DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::LOG_WARNING;
    if (lower == "error") return LogLevel::LOG_ERROR;
    if (lower == "critical") return LogLevel::LOG_CRITICAL;
    return LogLevel::LOG_INFO;
}

void FileLogger::log(LogLevel level, FileType file_type, std::string message,
                     const char* source_file, int line_number) {
    if (!logger_running_.load(std::memory_order_acquire)) {
        return;
    }
    // Snapshot files are always written regardless of verbosity
    if (file_type != FileType::METRICS && file_type != FileType::DENYLIST &&
        static_cast<uint8_t>(level) < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (log_queue_.size() >= MAX_QUEUE_SIZE) {
            dropped_entries_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        log_queue_.emplace(level, file_type, std::move(message), source_file, line_number);
        total_log_entries_.fetch_add(1, std::memory_order_relaxed);
    }

    queue_cv_.notify_one();
}

void FileLogger::debug(FileType file_type, std::string message, const char* source_file, int line_number) {
    log(LogLevel::LOG_DEBUG, file_type, std::move(message), source_file, line_number);
}

void FileLogger::info(FileType file_type, std::string message, const char* source_file, int line_number) {
    log(LogLevel::LOG_INFO, file_type, std::move(message), source_file, line_number);
}

void FileLogger::warning(FileType file_type, std::string message, const char* source_file, int line_number) {
    log(LogLevel::LOG_WARNING, file_type, std::move(message), source_file, line_number);
}

void FileLogger::error(FileType file_type, std::string message, const char* source_file, int line_number) {
    log(LogLevel::LOG_ERROR, file_type, std::move(message), source_file, line_number);
}

void FileLogger::critical(FileType file_type, std::string message, const char* source_file, int line_number) {
    log(LogLevel::LOG_CRITICAL, file_type, std::move(message), source_file, line_number);
}

void FileLogger::write_metrics_file(const std::string& metrics_data) {
    log(LogLevel::LOG_INFO, FileType::METRICS, metrics_data);
}

void FileLogger::write_denylist_file(const std::vector<std::string>& denylist_rows) {
    std::ostringstream oss;
    oss << "# DDoS Windower - Denylist\n";
    oss << "# Last updated: " << format_timestamp(std::chrono::system_clock::now()) << '\n';
    oss << "# Format: IP_ADDRESS detected_after=SECONDS pos=N neg=N allowed=N denied=N\n";
    oss << "# Total denylisted: " << denylist_rows.size() << "\n\n";

    if (denylist_rows.empty()) {
        oss << "# No sources currently denylisted\n";
    } else {
        for (const auto& row : denylist_rows) {
            oss << row << '\n';
        }
    }

    log(LogLevel::LOG_INFO, FileType::DENYLIST, oss.str());
}

void FileLogger::write_detection(const std::string& detection_info) {
    log(LogLevel::LOG_WARNING, FileType::DETECTION_LOG, detection_info);
}

void FileLogger::set_file_config(FileType file_type, const FileConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    file_configs_[file_type] = config;
}

FileLogger::FileConfig FileLogger::get_file_config(FileType file_type) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = file_configs_.find(file_type);
    return (it != file_configs_.end()) ? it->second : FileConfig{};
}

FileLogger::LoggerMetrics FileLogger::get_metrics() const {
    LoggerMetrics metrics{};
    metrics.total_entries = total_log_entries_.load(std::memory_order_acquire);
    metrics.dropped_entries = dropped_entries_.load(std::memory_order_acquire);
    metrics.flush_operations = flush_operations_.load(std::memory_order_acquire);
    metrics.file_rotations = file_rotations_.load(std::memory_order_acquire);
    metrics.is_running = logger_running_.load(std::memory_order_acquire);

    std::lock_guard<std::mutex> lock(queue_mutex_);
    metrics.current_queue_size = log_queue_.size();
    return metrics;
}

std::string FileLogger::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARNING";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string FileLogger::file_type_to_string(FileType type) {
    switch (type) {
        case FileType::METRICS: return "METRICS";
        case FileType::DENYLIST: return "DENYLIST";
        case FileType::DETECTION_LOG: return "DETECTION_LOG";
        case FileType::SCORER_LOG: return "SCORER_LOG";
        case FileType::DEBUG_LOG: return "DEBUG_LOG";
        default: return "UNKNOWN";
    }
}

std::string FileLogger::format_timestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void FileLogger::logger_loop() {
    for (;;) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
            return !log_queue_.empty() || shutdown_requested_.load(std::memory_order_acquire);
        });

        while (!log_queue_.empty()) {
            LogEntry entry = std::move(log_queue_.front());
            log_queue_.pop();
            lock.unlock();

            try {
                process_log_entry(entry);
            } catch (const std::exception& e) {
                std::cerr << "FileLogger: Error processing log entry: " << e.what() << '\n';
            }

            lock.lock();
        }

        const bool done = shutdown_requested_.load(std::memory_order_acquire);
        lock.unlock();

        std::unordered_map<FileType, FileConfig> config_snapshot;
        {
            std::lock_guard<std::mutex> config_lock(config_mutex_);
            config_snapshot = file_configs_;
        }

        auto now = std::chrono::steady_clock::now();
        for (const auto& [type, config] : config_snapshot) {
            if (config.auto_flush) {
                auto& last_flush = last_flush_times_[type];
                if (now - last_flush >= config.flush_interval) {
                    flush_file(type);
                    last_flush = now;
                }
            }
            if (!config.overwrite && should_rotate_file(type)) {
                perform_file_rotation(type);
            }
        }

        if (done) {
            break;
        }
    }

    flush_all_files();
    for (auto& [type, file] : active_files_) {
        if (file && file->is_open()) {
            file->close();
        }
    }
    active_files_.clear();
}

void FileLogger::process_log_entry(const LogEntry& entry) {
    const FileConfig config = get_file_config(entry.file_type);

    if (config.overwrite) {
        if (!write_snapshot(config.file_path, format_log_message(entry) + '\n')) {
            dropped_entries_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        flush_operations_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (!open_file(entry.file_type, false)) {
        dropped_entries_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto& file = active_files_[entry.file_type];
    *file << format_log_message(entry) << '\n';

    if (entry.level >= LogLevel::LOG_ERROR) {
        file->flush();
        flush_operations_.fetch_add(1, std::memory_order_relaxed);
    }
}

bool FileLogger::open_file(FileType file_type, bool truncate) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end() && it->second && it->second->is_open()) {
        return true;
    }

    const FileConfig config = get_file_config(file_type);
    if (config.file_path.empty()) {
        return false;
    }

    try {
        ensure_directory_exists(config.file_path);

        auto mode = truncate ? std::ios::trunc : std::ios::app;
        auto file = std::make_unique<std::ofstream>(config.file_path, std::ios::out | mode);
        if (!file->is_open()) {
            std::cerr << "FileLogger: Failed to open file: " << config.file_path
                      << " - " << std::strerror(errno) << '\n';
            return false;
        }

        active_files_[file_type] = std::move(file);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "FileLogger: Exception opening file " << config.file_path
                  << ": " << e.what() << '\n';
        return false;
    }
}

bool FileLogger::write_snapshot(const std::string& file_path, const std::string& content) {
    if (file_path.empty()) {
        return false;
    }

    const std::string tmp_path = file_path + ".tmp";
    try {
        ensure_directory_exists(file_path);

        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "FileLogger: Failed to open file: " << tmp_path
                      << " - " << std::strerror(errno) << '\n';
            return false;
        }
        out << content;
        out.close();
        if (out.fail()) {
            std::cerr << "FileLogger: Failed to write snapshot " << tmp_path << '\n';
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "FileLogger: Exception writing snapshot " << tmp_path
                  << ": " << e.what() << '\n';
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        std::cerr << "FileLogger: Failed to replace " << file_path << ": " << ec.message() << '\n';
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

void FileLogger::close_file(FileType file_type) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end()) {
        if (it->second && it->second->is_open()) {
            it->second->flush();
            it->second->close();
        }
        active_files_.erase(it);
    }
}

void FileLogger::ensure_directory_exists(const std::string& file_path) {
    std::filesystem::path dir = std::filesystem::path(file_path).parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
}

bool FileLogger::should_rotate_file(FileType file_type) const {
    const FileConfig config = get_file_config(file_type);
    std::error_code ec;
    auto size = std::filesystem::file_size(config.file_path, ec);
    return !ec && size >= config.max_file_size;
}

void FileLogger::perform_file_rotation(FileType file_type) {
    const FileConfig config = get_file_config(file_type);
    close_file(file_type);

    try {
        // path.N -> path.N+1, the oldest falls off
        for (int i = config.max_backup_files - 1; i >= 1; --i) {
            std::string older = config.file_path + "." + std::to_string(i);
            std::string newer = config.file_path + "." + std::to_string(i + 1);
            if (std::filesystem::exists(older)) {
                std::filesystem::rename(older, newer);
            }
        }
        if (config.max_backup_files > 0 && std::filesystem::exists(config.file_path)) {
            std::filesystem::rename(config.file_path, config.file_path + ".1");
        } else {
            std::filesystem::remove(config.file_path);
        }
        file_rotations_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "FileLogger: File rotation failed for "
                  << file_type_to_string(file_type) << ": " << e.what() << '\n';
    }
}

void FileLogger::flush_file(FileType file_type) {
    auto it = active_files_.find(file_type);
    if (it != active_files_.end() && it->second && it->second->is_open()) {
        it->second->flush();
        flush_operations_.fetch_add(1, std::memory_order_relaxed);
    }
}

void FileLogger::flush_all_files() {
    for (auto& [type, file] : active_files_) {
        if (file && file->is_open()) {
            file->flush();
            flush_operations_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

std::string FileLogger::format_log_message(const LogEntry& entry) const {
    if (entry.file_type == FileType::METRICS || entry.file_type == FileType::DENYLIST) {
        return entry.message;
    }

    std::ostringstream oss;
    oss << "[" << format_timestamp(entry.timestamp) << "] ";
    oss << "[" << log_level_to_string(entry.level) << "] ";

    if (!entry.source_file.empty()) {
        std::string filename = entry.source_file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }
        oss << "[" << filename << ":" << entry.line_number << "] ";
    }

    oss << entry.message;
    return oss.str();
}
