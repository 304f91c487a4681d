#include "hostpulse/logger.hpp"
#include "hostpulse/config_manager.hpp"
#include <ctime>
#include <iomanip>

namespace hostpulse {

std::mutex Logger::mutex_;
std::ofstream Logger::log_file_;
bool Logger::debug_enabled_ = false;
LogLevel Logger::console_level_ = LogLevel::Debug;

void Logger::configure(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_enabled_ = config.debug;

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config.log_to_file && !config.log_path.empty()) {
        log_file_.open(config.log_path, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "[WARNING] Failed to open log file: " << config.log_path << std::endl;
        }
    }
}

void Logger::set_console_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_level_ = level;
}

void Logger::set_debug_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_enabled_ = enabled;
}

bool Logger::is_debug_enabled() {
    std::lock_guard<std::mutex> lock(mutex_);
    return debug_enabled_;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::string Logger::format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time_t);
#else
    localtime_r(&time_t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level >= console_level_) {
        std::cerr << "[" << level_name(level) << "] " << message << std::endl;
    }

    if (log_file_.is_open()) {
        log_file_ << "[" << format_timestamp(std::chrono::system_clock::now()) << "] "
                  << level_name(level) << " - " << message << "\n";
        log_file_.flush();
    }
}

} // namespace hostpulse
