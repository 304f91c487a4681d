#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace hostpulse {

struct LoggingConfig;

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

class Logger {
public:
    // Apply logging settings (debug flag, log file)
    static void configure(const LoggingConfig& config);

    // Lowest level echoed to std::cerr (file output is unaffected)
    static void set_console_level(LogLevel level);

    static void set_debug_enabled(bool enabled);
    static bool is_debug_enabled();

    template<typename... Args>
    static void debug(Args&&... args) {
        if (is_debug_enabled()) {
            write(LogLevel::Debug, concat(std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void info(Args&&... args) {
        write(LogLevel::Info, concat(std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void warning(Args&&... args) {
        write(LogLevel::Warning, concat(std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void error(Args&&... args) {
        write(LogLevel::Error, concat(std::forward<Args>(args)...));
    }

    // Close the log file, if any
    static void shutdown();

private:
    template<typename... Args>
    static std::string concat(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    static void write(LogLevel level, const std::string& message);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
    static const char* level_name(LogLevel level);

    static std::mutex mutex_;
    static std::ofstream log_file_;
    static bool debug_enabled_;
    static LogLevel console_level_;
};

} // namespace hostpulse
