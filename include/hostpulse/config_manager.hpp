#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <filesystem>

namespace hostpulse {

// On/off switch for a metric family that has no other settings
struct FamilyConfig {
    bool enabled = true;

    TYPICONF_DEFINE_FIELDS(FamilyConfig,
        TYPICONF_FIELD(enabled)
    )
};

struct ProcessConfig {
    bool enabled = true;
    int top_count = 10;

    TYPICONF_DEFINE_FIELDS(ProcessConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(top_count)
    )
};

struct PublicIpConfig {
    bool enabled = true;
    std::string url = "https://ipinfo.io/json";
    int timeout_ms = 5000;

    TYPICONF_DEFINE_FIELDS(PublicIpConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(url),
        TYPICONF_FIELD(timeout_ms)
    )
};

struct DisplayConfig {
    std::string color_scheme = "default";
    int refresh_interval_ms = 1500;
    bool show_graphs = true;
    bool show_per_core = true;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(color_scheme),
        TYPICONF_FIELD(refresh_interval_ms),
        TYPICONF_FIELD(show_graphs),
        TYPICONF_FIELD(show_per_core)
    )
};

struct LoggingConfig {
    bool debug = false;
    bool log_to_file = false;
    std::string log_path = "./hostpulse.log";

    TYPICONF_DEFINE_FIELDS(LoggingConfig,
        TYPICONF_FIELD(debug),
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path)
    )
};

struct HostPulseConfig {
    std::string version = "1.0";
    int update_interval_ms = 1500;
    int history_size = 60;
    FamilyConfig cpu;
    FamilyConfig memory;
    FamilyConfig disk;
    FamilyConfig network;
    FamilyConfig temperature;
    FamilyConfig battery;
    ProcessConfig process;
    PublicIpConfig public_ip;
    DisplayConfig display;
    LoggingConfig logging;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(HostPulseConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(update_interval_ms),
        TYPICONF_FIELD(history_size),
        TYPICONF_FIELD(cpu),
        TYPICONF_FIELD(memory),
        TYPICONF_FIELD(disk),
        TYPICONF_FIELD(network),
        TYPICONF_FIELD(temperature),
        TYPICONF_FIELD(battery),
        TYPICONF_FIELD(process),
        TYPICONF_FIELD(public_ip),
        TYPICONF_FIELD(display),
        TYPICONF_FIELD(logging)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration; a missing file leaves the built-in defaults
    bool load();

    // Reload if file changed (hot-reload)
    bool check_and_reload();

    // Access configuration
    const HostPulseConfig& get_config() const { return config_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    HostPulseConfig config_;
    std::filesystem::file_time_type last_modified_;
};

} // namespace hostpulse
