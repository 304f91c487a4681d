#include "hostpulse/config_manager.hpp"
#include "hostpulse/logger.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

// Minimal YAML subset: top-level scalars and one level of "section:" blocks
namespace hostpulse {

bool HostPulseConfig::validate() const {
    if (update_interval_ms <= 0 || history_size <= 0) {
        return false;
    }
    if (process.top_count <= 0 || public_ip.timeout_ms <= 0 || display.refresh_interval_ms <= 0) {
        return false;
    }
    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
{
}

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

static bool parse_int(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static bool parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == "true" || lower == "yes" || lower == "1";
}

static void apply_int(const std::string& key, const std::string& value, int& target) {
    if (!parse_int(value, target)) {
        Logger::warning("Config: ignoring non-integer value for ", key, ": ", value);
    }
}

bool ConfigManager::load() {
    std::error_code ec;
    if (!std::filesystem::exists(config_path_, ec)) {
        Logger::warning("Config file not found: ", config_path_, " (using defaults)");
        config_ = HostPulseConfig{};
        last_modified_ = {};
        return true;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("Failed to open config file: ", config_path_);
        return false;
    }

    // Store file modification time
    last_modified_ = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        Logger::error("Failed to get file modification time: ", ec.message());
        return false;
    }

    // Reset config to defaults
    config_ = HostPulseConfig{};

    std::string raw;
    std::string current_section;

    while (std::getline(file, raw)) {
        size_t indent = raw.find_first_not_of(' ');
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            Logger::warning("Config: skipping malformed line: ", line);
            continue;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Strip trailing comment
        size_t hash_pos = value.find(" #");
        if (hash_pos != std::string::npos) {
            value = trim(value.substr(0, hash_pos));
        }

        // Remove quotes from string values
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        // Section header (no indent, no value)
        if (indent == 0 && value.empty()) {
            current_section = key;
            continue;
        }

        if (indent == 0) {
            current_section.clear();
        }

        if (current_section.empty()) {
            if (key == "version") config_.version = value;
            else if (key == "update_interval_ms") apply_int(key, value, config_.update_interval_ms);
            else if (key == "history_size") apply_int(key, value, config_.history_size);
            else Logger::debug("Config: unknown key ", key);
        }
        else if (current_section == "cpu" && key == "enabled") config_.cpu.enabled = parse_bool(value);
        else if (current_section == "memory" && key == "enabled") config_.memory.enabled = parse_bool(value);
        else if (current_section == "disk" && key == "enabled") config_.disk.enabled = parse_bool(value);
        else if (current_section == "network" && key == "enabled") config_.network.enabled = parse_bool(value);
        else if (current_section == "temperature" && key == "enabled") config_.temperature.enabled = parse_bool(value);
        else if (current_section == "battery" && key == "enabled") config_.battery.enabled = parse_bool(value);
        else if (current_section == "process") {
            if (key == "enabled") config_.process.enabled = parse_bool(value);
            else if (key == "top_count") apply_int(key, value, config_.process.top_count);
        }
        else if (current_section == "public_ip") {
            if (key == "enabled") config_.public_ip.enabled = parse_bool(value);
            else if (key == "url") config_.public_ip.url = value;
            else if (key == "timeout_ms") apply_int(key, value, config_.public_ip.timeout_ms);
        }
        else if (current_section == "display") {
            if (key == "color_scheme") config_.display.color_scheme = value;
            else if (key == "refresh_interval_ms") apply_int(key, value, config_.display.refresh_interval_ms);
            else if (key == "show_graphs") config_.display.show_graphs = parse_bool(value);
            else if (key == "show_per_core") config_.display.show_per_core = parse_bool(value);
        }
        else if (current_section == "logging") {
            if (key == "debug") config_.logging.debug = parse_bool(value);
            else if (key == "log_to_file") config_.logging.log_to_file = parse_bool(value);
            else if (key == "log_path") config_.logging.log_path = value;
        }
        else {
            Logger::debug("Config: unknown key ", current_section, ".", key);
        }
    }

    return true;
}

bool ConfigManager::check_and_reload() {
    std::error_code ec;
    auto current_time = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        return false;
    }
    if (current_time != last_modified_) {
        Logger::info("Config file changed, reloading: ", config_path_);
        return load();
    }
    return false;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (config_.update_interval_ms <= 0) {
        error_msg = "update_interval_ms must be positive";
        return false;
    }

    if (config_.history_size <= 0) {
        error_msg = "history_size must be positive";
        return false;
    }

    if (config_.process.top_count <= 0) {
        error_msg = "process.top_count must be positive";
        return false;
    }

    if (config_.public_ip.enabled && config_.public_ip.url.empty()) {
        error_msg = "public_ip.url must not be empty when the lookup is enabled";
        return false;
    }

    if (!config_.validate()) {
        error_msg = "Configuration validation failed: invalid intervals or timeouts";
        return false;
    }

    return true;
}

} // namespace hostpulse
