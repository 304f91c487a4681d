#include "hostpulse/config_manager.hpp"
#include "hostpulse/display.hpp"
#include "hostpulse/logger.hpp"
#include "hostpulse/snapshot_json.hpp"
#include "hostpulse/system_monitor.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;
volatile std::sig_atomic_t g_ip_refresh_requested = 0;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = 1;
    }
#ifdef SIGUSR1
    else if (signal == SIGUSR1) {
        g_ip_refresh_requested = 1;
    }
#endif
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file      Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  --json           Take two samples, print one JSON report and exit\n";
    std::cout << "  --no-public-ip   Skip the public IP lookup\n";
    std::cout << "  -h, --help       Show this help message\n";
    std::cout << "\n";
    std::cout << "Send SIGUSR1 to refresh the public IP while the dashboard runs.\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " --json --no-public-ip\n";
    std::cout << "  " << program_name << " custom_config.yaml\n";
    std::cout << "\n";
}

int run_json_report(hostpulse::HostPulseConfig config) {
    hostpulse::Logger::set_console_level(hostpulse::LogLevel::Warning);

    hostpulse::SystemMonitor monitor(config);

    // Rates and per-process usage need two samples one interval apart
    monitor.tick();
    monitor.refresh_public_ip();
    std::this_thread::sleep_for(std::chrono::milliseconds(config.update_interval_ms));
    monitor.tick();

    std::cout << hostpulse::dump_json(hostpulse::build_report(monitor.read_model())) << "\n";
    return 0;
}

int run_dashboard(hostpulse::ConfigManager& config_manager, hostpulse::HostPulseConfig config,
                  bool& lookup_abandoned) {
    // Keep log lines from scrolling the dashboard; the log file still gets everything
    hostpulse::Logger::set_console_level(hostpulse::LogLevel::Error);

    hostpulse::SystemMonitor monitor(config);
    hostpulse::Display display(config.display);

    if (!monitor.start()) {
        std::cerr << "Failed to start HostPulse\n";
        return 1;
    }

    auto refresh = std::chrono::milliseconds(config.display.refresh_interval_ms);
    auto next_render = std::chrono::steady_clock::now();

    while (!g_stop_requested) {
        if (g_ip_refresh_requested) {
            g_ip_refresh_requested = 0;
            monitor.request_public_ip_refresh();
        }

        if (config_manager.check_and_reload()) {
            std::string error_msg;
            if (config_manager.validate_config(error_msg)) {
                // Sampling settings apply on restart; display and logging apply now
                config = config_manager.get_config();
                display.update_config(config.display);
                hostpulse::Logger::configure(config.logging);
                refresh = std::chrono::milliseconds(config.display.refresh_interval_ms);
            } else {
                hostpulse::Logger::warning("Ignoring invalid configuration change: ", error_msg);
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_render) {
            display.render(monitor.read_model());
            next_render = now + refresh;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n\nReceived shutdown signal. Stopping HostPulse...\n";
    monitor.stop();
    lookup_abandoned = monitor.lookup_abandoned();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    std::string config_path = "config/default_config.yaml";
    bool json_mode = false;
    bool public_ip = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--no-public-ip") {
            public_ip = false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            config_path = arg;
        }
    }

    hostpulse::ConfigManager config_manager(config_path);
    if (!config_manager.load()) {
        std::cerr << "Failed to load configuration from " << config_path << "\n";
        return 1;
    }

    std::string error_msg;
    if (!config_manager.validate_config(error_msg)) {
        std::cerr << "Configuration validation failed: " << error_msg << "\n";
        return 1;
    }

    hostpulse::HostPulseConfig config = config_manager.get_config();
    if (!public_ip) {
        config.public_ip.enabled = false;
    }
    hostpulse::Logger::configure(config.logging);

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGUSR1
    std::signal(SIGUSR1, signal_handler);
#endif

    bool lookup_abandoned = false;
    int rc = json_mode ? run_json_report(config) : run_dashboard(config_manager, config, lookup_abandoned);

    hostpulse::Logger::shutdown();

    // The abandoned lookup thread still uses the logger and cpr; skip static destruction
    if (lookup_abandoned) {
        std::cout.flush();
        std::cerr.flush();
        std::quick_exit(rc);
    }
    return rc;
}
