#pragma once

#include "hostpulse/config_manager.hpp"
#include "hostpulse/read_model.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace hostpulse {

// Color band for a percentage bar
enum class UsageBand {
    Low,
    Elevated,
    High
};

UsageBand usage_band(double percent);

// Terminal dashboard. Pulls everything from the ReadModel on each render.
class Display {
public:
    explicit Display(const DisplayConfig& config);

    // Clear screen and render full dashboard
    void render(const ReadModel& model);

    // Update configuration (for hot-reload)
    void update_config(const DisplayConfig& config);

private:
    void render_header();
    void render_overview(const Snapshot& snapshot);
    void render_cpu(const Snapshot& snapshot);
    void render_memory(const Snapshot& snapshot);
    void render_disks(const Snapshot& snapshot);
    void render_network(const Snapshot& snapshot, const NetworkRates& rates);
    void render_temperatures(const Snapshot& snapshot);
    void render_processes(const Snapshot& snapshot);
    void render_battery(const Snapshot& snapshot, const std::optional<BatteryInfo>& battery);
    void render_public_ip(const ReadModel& model);
    void render_history(const std::deque<double>& cpu_history, const std::deque<double>& memory_history);
    void render_footer();

    // Per-section placeholder when a family is disabled or failed this tick
    bool render_unavailable(const Snapshot& snapshot, MetricFamily family, const char* title);

    // Helper rendering functions
    std::string create_progress_bar(double percentage, int width);
    std::string create_graph(const std::deque<double>& data);

    // Color helpers (ANSI escape codes)
    std::string colorize(const std::string& text, UsageBand band);
    std::string color_code(UsageBand band);
    std::string reset_color();
    void clear_screen();

    DisplayConfig config_;
};

// Helper functions for formatting
std::string format_bytes(uint64_t bytes);
std::string format_rate(double bytes_per_sec);
std::string format_duration(uint64_t seconds);

} // namespace hostpulse
