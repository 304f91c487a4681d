#include "hostpulse/display.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace hostpulse {

namespace {
constexpr int kBoxWidth = 60;
constexpr int kBarWidth = 20;
constexpr size_t kMaxCoresShown = 32;
}

UsageBand usage_band(double percent) {
    if (percent >= 90.0) {
        return UsageBand::High;
    } else if (percent >= 70.0) {
        return UsageBand::Elevated;
    }
    return UsageBand::Low;
}

Display::Display(const DisplayConfig& config)
    : config_(config)
{
}

void Display::update_config(const DisplayConfig& config) {
    config_ = config;
}

std::string Display::color_code(UsageBand band) {
    if (config_.color_scheme == "mono") {
        return "";
    }

    switch (band) {
        case UsageBand::Low:      return "\033[32m";  // Green
        case UsageBand::Elevated: return "\033[33m";  // Yellow
        case UsageBand::High:     return "\033[31m";  // Red
    }
    return "\033[0m";
}

std::string Display::reset_color() {
    if (config_.color_scheme == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string Display::colorize(const std::string& text, UsageBand band) {
    return color_code(band) + text + reset_color();
}

void Display::clear_screen() {
    std::cout << "\033[2J\033[H" << std::flush;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string format_rate(double bytes_per_sec) {
    return format_bytes(static_cast<uint64_t>(std::max(0.0, bytes_per_sec))) + "/s";
}

std::string format_duration(uint64_t seconds) {
    uint64_t days = seconds / 86400;
    uint64_t hours = (seconds % 86400) / 3600;
    uint64_t minutes = (seconds % 3600) / 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    oss << hours << "h " << minutes << "m";
    return oss.str();
}

std::string Display::create_progress_bar(double percentage, int width) {
    int filled = static_cast<int>(std::min(100.0, std::max(0.0, percentage)) / 100.0 * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return colorize(bar, usage_band(percentage));
}

std::string Display::create_graph(const std::deque<double>& data) {
    if (data.empty()) {
        return std::string(30, ' ');
    }

    // Percent series share a fixed 0-100 scale so the graphs are comparable
    const char* blocks[] = {" ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

    std::ostringstream oss;
    for (double val : data) {
        int block_index = static_cast<int>((val / 100.0) * 8);
        block_index = std::min(8, std::max(0, block_index));
        oss << blocks[block_index];
    }

    return oss.str();
}

bool Display::render_unavailable(const Snapshot& snapshot, MetricFamily family, const char* title) {
    if (!snapshot.enabled(family)) {
        std::cout << "[" << title << "]  disabled\n\n";
        return true;
    }

    auto it = snapshot.failures.find(family);
    if (it == snapshot.failures.end()) {
        return false;
    }
    std::cout << "[" << title << "]  " << colorize(std::string("unavailable (") + reader_error_name(it->second) + ")",
                                                  UsageBand::Elevated) << "\n\n";
    return true;
}

void Display::render_header() {
    const std::string title = "HOSTPULSE";
    const int padding = (kBoxWidth - static_cast<int>(title.length())) / 2;

    std::cout << "╔";
    for (int i = 0; i < kBoxWidth; ++i) std::cout << "═";
    std::cout << "╗\n";

    std::cout << "║";
    for (int i = 0; i < padding; ++i) std::cout << " ";
    std::cout << title;
    for (int i = 0; i < kBoxWidth - padding - static_cast<int>(title.length()); ++i) std::cout << " ";
    std::cout << "║\n";

    std::cout << "╚";
    for (int i = 0; i < kBoxWidth; ++i) std::cout << "═";
    std::cout << "╝\n\n";
}

void Display::render_overview(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Overview, "System")) {
        return;
    }
    std::cout << "[System]  " << snapshot.overview.host_name << "  |  " << snapshot.overview.os_name
              << "  |  up " << format_duration(snapshot.overview.uptime_seconds) << "\n\n";
}

void Display::render_cpu(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Cpu, "CPU")) {
        return;
    }
    const auto& cpu = snapshot.cpu;

    std::cout << "[CPU]  ";
    std::cout << create_progress_bar(cpu.usage_percent, kBarWidth);
    std::cout << "  " << colorize(std::to_string(static_cast<int>(cpu.usage_percent)) + "%", usage_band(cpu.usage_percent));
    std::cout << "  " << cpu.name << " (" << cpu.core_count << " threads)\n";

    // Per-thread display (only if enabled and reasonable number of threads)
    if (config_.show_per_core && !cpu.per_core_usage.empty() && cpu.per_core_usage.size() <= kMaxCoresShown) {
        for (size_t i = 0; i < cpu.per_core_usage.size(); ++i) {
            std::cout << "  Thread " << std::setw(2) << i << ": ";
            std::cout << create_progress_bar(cpu.per_core_usage[i], kBarWidth);
            std::cout << "  " << std::setw(3) << static_cast<int>(cpu.per_core_usage[i]) << "%\n";
        }
    }
    std::cout << "\n";
}

void Display::render_memory(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Memory, "Memory")) {
        return;
    }
    const auto& memory = snapshot.memory;

    std::cout << "[Memory]  ";
    std::cout << create_progress_bar(memory.usage_percent, kBarWidth);
    std::cout << "  " << colorize(std::to_string(static_cast<int>(memory.usage_percent)) + "%",
                                  usage_band(memory.usage_percent));
    std::cout << " (" << std::fixed << std::setprecision(2) << memory.used_gb << " GB / "
              << memory.total_gb << " GB)\n\n";
}

void Display::render_disks(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Disk, "Disk")) {
        return;
    }
    std::cout << "[Disk]\n";

    for (const auto& disk : snapshot.disks) {
        std::cout << "  " << std::setw(20) << std::left << disk.mount_point;
        std::cout << create_progress_bar(disk.usage_percent, kBarWidth);
        std::cout << "  " << std::setw(3) << std::right << static_cast<int>(disk.usage_percent) << "%";
        std::cout << " (" << std::fixed << std::setprecision(1) << disk.used_gb << " / " << disk.total_gb
                  << " GB, " << disk.fs_type << ")\n";
    }
    std::cout << "\n";
}

void Display::render_network(const Snapshot& snapshot, const NetworkRates& rates) {
    if (render_unavailable(snapshot, MetricFamily::Network, "Network")) {
        return;
    }
    std::cout << "[Network]  ↓ " << format_rate(rates.download_bytes_per_sec)
              << "   ↑ " << format_rate(rates.upload_bytes_per_sec) << "\n";

    for (const auto& net : snapshot.networks) {
        std::cout << "  " << std::setw(12) << std::left << net.name << std::right;
        std::cout << net.mac_address;
        if (!net.ip_addresses.empty()) {
            std::cout << "  " << net.ip_addresses.front();
        }
        std::cout << "  (RX: " << format_bytes(net.received_bytes_cumulative)
                  << ", TX: " << format_bytes(net.transmitted_bytes_cumulative) << ")\n";
    }
    std::cout << "\n";
}

void Display::render_temperatures(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Temperature, "Temperature")) {
        return;
    }
    if (snapshot.temperatures.empty()) {
        return;
    }

    std::cout << "[Temperature]\n";
    for (const auto& temp : snapshot.temperatures) {
        std::cout << "  " << std::setw(30) << std::left << temp.label << std::right
                  << std::fixed << std::setprecision(1) << temp.celsius << " °C\n";
    }
    std::cout << "\n";
}

void Display::render_processes(const Snapshot& snapshot) {
    if (render_unavailable(snapshot, MetricFamily::Process, "Processes")) {
        return;
    }

    std::cout << "[Top Processes]\n";
    std::cout << "  " << std::setw(8) << "PID" << "  " << std::setw(7) << "CPU%" << "  "
              << std::setw(10) << "MEM" << "  NAME\n";
    for (const auto& proc : snapshot.top_processes) {
        std::cout << "  " << std::setw(8) << proc.pid << "  "
                  << std::setw(7) << std::fixed << std::setprecision(1) << proc.cpu_usage_percent << "  "
                  << std::setw(7) << std::setprecision(1) << proc.memory_mb << " MB  "
                  << proc.name << "\n";
    }
    std::cout << "\n";
}

void Display::render_battery(const Snapshot& snapshot, const std::optional<BatteryInfo>& battery) {
    if (render_unavailable(snapshot, MetricFamily::Battery, "Battery")) {
        return;
    }
    if (!battery) {
        return;
    }

    std::cout << "[Battery]  " << create_progress_bar(battery->percentage, kBarWidth)
              << "  " << static_cast<int>(battery->percentage) << "%  " << battery->state
              << "  health " << static_cast<int>(battery->health_percent) << "%";
    if (battery->cycle_count) {
        std::cout << "  cycles " << *battery->cycle_count;
    }
    if (battery->time_to_empty_minutes) {
        std::cout << "  " << static_cast<int>(*battery->time_to_empty_minutes) << " min left";
    } else if (battery->time_to_full_minutes) {
        std::cout << "  " << static_cast<int>(*battery->time_to_full_minutes) << " min to full";
    }
    std::cout << "\n\n";
}

void Display::render_public_ip(const ReadModel& model) {
    auto ip = model.get_public_ip();
    PublicIpStatus status = model.public_ip_status();

    std::cout << "[Public IP]  ";
    if (ip) {
        std::cout << ip->ip;
        if (ip->city) std::cout << "  " << *ip->city;
        if (ip->region) std::cout << ", " << *ip->region;
        if (ip->country) std::cout << ", " << *ip->country;
        if (ip->org) std::cout << "  (" << *ip->org << ")";
        if (status == PublicIpStatus::Unavailable) {
            std::cout << "  " << colorize("[stale]", UsageBand::Elevated);
        }
    } else if (status == PublicIpStatus::NotAttempted) {
        std::cout << "loading...";
    } else {
        std::cout << colorize("unavailable", UsageBand::Elevated);
    }
    std::cout << "\n\n";
}

void Display::render_history(const std::deque<double>& cpu_history, const std::deque<double>& memory_history) {
    if (!config_.show_graphs || cpu_history.empty()) {
        return;
    }

    std::cout << "[History - Last " << cpu_history.size() << " samples]\n";
    std::cout << "CPU:  " << create_graph(cpu_history) << "\n";
    std::cout << "MEM:  " << create_graph(memory_history) << "\n";
    std::cout << "\n";
}

void Display::render_footer() {
    std::cout << "Press Ctrl+C to quit, SIGUSR1 refreshes the public IP\n";
}

void Display::render(const ReadModel& model) {
    clear_screen();
    render_header();

    // One lock for the whole frame so snapshot, rates and history come from the same tick
    TickView tick = model.view();
    const auto& snapshot = tick.snapshot;
    if (!snapshot) {
        std::cout << "Collecting first sample...\n";
        std::cout << std::flush;
        return;
    }

    render_overview(*snapshot);
    render_cpu(*snapshot);
    render_memory(*snapshot);
    render_disks(*snapshot);
    render_network(*snapshot, tick.rates);
    render_temperatures(*snapshot);
    render_processes(*snapshot);
    render_battery(*snapshot, tick.battery);
    render_public_ip(model);
    render_history(tick.cpu_history, tick.memory_history);
    render_footer();
    std::cout << std::flush;
}

} // namespace hostpulse
