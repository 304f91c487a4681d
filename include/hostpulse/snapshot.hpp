#pragma once

#include "hostpulse/metrics_collector.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hostpulse {

enum class MetricFamily {
    Overview,
    Cpu,
    Memory,
    Disk,
    Network,
    Temperature,
    Process,
    Battery
};

const char* metric_family_name(MetricFamily family);

struct SystemOverview {
    std::string os_name;
    std::string host_name;
    uint64_t uptime_seconds = 0;
};

struct CpuInfo {
    std::string name;
    double usage_percent = 0.0;              // 0-100%
    uint32_t core_count = 0;                 // Always per_core_usage.size()
    std::vector<double> per_core_usage;
};

struct MemoryInfo {
    double total_gb = 0.0;                   // GiB (bytes / 1024^3)
    double used_gb = 0.0;
    double usage_percent = 0.0;
};

struct DiskInfo {
    std::string name;
    std::string mount_point;
    double total_gb = 0.0;
    double used_gb = 0.0;
    double available_gb = 0.0;
    double usage_percent = 0.0;
    std::string fs_type;
};

struct NetworkInterfaceInfo {
    std::string name;
    std::string mac_address;
    std::vector<std::string> ip_addresses;
    uint64_t received_bytes_cumulative = 0;
    uint64_t transmitted_bytes_cumulative = 0;
};

struct TemperatureInfo {
    std::string label;
    double celsius = 0.0;
};

struct ProcessEntry {
    std::string name;
    uint32_t pid = 0;
    double cpu_usage_percent = 0.0;
    double memory_mb = 0.0;
};

// Result of one tick. Published as std::shared_ptr<const Snapshot> and never modified afterwards.
struct Snapshot {
    SystemOverview overview;
    CpuInfo cpu;
    MemoryInfo memory;
    std::vector<DiskInfo> disks;
    std::vector<NetworkInterfaceInfo> networks;
    std::vector<TemperatureInfo> temperatures;
    std::vector<ProcessEntry> top_processes;
    std::optional<BatteryInfo> battery;

    // Monotonic capture time, used for rate derivation
    std::chrono::steady_clock::time_point taken_at;

    // Families that failed this tick and were replaced by defaults
    std::map<MetricFamily, ReaderError> failures;

    // Families switched off in the configuration; never read, never failed
    std::set<MetricFamily> disabled;

    bool available(MetricFamily family) const { return failures.count(family) == 0; }
    bool enabled(MetricFamily family) const { return disabled.count(family) == 0; }
};

struct NetworkRates {
    double download_bytes_per_sec = 0.0;
    double upload_bytes_per_sec = 0.0;
};

struct PublicIpInfo {
    std::string ip;
    std::optional<std::string> city;
    std::optional<std::string> region;
    std::optional<std::string> country;
    std::optional<std::string> org;
};

} // namespace hostpulse
