#pragma once

#include "hostpulse/metrics_collector.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Parsers for Linux procfs/sysfs text. They take file contents rather than
// paths so they can be exercised without a live /proc.
namespace hostpulse::procfs {

// Read a whole file; maps errno to a ReaderError
ReaderError read_file(const std::string& path, std::string& out);

// First line of a sysfs attribute, trimmed; empty when unreadable
std::string read_attribute(const std::string& path);

std::string trim(const std::string& str);

struct CpuTimes {
    uint64_t total = 0;
    uint64_t idle = 0;                       // idle + iowait
};

// "cpu" aggregate line first, then one entry per "cpuN" line
std::vector<CpuTimes> parse_cpu_times(const std::string& proc_stat);

// Busy percentage between two samples of the same CPU
double busy_percent(const CpuTimes& previous, const CpuTimes& current);

std::string parse_cpu_model(const std::string& cpuinfo);

// MemTotal and MemAvailable (falls back to MemFree + Buffers + Cached on old kernels)
std::optional<MemoryReading> parse_meminfo(const std::string& meminfo);

struct NetDevCounters {
    std::string name;
    uint64_t received_bytes = 0;
    uint64_t transmitted_bytes = 0;
};

std::vector<NetDevCounters> parse_net_dev(const std::string& net_dev);

// True for an empty or all-zero hardware address
bool is_null_mac(const std::string& mac);

struct MountEntry {
    std::string device;
    std::string mount_point;
    std::string fs_type;
};

std::vector<MountEntry> parse_mounts(const std::string& mounts);

bool is_pseudo_filesystem(const std::string& fs_type);

struct PidStat {
    uint32_t pid = 0;
    std::string comm;
    uint64_t utime = 0;
    uint64_t stime = 0;
    int64_t rss_pages = 0;
};

std::optional<PidStat> parse_pid_stat(const std::string& stat);

std::optional<uint64_t> parse_uptime(const std::string& uptime);

// PRETTY_NAME from /etc/os-release, quotes removed
std::string parse_os_release_name(const std::string& os_release);

} // namespace hostpulse::procfs
