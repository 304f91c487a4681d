#include "hostpulse/metrics_collector.hpp"
#include "hostpulse/logger.hpp"
#include "hostpulse/procfs.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hostpulse {

namespace {

std::optional<uint64_t> read_u64(const fs::path& path) {
    std::string text = procfs::read_attribute(path.string());
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

bool is_numeric(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Interface name -> addresses, from getifaddrs()
std::map<std::string, std::vector<std::string>> interface_addresses() {
    std::map<std::string, std::vector<std::string>> addresses;

    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        Logger::debug("getifaddrs failed, errno ", errno);
        return addresses;
    }

    for (struct ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr) continue;

        char buffer[INET6_ADDRSTRLEN] = {};
        const void* raw = nullptr;
        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            raw = &reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr)->sin_addr;
        } else if (family == AF_INET6) {
            raw = &reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr)->sin6_addr;
        } else {
            continue;
        }

        if (inet_ntop(family, raw, buffer, sizeof(buffer)) != nullptr) {
            addresses[ifa->ifa_name].emplace_back(buffer);
        }
    }

    freeifaddrs(list);
    return addresses;
}

} // namespace

class LinuxMetricsCollector : public MetricsCollector {
public:
    LinuxMetricsCollector() {
        long page_size = sysconf(_SC_PAGESIZE);
        page_size_ = page_size > 0 ? static_cast<uint64_t>(page_size) : 4096;

        // Prime the CPU and process baselines so the first tick has an interval to measure
        std::string stat;
        if (procfs::read_file("/proc/stat", stat) == ReaderError::None) {
            prev_cpu_times_ = procfs::parse_cpu_times(stat);
        }
        prime_process_times();

        // Get hardware model name (cache it)
        std::string cpuinfo;
        cpu_model_ = procfs::read_file("/proc/cpuinfo", cpuinfo) == ReaderError::None
            ? procfs::parse_cpu_model(cpuinfo)
            : "Unknown CPU";
    }

    ReadResult<OverviewReading> read_overview() override {
        OverviewReading overview;

        std::string uptime_text;
        ReaderError error = procfs::read_file("/proc/uptime", uptime_text);
        if (error != ReaderError::None) {
            return ReadResult<OverviewReading>::failure(error);
        }
        auto uptime = procfs::parse_uptime(uptime_text);
        if (!uptime) {
            return ReadResult<OverviewReading>::failure(ReaderError::Unavailable);
        }
        overview.uptime_seconds = *uptime;

        std::string os_release;
        if (procfs::read_file("/etc/os-release", os_release) == ReaderError::None ||
            procfs::read_file("/usr/lib/os-release", os_release) == ReaderError::None) {
            overview.os_name = procfs::parse_os_release_name(os_release);
        }
        if (overview.os_name.empty()) {
            struct utsname uts;
            if (uname(&uts) == 0) {
                overview.os_name = std::string(uts.sysname) + " " + uts.release;
            }
        }

        char host[256] = {};
        if (gethostname(host, sizeof(host) - 1) == 0) {
            overview.host_name = host;
        }

        return ReadResult<OverviewReading>::success(std::move(overview));
    }

    ReadResult<CpuReading> read_cpu() override {
        std::string stat;
        ReaderError error = procfs::read_file("/proc/stat", stat);
        if (error != ReaderError::None) {
            return ReadResult<CpuReading>::failure(error);
        }

        auto times = procfs::parse_cpu_times(stat);
        if (times.empty()) {
            return ReadResult<CpuReading>::failure(ReaderError::Unavailable);
        }

        CpuReading reading;
        reading.name = cpu_model_;

        // Index 0 is the aggregate line; a CPU that appeared since the last read reports 0
        for (size_t i = 0; i < times.size(); ++i) {
            double usage = i < prev_cpu_times_.size()
                ? procfs::busy_percent(prev_cpu_times_[i], times[i])
                : 0.0;
            if (i == 0) {
                reading.usage_percent = usage;
            } else {
                reading.per_core_usage.push_back(usage);
            }
        }

        prev_cpu_times_ = std::move(times);
        return ReadResult<CpuReading>::success(std::move(reading));
    }

    ReadResult<MemoryReading> read_memory() override {
        std::string meminfo;
        ReaderError error = procfs::read_file("/proc/meminfo", meminfo);
        if (error != ReaderError::None) {
            return ReadResult<MemoryReading>::failure(error);
        }

        auto reading = procfs::parse_meminfo(meminfo);
        if (!reading) {
            return ReadResult<MemoryReading>::failure(ReaderError::Unavailable);
        }
        return ReadResult<MemoryReading>::success(*reading);
    }

    ReadResult<std::vector<DiskReading>> read_disks() override {
        std::string mounts;
        ReaderError error = procfs::read_file("/proc/self/mounts", mounts);
        if (error != ReaderError::None) {
            return ReadResult<std::vector<DiskReading>>::failure(error);
        }

        std::vector<DiskReading> disks;
        std::set<std::string> seen_mount_points;

        for (const auto& entry : procfs::parse_mounts(mounts)) {
            if (procfs::is_pseudo_filesystem(entry.fs_type)) continue;
            if (!seen_mount_points.insert(entry.mount_point).second) continue;

            struct statvfs stat;
            if (statvfs(entry.mount_point.c_str(), &stat) != 0) {
                Logger::debug("statvfs(", entry.mount_point, ") failed, errno ", errno);
                continue;
            }
            if (stat.f_blocks == 0) continue;

            DiskReading disk;
            disk.name = entry.device;
            disk.mount_point = entry.mount_point;
            disk.fs_type = entry.fs_type;
            disk.total_bytes = static_cast<uint64_t>(stat.f_blocks) * stat.f_frsize;
            disk.available_bytes = static_cast<uint64_t>(stat.f_bavail) * stat.f_frsize;
            disks.push_back(std::move(disk));
        }

        return ReadResult<std::vector<DiskReading>>::success(std::move(disks));
    }

    ReadResult<std::vector<NetworkReading>> read_networks() override {
        std::string net_dev;
        ReaderError error = procfs::read_file("/proc/net/dev", net_dev);
        if (error != ReaderError::None) {
            return ReadResult<std::vector<NetworkReading>>::failure(error);
        }

        auto addresses = interface_addresses();
        std::vector<NetworkReading> networks;

        for (auto& counters : procfs::parse_net_dev(net_dev)) {
            std::string mac = procfs::read_attribute("/sys/class/net/" + counters.name + "/address");
            if (procfs::is_null_mac(mac)) continue;

            NetworkReading net;
            net.name = counters.name;
            net.mac_address = mac;
            net.received_bytes = counters.received_bytes;
            net.transmitted_bytes = counters.transmitted_bytes;

            auto it = addresses.find(counters.name);
            if (it != addresses.end()) {
                net.ip_addresses = it->second;
            }
            networks.push_back(std::move(net));
        }

        return ReadResult<std::vector<NetworkReading>>::success(std::move(networks));
    }

    ReadResult<std::vector<TemperatureReading>> read_temperatures() override {
        std::vector<TemperatureReading> temperatures;
        read_hwmon(temperatures);

        if (temperatures.empty()) {
            read_thermal_zones(temperatures);
        }

        return ReadResult<std::vector<TemperatureReading>>::success(std::move(temperatures));
    }

    ReadResult<std::vector<ProcessReading>> read_processes() override {
        std::string stat;
        ReaderError error = procfs::read_file("/proc/stat", stat);
        if (error != ReaderError::None) {
            return ReadResult<std::vector<ProcessReading>>::failure(error);
        }
        auto times = procfs::parse_cpu_times(stat);
        if (times.empty()) {
            return ReadResult<std::vector<ProcessReading>>::failure(ReaderError::Unavailable);
        }

        std::error_code ec;
        fs::directory_iterator it("/proc", ec);
        if (ec) {
            return ReadResult<std::vector<ProcessReading>>::failure(
                ec == std::errc::permission_denied ? ReaderError::PermissionDenied : ReaderError::Unavailable);
        }

        uint64_t total_now = times[0].total;
        uint64_t total_diff = total_now > prev_process_total_ ? total_now - prev_process_total_ : 0;

        std::vector<ProcessReading> processes;
        std::unordered_map<uint32_t, uint64_t> current_ticks;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;
            std::string name = entry.path().filename().string();
            if (!is_numeric(name)) continue;

            // Processes can exit between listing and reading; skip them
            std::string pid_stat;
            if (procfs::read_file(entry.path().string() + "/stat", pid_stat) != ReaderError::None) continue;
            auto parsed = procfs::parse_pid_stat(pid_stat);
            if (!parsed) continue;

            uint64_t ticks = parsed->utime + parsed->stime;
            current_ticks[parsed->pid] = ticks;

            ProcessReading proc;
            proc.name = parsed->comm;
            proc.pid = parsed->pid;
            proc.resident_bytes = parsed->rss_pages > 0
                ? static_cast<uint64_t>(parsed->rss_pages) * page_size_
                : 0;

            auto prev = prev_process_ticks_.find(parsed->pid);
            if (prev != prev_process_ticks_.end() && total_diff > 0 && ticks >= prev->second) {
                proc.cpu_usage_percent =
                    100.0 * static_cast<double>(ticks - prev->second) / static_cast<double>(total_diff);
            }

            processes.push_back(std::move(proc));
        }

        prev_process_ticks_ = std::move(current_ticks);
        prev_process_total_ = total_now;
        return ReadResult<std::vector<ProcessReading>>::success(std::move(processes));
    }

    ReadResult<std::optional<BatteryInfo>> read_battery() override {
        const fs::path supplies("/sys/class/power_supply");
        std::error_code ec;
        if (!fs::exists(supplies, ec)) {
            return ReadResult<std::optional<BatteryInfo>>::success(std::nullopt);
        }

        fs::directory_iterator it(supplies, ec);
        if (ec) {
            return ReadResult<std::optional<BatteryInfo>>::failure(
                ec == std::errc::permission_denied ? ReaderError::PermissionDenied : ReaderError::Unavailable);
        }

        for (const auto& entry : it) {
            const fs::path& dir = entry.path();
            if (procfs::read_attribute((dir / "type").string()) != "Battery") continue;
            // Peripheral batteries (mice, keyboards) report scope "Device"
            if (procfs::read_attribute((dir / "scope").string()) == "Device") continue;

            return ReadResult<std::optional<BatteryInfo>>::success(read_battery_dir(dir));
        }

        return ReadResult<std::optional<BatteryInfo>>::success(std::nullopt);
    }

private:
    void prime_process_times() {
        std::string stat;
        if (procfs::read_file("/proc/stat", stat) != ReaderError::None) return;
        auto times = procfs::parse_cpu_times(stat);
        if (times.empty()) return;
        prev_process_total_ = times[0].total;

        std::error_code ec;
        for (fs::directory_iterator it("/proc", ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::string name = entry.path().filename().string();
            if (!is_numeric(name)) continue;

            std::string pid_stat;
            if (procfs::read_file(entry.path().string() + "/stat", pid_stat) != ReaderError::None) continue;
            if (auto parsed = procfs::parse_pid_stat(pid_stat)) {
                prev_process_ticks_[parsed->pid] = parsed->utime + parsed->stime;
            }
        }
    }

    // /sys/class/hwmon/hwmon*/temp*_input, millidegrees Celsius
    void read_hwmon(std::vector<TemperatureReading>& out) {
        std::error_code ec;
        fs::directory_iterator hwmon_dir("/sys/class/hwmon", ec);
        if (ec) return;

        for (const auto& chip : hwmon_dir) {
            std::string chip_name = procfs::read_attribute((chip.path() / "name").string());
            if (chip_name.empty()) {
                chip_name = chip.path().filename().string();
            }

            std::error_code chip_ec;
            fs::directory_iterator sensors(chip.path(), chip_ec);
            if (chip_ec) continue;

            for (const auto& sensor : sensors) {
                std::string file = sensor.path().filename().string();
                size_t suffix = file.find("_input");
                if (file.rfind("temp", 0) != 0 || suffix == std::string::npos) continue;

                auto millidegrees = read_u64(sensor.path());
                if (!millidegrees || *millidegrees == 0) continue;

                std::string base = file.substr(0, suffix);
                std::string label = procfs::read_attribute((chip.path() / (base + "_label")).string());

                TemperatureReading reading;
                reading.label = label.empty() ? chip_name + " " + base : chip_name + " " + label;
                reading.celsius = static_cast<double>(*millidegrees) / 1000.0;
                out.push_back(std::move(reading));
            }
        }
    }

    void read_thermal_zones(std::vector<TemperatureReading>& out) {
        std::error_code ec;
        fs::directory_iterator zones("/sys/class/thermal", ec);
        if (ec) return;

        for (const auto& zone : zones) {
            std::string name = zone.path().filename().string();
            if (name.rfind("thermal_zone", 0) != 0) continue;

            auto millidegrees = read_u64(zone.path() / "temp");
            if (!millidegrees || *millidegrees == 0) continue;

            std::string type = procfs::read_attribute((zone.path() / "type").string());

            TemperatureReading reading;
            reading.label = type.empty() ? name : type;
            reading.celsius = static_cast<double>(*millidegrees) / 1000.0;
            out.push_back(std::move(reading));
        }
    }

    BatteryInfo read_battery_dir(const fs::path& dir) {
        BatteryInfo info;

        // Batteries report either energy_* (µWh, power_now in µW) or charge_* (µAh, current_now in µA)
        auto now = read_u64(dir / "energy_now");
        auto full = read_u64(dir / "energy_full");
        auto design = read_u64(dir / "energy_full_design");
        auto rate = read_u64(dir / "power_now");
        if (!now) {
            now = read_u64(dir / "charge_now");
            full = read_u64(dir / "charge_full");
            design = read_u64(dir / "charge_full_design");
            rate = read_u64(dir / "current_now");
        }

        if (auto capacity = read_u64(dir / "capacity")) {
            info.percentage = static_cast<double>(*capacity);
        } else if (now && full && *full > 0) {
            info.percentage = 100.0 * static_cast<double>(*now) / static_cast<double>(*full);
        }

        std::string status = procfs::read_attribute((dir / "status").string());
        if (status == "Charging" || status == "Discharging" || status == "Full") {
            info.state = status;
        } else {
            info.state = "Unknown";
        }
        info.is_charging = status == "Charging";

        info.health_percent = 100.0;
        if (full && design && *design > 0) {
            info.health_percent = 100.0 * static_cast<double>(*full) / static_cast<double>(*design);
        }

        if (auto cycles = read_u64(dir / "cycle_count")) {
            if (*cycles > 0) {
                info.cycle_count = static_cast<uint32_t>(*cycles);
            }
        }

        if (now && rate && *rate > 0) {
            double drain = static_cast<double>(*rate);
            if (status == "Discharging") {
                info.time_to_empty_minutes = static_cast<double>(*now) / drain * 60.0;
            } else if (status == "Charging" && full && *full > *now) {
                info.time_to_full_minutes = static_cast<double>(*full - *now) / drain * 60.0;
            }
        }

        return info;
    }

    uint64_t page_size_ = 4096;
    std::string cpu_model_;
    std::vector<procfs::CpuTimes> prev_cpu_times_;
    std::unordered_map<uint32_t, uint64_t> prev_process_ticks_;
    uint64_t prev_process_total_ = 0;
};

std::unique_ptr<MetricsCollector> create_linux_metrics_collector() {
    return std::make_unique<LinuxMetricsCollector>();
}

} // namespace hostpulse
