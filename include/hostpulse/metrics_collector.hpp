#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hostpulse {

// Why a metric family could not be read this tick
enum class ReaderError {
    None,
    Unavailable,
    PermissionDenied,
    PlatformUnsupported
};

const char* reader_error_name(ReaderError error);

template<typename T>
struct ReadResult {
    T value{};
    ReaderError error = ReaderError::None;

    bool ok() const { return error == ReaderError::None; }

    static ReadResult success(T v) {
        ReadResult result;
        result.value = std::move(v);
        return result;
    }

    static ReadResult failure(ReaderError e) {
        ReadResult result;
        result.error = e;
        return result;
    }
};

// Raw, point-in-time readings as the platform reports them.
// Unit conversion, clamping and ranking happen in SnapshotAggregator.

struct OverviewReading {
    std::string os_name;
    std::string host_name;
    uint64_t uptime_seconds = 0;
};

struct CpuReading {
    std::string name;                        // CPU model name
    double usage_percent = 0.0;              // Busy fraction since the previous read
    std::vector<double> per_core_usage;      // Per logical processor
};

struct MemoryReading {
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
};

struct DiskReading {
    std::string name;                        // Device, e.g. /dev/nvme0n1p2
    std::string mount_point;
    std::string fs_type;
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
};

struct NetworkReading {
    std::string name;
    std::string mac_address;
    std::vector<std::string> ip_addresses;
    uint64_t received_bytes = 0;             // Since interface initialization
    uint64_t transmitted_bytes = 0;
};

struct TemperatureReading {
    std::string label;
    double celsius = 0.0;
};

struct ProcessReading {
    std::string name;
    uint32_t pid = 0;
    double cpu_usage_percent = 0.0;          // Share of total machine time since the previous read
    uint64_t resident_bytes = 0;
};

struct BatteryInfo {
    double percentage = 0.0;
    bool is_charging = false;
    std::string state;                       // "Charging", "Discharging", "Full", "Unknown"
    double health_percent = 0.0;
    std::optional<uint32_t> cycle_count;
    std::optional<double> time_to_empty_minutes;
    std::optional<double> time_to_full_minutes;
};

class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    virtual ReadResult<OverviewReading> read_overview() = 0;
    virtual ReadResult<CpuReading> read_cpu() = 0;
    virtual ReadResult<MemoryReading> read_memory() = 0;
    virtual ReadResult<std::vector<DiskReading>> read_disks() = 0;
    virtual ReadResult<std::vector<NetworkReading>> read_networks() = 0;
    virtual ReadResult<std::vector<TemperatureReading>> read_temperatures() = 0;
    virtual ReadResult<std::vector<ProcessReading>> read_processes() = 0;

    // An empty optional means there is no battery hardware, which is not a failure
    virtual ReadResult<std::optional<BatteryInfo>> read_battery() = 0;
};

// Factory function
std::unique_ptr<MetricsCollector> create_metrics_collector();

} // namespace hostpulse
