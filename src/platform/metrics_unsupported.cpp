#include "hostpulse/metrics_collector.hpp"

namespace hostpulse {

// Every family reports PlatformUnsupported; the aggregator degrades them to defaults
class UnsupportedMetricsCollector : public MetricsCollector {
public:
    ReadResult<OverviewReading> read_overview() override {
        return ReadResult<OverviewReading>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<CpuReading> read_cpu() override {
        return ReadResult<CpuReading>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<MemoryReading> read_memory() override {
        return ReadResult<MemoryReading>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<std::vector<DiskReading>> read_disks() override {
        return ReadResult<std::vector<DiskReading>>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<std::vector<NetworkReading>> read_networks() override {
        return ReadResult<std::vector<NetworkReading>>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<std::vector<TemperatureReading>> read_temperatures() override {
        return ReadResult<std::vector<TemperatureReading>>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<std::vector<ProcessReading>> read_processes() override {
        return ReadResult<std::vector<ProcessReading>>::failure(ReaderError::PlatformUnsupported);
    }

    ReadResult<std::optional<BatteryInfo>> read_battery() override {
        return ReadResult<std::optional<BatteryInfo>>::failure(ReaderError::PlatformUnsupported);
    }
};

std::unique_ptr<MetricsCollector> create_unsupported_metrics_collector() {
    return std::make_unique<UnsupportedMetricsCollector>();
}

} // namespace hostpulse
