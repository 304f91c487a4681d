#pragma once

#include "hostpulse/metrics_collector.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace hostpulse::testing {

// Scriptable collector: every family returns whatever the test put in it
class FakeMetricsCollector : public MetricsCollector {
public:
    ReadResult<OverviewReading> overview = ReadResult<OverviewReading>::success({"Test OS", "testhost", 3600});
    ReadResult<CpuReading> cpu = ReadResult<CpuReading>::success({"Test CPU", 25.0, {20.0, 30.0}});
    ReadResult<MemoryReading> memory = ReadResult<MemoryReading>::success({8ULL << 30, 6ULL << 30});
    ReadResult<std::vector<DiskReading>> disks;
    ReadResult<std::vector<NetworkReading>> networks;
    ReadResult<std::vector<TemperatureReading>> temperatures;
    ReadResult<std::vector<ProcessReading>> processes;
    ReadResult<std::optional<BatteryInfo>> battery;

    bool throw_on_processes = false;
    int cpu_reads = 0;

    ReadResult<OverviewReading> read_overview() override { return overview; }

    ReadResult<CpuReading> read_cpu() override {
        ++cpu_reads;
        return cpu;
    }

    ReadResult<MemoryReading> read_memory() override { return memory; }
    ReadResult<std::vector<DiskReading>> read_disks() override { return disks; }
    ReadResult<std::vector<NetworkReading>> read_networks() override { return networks; }
    ReadResult<std::vector<TemperatureReading>> read_temperatures() override { return temperatures; }

    ReadResult<std::vector<ProcessReading>> read_processes() override {
        if (throw_on_processes) {
            throw std::runtime_error("process table vanished");
        }
        return processes;
    }

    ReadResult<std::optional<BatteryInfo>> read_battery() override { return battery; }
};

} // namespace hostpulse::testing
