#include "hostpulse/snapshot_aggregator.hpp"
#include "hostpulse/logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace hostpulse {

const char* metric_family_name(MetricFamily family) {
    switch (family) {
        case MetricFamily::Overview:    return "overview";
        case MetricFamily::Cpu:         return "cpu";
        case MetricFamily::Memory:      return "memory";
        case MetricFamily::Disk:        return "disk";
        case MetricFamily::Network:     return "network";
        case MetricFamily::Temperature: return "temperature";
        case MetricFamily::Process:     return "process";
        case MetricFamily::Battery:     return "battery";
    }
    return "unknown";
}

SnapshotAggregator::SnapshotAggregator(MetricsCollector& collector, AggregatorOptions options)
    : collector_(collector)
    , options_(options)
{
}

double SnapshotAggregator::clamp_percent(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::min(100.0, std::max(0.0, value));
}

double SnapshotAggregator::bytes_to_gb(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
}

std::vector<ProcessEntry> SnapshotAggregator::rank_processes(std::vector<ProcessReading> processes, size_t count) {
    for (auto& proc : processes) {
        proc.cpu_usage_percent = clamp_percent(proc.cpu_usage_percent);
    }

    auto by_usage = [](const ProcessReading& a, const ProcessReading& b) {
        if (a.cpu_usage_percent != b.cpu_usage_percent) {
            return a.cpu_usage_percent > b.cpu_usage_percent;
        }
        return a.pid < b.pid;
    };

    if (processes.size() > count) {
        std::partial_sort(processes.begin(), processes.begin() + static_cast<std::ptrdiff_t>(count),
                          processes.end(), by_usage);
        processes.resize(count);
    } else {
        std::sort(processes.begin(), processes.end(), by_usage);
    }

    std::vector<ProcessEntry> top;
    top.reserve(processes.size());
    for (auto& proc : processes) {
        ProcessEntry entry;
        entry.name = std::move(proc.name);
        entry.pid = proc.pid;
        entry.cpu_usage_percent = proc.cpu_usage_percent;
        entry.memory_mb = static_cast<double>(proc.resident_bytes) / (1024.0 * 1024.0);
        top.push_back(std::move(entry));
    }
    return top;
}

void SnapshotAggregator::note_outcome(MetricFamily family, ReaderError error) {
    auto it = last_failures_.find(family);
    if (error == ReaderError::None) {
        if (it != last_failures_.end()) {
            Logger::info(metric_family_name(family), " reader recovered");
            last_failures_.erase(it);
        }
        return;
    }

    if (it == last_failures_.end() || it->second != error) {
        Logger::warning(metric_family_name(family), " reader failed: ", reader_error_name(error));
        last_failures_[family] = error;
    }
}

template<typename T>
bool SnapshotAggregator::read_family(MetricFamily family, ReadResult<T> (MetricsCollector::*reader)(),
                                     Snapshot& snapshot, T& out) {
    ReadResult<T> result;
    try {
        result = (collector_.*reader)();
    } catch (const std::exception& e) {
        Logger::error(metric_family_name(family), " reader threw: ", e.what());
        result = ReadResult<T>::failure(ReaderError::Unavailable);
    }

    note_outcome(family, result.error);
    if (!result.ok()) {
        snapshot.failures[family] = result.error;
        return false;
    }

    out = std::move(result.value);
    return true;
}

Snapshot SnapshotAggregator::collect() {
    Snapshot snapshot;
    snapshot.taken_at = std::chrono::steady_clock::now();

    const std::pair<MetricFamily, bool> switches[] = {
        {MetricFamily::Cpu, options_.cpu},
        {MetricFamily::Memory, options_.memory},
        {MetricFamily::Disk, options_.disk},
        {MetricFamily::Network, options_.network},
        {MetricFamily::Temperature, options_.temperature},
        {MetricFamily::Process, options_.process},
        {MetricFamily::Battery, options_.battery}
    };
    for (const auto& [family, on] : switches) {
        if (!on) {
            snapshot.disabled.insert(family);
        }
    }

    OverviewReading overview;
    if (read_family(MetricFamily::Overview, &MetricsCollector::read_overview, snapshot, overview)) {
        snapshot.overview.os_name = std::move(overview.os_name);
        snapshot.overview.host_name = std::move(overview.host_name);
        snapshot.overview.uptime_seconds = overview.uptime_seconds;
    }

    CpuReading cpu;
    if (options_.cpu && read_family(MetricFamily::Cpu, &MetricsCollector::read_cpu, snapshot, cpu)) {
        snapshot.cpu.name = std::move(cpu.name);
        snapshot.cpu.usage_percent = clamp_percent(cpu.usage_percent);
        snapshot.cpu.per_core_usage.reserve(cpu.per_core_usage.size());
        for (double usage : cpu.per_core_usage) {
            snapshot.cpu.per_core_usage.push_back(clamp_percent(usage));
        }
        snapshot.cpu.core_count = static_cast<uint32_t>(snapshot.cpu.per_core_usage.size());
    }

    MemoryReading memory;
    if (options_.memory && read_family(MetricFamily::Memory, &MetricsCollector::read_memory, snapshot, memory)) {
        uint64_t available = std::min(memory.available_bytes, memory.total_bytes);
        uint64_t used = memory.total_bytes - available;
        snapshot.memory.total_gb = bytes_to_gb(memory.total_bytes);
        snapshot.memory.used_gb = bytes_to_gb(used);
        if (memory.total_bytes > 0) {
            snapshot.memory.usage_percent =
                clamp_percent(static_cast<double>(used) / static_cast<double>(memory.total_bytes) * 100.0);
        }
    }

    std::vector<DiskReading> disks;
    if (options_.disk && read_family(MetricFamily::Disk, &MetricsCollector::read_disks, snapshot, disks)) {
        snapshot.disks.reserve(disks.size());
        for (auto& reading : disks) {
            uint64_t available = std::min(reading.available_bytes, reading.total_bytes);
            uint64_t used = reading.total_bytes - available;

            DiskInfo disk;
            disk.name = std::move(reading.name);
            disk.mount_point = std::move(reading.mount_point);
            disk.fs_type = std::move(reading.fs_type);
            disk.total_gb = bytes_to_gb(reading.total_bytes);
            disk.available_gb = bytes_to_gb(available);
            disk.used_gb = bytes_to_gb(used);
            if (reading.total_bytes > 0) {
                disk.usage_percent =
                    clamp_percent(static_cast<double>(used) / static_cast<double>(reading.total_bytes) * 100.0);
            }
            snapshot.disks.push_back(std::move(disk));
        }
    }

    std::vector<NetworkReading> networks;
    if (options_.network && read_family(MetricFamily::Network, &MetricsCollector::read_networks, snapshot, networks)) {
        // Counters and timestamp must be as close together as possible
        snapshot.taken_at = std::chrono::steady_clock::now();
        snapshot.networks.reserve(networks.size());
        for (auto& reading : networks) {
            NetworkInterfaceInfo net;
            net.name = std::move(reading.name);
            net.mac_address = std::move(reading.mac_address);
            net.ip_addresses = std::move(reading.ip_addresses);
            net.received_bytes_cumulative = reading.received_bytes;
            net.transmitted_bytes_cumulative = reading.transmitted_bytes;
            snapshot.networks.push_back(std::move(net));
        }
    }

    std::vector<TemperatureReading> temperatures;
    if (options_.temperature &&
        read_family(MetricFamily::Temperature, &MetricsCollector::read_temperatures, snapshot, temperatures)) {
        for (auto& reading : temperatures) {
            if (!std::isfinite(reading.celsius)) {
                continue;
            }
            snapshot.temperatures.push_back({std::move(reading.label), reading.celsius});
        }
    }

    std::vector<ProcessReading> processes;
    if (options_.process && read_family(MetricFamily::Process, &MetricsCollector::read_processes, snapshot, processes)) {
        snapshot.top_processes = rank_processes(std::move(processes), options_.top_process_count);
    }

    std::optional<BatteryInfo> battery;
    if (options_.battery && read_family(MetricFamily::Battery, &MetricsCollector::read_battery, snapshot, battery)) {
        if (battery) {
            battery->percentage = clamp_percent(battery->percentage);
            battery->health_percent = clamp_percent(battery->health_percent);
        }
        snapshot.battery = std::move(battery);
    }

    return snapshot;
}

} // namespace hostpulse
