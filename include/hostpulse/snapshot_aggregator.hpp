#pragma once

#include "hostpulse/metrics_collector.hpp"
#include "hostpulse/snapshot.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace hostpulse {

struct AggregatorOptions {
    bool cpu = true;
    bool memory = true;
    bool disk = true;
    bool network = true;
    bool temperature = true;
    bool process = true;
    bool battery = true;
    size_t top_process_count = 10;
};

// Calls every reader once and assembles a Snapshot. Holds no rate or history state.
class SnapshotAggregator {
public:
    explicit SnapshotAggregator(MetricsCollector& collector, AggregatorOptions options = {});

    Snapshot collect();

    // Top `count` processes by CPU usage, descending; equal usage ordered by ascending PID
    static std::vector<ProcessEntry> rank_processes(std::vector<ProcessReading> processes, size_t count);

    // Clamp to [0,100]; NaN becomes 0
    static double clamp_percent(double value);

    static double bytes_to_gb(uint64_t bytes);

private:
    template<typename T>
    bool read_family(MetricFamily family, ReadResult<T> (MetricsCollector::*reader)(),
                     Snapshot& snapshot, T& out);

    void note_outcome(MetricFamily family, ReaderError error);

    MetricsCollector& collector_;
    AggregatorOptions options_;
    std::map<MetricFamily, ReaderError> last_failures_;
};

} // namespace hostpulse
