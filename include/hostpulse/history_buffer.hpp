#pragma once

#include <cstddef>
#include <deque>

namespace hostpulse {

enum class SeriesId {
    CpuUsage,
    MemoryUsage
};

const char* series_name(SeriesId id);

// Fixed-capacity scalar series, oldest sample evicted first
class HistorySeries {
public:
    explicit HistorySeries(size_t capacity = 60);

    void append(double value);

    // Oldest-first
    const std::deque<double>& samples() const { return samples_; }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<double> samples_;
};

// One series per tracked scalar, fed once per tick
class HistoryBuffers {
public:
    explicit HistoryBuffers(size_t capacity = 60);

    void append(SeriesId id, double value);
    const std::deque<double>& get(SeriesId id) const;

private:
    HistorySeries& series(SeriesId id);
    const HistorySeries& series(SeriesId id) const;

    HistorySeries cpu_;
    HistorySeries memory_;
};

} // namespace hostpulse
