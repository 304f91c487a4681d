#include "hostpulse/history_buffer.hpp"

namespace hostpulse {

const char* series_name(SeriesId id) {
    switch (id) {
        case SeriesId::CpuUsage:    return "cpu_usage";
        case SeriesId::MemoryUsage: return "memory_usage";
    }
    return "unknown";
}

HistorySeries::HistorySeries(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void HistorySeries::append(double value) {
    samples_.push_back(value);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

HistoryBuffers::HistoryBuffers(size_t capacity)
    : cpu_(capacity)
    , memory_(capacity)
{
}

void HistoryBuffers::append(SeriesId id, double value) {
    series(id).append(value);
}

const std::deque<double>& HistoryBuffers::get(SeriesId id) const {
    return series(id).samples();
}

HistorySeries& HistoryBuffers::series(SeriesId id) {
    return id == SeriesId::CpuUsage ? cpu_ : memory_;
}

const HistorySeries& HistoryBuffers::series(SeriesId id) const {
    return id == SeriesId::CpuUsage ? cpu_ : memory_;
}

} // namespace hostpulse
