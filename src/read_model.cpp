#include "hostpulse/read_model.hpp"
#include <mutex>
#include <utility>

namespace hostpulse {

void ReadModel::publish_tick(std::shared_ptr<const Snapshot> snapshot,
                             const NetworkRates& rates,
                             const HistoryBuffers& history) {
    // Copy outside the lock; only the swap is serialized against readers
    std::deque<double> cpu_history = history.get(SeriesId::CpuUsage);
    std::deque<double> memory_history = history.get(SeriesId::MemoryUsage);
    std::optional<BatteryInfo> battery;
    if (snapshot) {
        battery = snapshot->battery;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
    rates_ = rates;
    cpu_history_.swap(cpu_history);
    memory_history_.swap(memory_history);
    battery_ = std::move(battery);
    ++tick_count_;
}

void ReadModel::publish_public_ip(std::optional<PublicIpInfo> info, PublicIpStatus status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    public_ip_ = std::move(info);
    public_ip_status_ = status;
}

TickView ReadModel::view() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    TickView view;
    view.snapshot = snapshot_;
    view.rates = rates_;
    view.cpu_history = cpu_history_;
    view.memory_history = memory_history_;
    view.battery = battery_;
    return view;
}

std::shared_ptr<const Snapshot> ReadModel::get_system_snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshot_;
}

NetworkRates ReadModel::get_network_rates() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rates_;
}

std::deque<double> ReadModel::get_history(SeriesId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return id == SeriesId::CpuUsage ? cpu_history_ : memory_history_;
}

std::optional<PublicIpInfo> ReadModel::get_public_ip() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return public_ip_;
}

PublicIpStatus ReadModel::public_ip_status() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return public_ip_status_;
}

std::optional<BatteryInfo> ReadModel::get_battery_info() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return battery_;
}

uint64_t ReadModel::tick_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tick_count_;
}

} // namespace hostpulse
