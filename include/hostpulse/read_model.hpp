#pragma once

#include "hostpulse/history_buffer.hpp"
#include "hostpulse/snapshot.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>

namespace hostpulse {

enum class PublicIpStatus {
    NotAttempted,
    Available,
    Unavailable          // Last attempt failed; a previous result may still be held
};

// Everything one tick published, taken under a single lock
struct TickView {
    std::shared_ptr<const Snapshot> snapshot;
    NetworkRates rates;
    std::deque<double> cpu_history;
    std::deque<double> memory_history;
    std::optional<BatteryInfo> battery;
};

// Latest published state, queried by the presentation layer.
//
// Tick data (snapshot, rates, history, battery) has one writer: the tick loop.
// Public-IP data has one writer: the resolver task. Each publish replaces its
// fields under the writer lock, so readers never see a partial tick.
class ReadModel {
public:
    void publish_tick(std::shared_ptr<const Snapshot> snapshot,
                      const NetworkRates& rates,
                      const HistoryBuffers& history);

    void publish_public_ip(std::optional<PublicIpInfo> info, PublicIpStatus status);

    // Consistent copy of the latest tick; snapshot is null before the first one
    TickView view() const;

    // Null until the first tick has completed
    std::shared_ptr<const Snapshot> get_system_snapshot() const;
    NetworkRates get_network_rates() const;
    std::deque<double> get_history(SeriesId id) const;

    // Empty when no lookup has succeeded yet
    std::optional<PublicIpInfo> get_public_ip() const;
    PublicIpStatus public_ip_status() const;

    // Empty when the host has no battery (or before the first tick)
    std::optional<BatteryInfo> get_battery_info() const;

    // Number of ticks published so far
    uint64_t tick_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
    NetworkRates rates_;
    std::deque<double> cpu_history_;
    std::deque<double> memory_history_;
    std::optional<BatteryInfo> battery_;
    uint64_t tick_count_ = 0;

    std::optional<PublicIpInfo> public_ip_;
    PublicIpStatus public_ip_status_ = PublicIpStatus::NotAttempted;
};

} // namespace hostpulse
