#pragma once

#include "hostpulse/snapshot.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace hostpulse {

// Derives network throughput from the cumulative counters of consecutive snapshots.
//
// The first update has no reference point and yields {0, 0}. A counter that went
// backwards (reboot, interface reset or re-enumeration) is treated as a reset and
// yields 0 for that direction. Elapsed time below 1ms is floored to 1ms.
// A snapshot whose network read failed yields {0, 0} and does not replace the
// baseline, so the next good snapshot is measured against the last good one.
class RateTracker {
public:
    using Clock = std::chrono::steady_clock;

    NetworkRates update(const Snapshot& snapshot, Clock::time_point now);

    // Uses the snapshot's own capture time
    NetworkRates update(const Snapshot& snapshot) { return update(snapshot, snapshot.taken_at); }

private:
    struct Sample {
        uint64_t received_total = 0;
        uint64_t transmitted_total = 0;
        Clock::time_point timestamp;
    };

    static double per_second(uint64_t previous, uint64_t current, double seconds);

    std::optional<Sample> previous_;
};

} // namespace hostpulse
