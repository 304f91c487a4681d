#include "hostpulse/rate_tracker.hpp"
#include "hostpulse/logger.hpp"

namespace hostpulse {

namespace {
constexpr double kMinElapsedSeconds = 0.001;
}

double RateTracker::per_second(uint64_t previous, uint64_t current, double seconds) {
    if (current < previous) {
        return 0.0;
    }
    return static_cast<double>(current - previous) / seconds;
}

NetworkRates RateTracker::update(const Snapshot& snapshot, Clock::time_point now) {
    // A failed read has no counters; keep the last good baseline for the next tick
    if (!snapshot.available(MetricFamily::Network)) {
        Logger::debug("Rate tracker: network unavailable this tick, keeping previous baseline");
        return NetworkRates{};
    }

    Sample current;
    current.timestamp = now;
    for (const auto& net : snapshot.networks) {
        current.received_total += net.received_bytes_cumulative;
        current.transmitted_total += net.transmitted_bytes_cumulative;
    }

    NetworkRates rates;
    if (previous_) {
        double elapsed = std::chrono::duration<double>(now - previous_->timestamp).count();
        if (elapsed < kMinElapsedSeconds) {
            Logger::debug("Rate tracker: elapsed time ", elapsed, "s clamped to 1ms");
            elapsed = kMinElapsedSeconds;
        }

        rates.download_bytes_per_sec = per_second(previous_->received_total, current.received_total, elapsed);
        rates.upload_bytes_per_sec = per_second(previous_->transmitted_total, current.transmitted_total, elapsed);

        if (current.received_total < previous_->received_total ||
            current.transmitted_total < previous_->transmitted_total) {
            Logger::debug("Rate tracker: network counters went backwards, treating as reset");
        }
    }

    previous_ = current;
    return rates;
}

} // namespace hostpulse
