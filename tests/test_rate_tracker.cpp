#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "hostpulse/rate_tracker.hpp"

namespace {

hostpulse::Snapshot snapshot_with(uint64_t rx, uint64_t tx) {
    hostpulse::Snapshot snapshot;
    hostpulse::NetworkInterfaceInfo net;
    net.name = "eth0";
    net.received_bytes_cumulative = rx;
    net.transmitted_bytes_cumulative = tx;
    snapshot.networks.push_back(net);
    return snapshot;
}

} // namespace

TEST_CASE("RateTracker first update yields zero rates", "[rates]") {
    hostpulse::RateTracker tracker;
    auto now = hostpulse::RateTracker::Clock::now();

    auto rates = tracker.update(snapshot_with(5000, 7000), now);
    REQUIRE(rates.download_bytes_per_sec == 0.0);
    REQUIRE(rates.upload_bytes_per_sec == 0.0);
}

TEST_CASE("RateTracker derives bytes per second from consecutive snapshots", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();

    tracker.update(snapshot_with(1000, 1000), t0);
    auto rates = tracker.update(snapshot_with(1500, 1100), t0 + std::chrono::milliseconds(1500));

    REQUIRE(rates.download_bytes_per_sec == Catch::Approx(333.333).epsilon(0.001));
    REQUIRE(rates.upload_bytes_per_sec == Catch::Approx(66.667).epsilon(0.001));
}

TEST_CASE("RateTracker sums counters across interfaces", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();

    auto first = snapshot_with(100, 0);
    first.networks.push_back(first.networks.front());
    tracker.update(first, t0);

    auto second = snapshot_with(600, 0);
    second.networks.push_back(snapshot_with(100, 0).networks.front());
    auto rates = tracker.update(second, t0 + std::chrono::seconds(1));

    REQUIRE(rates.download_bytes_per_sec == Catch::Approx(500.0));
}

TEST_CASE("RateTracker treats decreasing counters as a reset", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();

    tracker.update(snapshot_with(10000, 500), t0);

    SECTION("Download counter went backwards") {
        auto rates = tracker.update(snapshot_with(200, 1500), t0 + std::chrono::seconds(1));
        REQUIRE(rates.download_bytes_per_sec == 0.0);
        REQUIRE(rates.upload_bytes_per_sec == Catch::Approx(1000.0));
    }

    SECTION("Rates resume from the reset baseline") {
        tracker.update(snapshot_with(200, 500), t0 + std::chrono::seconds(1));
        auto rates = tracker.update(snapshot_with(1200, 500), t0 + std::chrono::seconds(2));
        REQUIRE(rates.download_bytes_per_sec == Catch::Approx(1000.0));
        REQUIRE(rates.upload_bytes_per_sec == 0.0);
    }
}

TEST_CASE("RateTracker floors elapsed time to one millisecond", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();

    tracker.update(snapshot_with(0, 0), t0);
    auto rates = tracker.update(snapshot_with(10, 0), t0);

    REQUIRE(rates.download_bytes_per_sec == Catch::Approx(10000.0));
}

TEST_CASE("RateTracker with no interfaces reports zero", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();

    tracker.update(hostpulse::Snapshot{}, t0);
    auto rates = tracker.update(hostpulse::Snapshot{}, t0 + std::chrono::seconds(1));
    REQUIRE(rates.download_bytes_per_sec == 0.0);
    REQUIRE(rates.upload_bytes_per_sec == 0.0);
}

TEST_CASE("RateTracker skips a tick whose network read failed", "[rates]") {
    hostpulse::RateTracker tracker;
    auto t0 = hostpulse::RateTracker::Clock::now();
    const uint64_t boot_total = 50ULL * 1024 * 1024 * 1024;

    tracker.update(snapshot_with(boot_total, boot_total / 5), t0);

    hostpulse::Snapshot failed;
    failed.failures[hostpulse::MetricFamily::Network] = hostpulse::ReaderError::Unavailable;
    auto during = tracker.update(failed, t0 + std::chrono::seconds(1));
    REQUIRE(during.download_bytes_per_sec == 0.0);
    REQUIRE(during.upload_bytes_per_sec == 0.0);

    auto recovered = tracker.update(snapshot_with(boot_total + 1000, boot_total / 5 + 500),
                                    t0 + std::chrono::seconds(2));
    REQUIRE(recovered.download_bytes_per_sec == Catch::Approx(500.0));
    REQUIRE(recovered.upload_bytes_per_sec == Catch::Approx(250.0));
}
