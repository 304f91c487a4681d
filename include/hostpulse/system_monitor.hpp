#pragma once

#include "hostpulse/config_manager.hpp"
#include "hostpulse/history_buffer.hpp"
#include "hostpulse/metrics_collector.hpp"
#include "hostpulse/public_ip_resolver.hpp"
#include "hostpulse/rate_tracker.hpp"
#include "hostpulse/read_model.hpp"
#include "hostpulse/snapshot_aggregator.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace hostpulse {

// Owns the sampling pipeline and its two tasks:
//  - the tick task: read -> aggregate -> rate -> history -> publish, strictly sequential
//  - the resolver task: public-IP lookups on startup and on request
// Both publish into the ReadModel. A monitor is started at most once.
class SystemMonitor {
public:
    explicit SystemMonitor(const HostPulseConfig& config);

    // A null ip_client disables the public-IP lookup
    SystemMonitor(const HostPulseConfig& config,
                  std::unique_ptr<MetricsCollector> collector,
                  std::unique_ptr<IpLookupClient> ip_client);

    ~SystemMonitor();

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    // Start the tick and resolver tasks. Returns false if a task could not be created.
    bool start();

    // Cancel both tasks. Does not wait for an in-flight public-IP lookup.
    void stop();

    bool is_running() const { return running_; }

    // True once stop() has left a public-IP lookup running on a detached thread.
    // That thread may still log, so the process must not run static destructors
    // afterwards; end it with std::quick_exit.
    bool lookup_abandoned() const { return lookup_abandoned_; }

    // Run one tick on the calling thread. Must not overlap with the tick task.
    void tick();

    // Run one public-IP lookup on the calling thread and publish the outcome
    void refresh_public_ip();

    // Ask the resolver task for a new lookup
    void request_public_ip_refresh();

    const ReadModel& read_model() const { return *read_model_; }

private:
    struct ResolverState {
        std::unique_ptr<PublicIpResolver> resolver;
        std::shared_ptr<ReadModel> read_model;

        std::mutex lookup_mutex;             // Serializes lookups
        std::mutex mutex;                    // Guards the flags below
        std::condition_variable cv;
        bool stop = false;
        bool refresh_requested = false;
        bool in_flight = false;
    };

    static void run_lookup(ResolverState& state);
    static void resolver_loop(std::shared_ptr<ResolverState> state);
    void tick_loop();

    HostPulseConfig config_;
    std::unique_ptr<MetricsCollector> collector_;
    SnapshotAggregator aggregator_;
    RateTracker rate_tracker_;
    HistoryBuffers history_;
    std::shared_ptr<ReadModel> read_model_;

    // Shared with the resolver thread so it can outlive the monitor after shutdown
    std::shared_ptr<ResolverState> resolver_state_;

    std::thread tick_thread_;
    std::thread resolver_thread_;
    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
    bool stopping_ = false;
    bool started_ = false;
    std::atomic<bool> running_{false};
    bool lookup_abandoned_ = false;
};

} // namespace hostpulse
