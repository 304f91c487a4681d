#include "hostpulse/system_monitor.hpp"
#include "hostpulse/logger.hpp"
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

namespace hostpulse {

namespace {

AggregatorOptions aggregator_options(const HostPulseConfig& config) {
    AggregatorOptions options;
    options.cpu = config.cpu.enabled;
    options.memory = config.memory.enabled;
    options.disk = config.disk.enabled;
    options.network = config.network.enabled;
    options.temperature = config.temperature.enabled;
    options.process = config.process.enabled;
    options.battery = config.battery.enabled;
    options.top_process_count = static_cast<size_t>(config.process.top_count > 0 ? config.process.top_count : 10);
    return options;
}

std::unique_ptr<IpLookupClient> default_ip_client(const HostPulseConfig& config) {
    if (!config.public_ip.enabled) {
        return nullptr;
    }
    return std::make_unique<HttpIpLookupClient>(config.public_ip.url,
                                                std::chrono::milliseconds(config.public_ip.timeout_ms));
}

} // namespace

SystemMonitor::SystemMonitor(const HostPulseConfig& config)
    : SystemMonitor(config, create_metrics_collector(), default_ip_client(config))
{
}

SystemMonitor::SystemMonitor(const HostPulseConfig& config,
                             std::unique_ptr<MetricsCollector> collector,
                             std::unique_ptr<IpLookupClient> ip_client)
    : config_(config)
    , collector_(std::move(collector))
    , aggregator_(*collector_, aggregator_options(config))
    , history_(static_cast<size_t>(config.history_size > 0 ? config.history_size : 60))
    , read_model_(std::make_shared<ReadModel>())
{
    if (ip_client) {
        resolver_state_ = std::make_shared<ResolverState>();
        resolver_state_->resolver = std::make_unique<PublicIpResolver>(std::move(ip_client));
        resolver_state_->read_model = read_model_;
    }
}

SystemMonitor::~SystemMonitor() {
    stop();
}

bool SystemMonitor::start() {
    if (started_) {
        Logger::error("System monitor already started");
        return false;
    }
    started_ = true;

    try {
        tick_thread_ = std::thread(&SystemMonitor::tick_loop, this);

        if (resolver_state_) {
            {
                std::lock_guard<std::mutex> lock(resolver_state_->mutex);
                resolver_state_->refresh_requested = true;
            }
            resolver_thread_ = std::thread(&SystemMonitor::resolver_loop, resolver_state_);
        }
    } catch (const std::system_error& e) {
        Logger::error("Failed to start sampler task: ", e.what());
        running_ = true;
        stop();
        return false;
    }

    running_ = true;
    Logger::info("Sampler started (interval ", config_.update_interval_ms, "ms, history ",
                 config_.history_size, " samples)");
    return true;
}

void SystemMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        stopping_ = true;
    }
    tick_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }

    if (resolver_state_ && resolver_thread_.joinable()) {
        bool busy = false;
        {
            std::lock_guard<std::mutex> lock(resolver_state_->mutex);
            resolver_state_->stop = true;
            busy = resolver_state_->in_flight;
        }
        resolver_state_->cv.notify_all();

        if (busy) {
            Logger::debug("Abandoning in-flight public IP lookup");
            resolver_thread_.detach();
            lookup_abandoned_ = true;
        } else {
            resolver_thread_.join();
        }
    }

    Logger::info("Sampler stopped");
}

void SystemMonitor::tick() {
    auto snapshot = std::make_shared<const Snapshot>(aggregator_.collect());

    NetworkRates rates = rate_tracker_.update(*snapshot);

    history_.append(SeriesId::CpuUsage, snapshot->cpu.usage_percent);
    history_.append(SeriesId::MemoryUsage, snapshot->memory.usage_percent);

    read_model_->publish_tick(std::move(snapshot), rates, history_);
}

void SystemMonitor::tick_loop() {
    const auto interval = std::chrono::milliseconds(config_.update_interval_ms);
    auto next = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(tick_mutex_);
    while (!stopping_) {
        lock.unlock();
        try {
            tick();
        } catch (const std::exception& e) {
            Logger::error("Tick failed: ", e.what());
        }
        lock.lock();

        // An overrunning tick delays the next one instead of overlapping it
        next += interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            Logger::debug("Tick overran its interval");
            next = now;
        }

        tick_cv_.wait_until(lock, next, [this] { return stopping_; });
    }
}

void SystemMonitor::run_lookup(ResolverState& state) {
    std::lock_guard<std::mutex> guard(state.lookup_mutex);
    bool ok = state.resolver->refresh();
    state.read_model->publish_public_ip(state.resolver->current(),
                                        ok ? PublicIpStatus::Available : PublicIpStatus::Unavailable);
}

void SystemMonitor::resolver_loop(std::shared_ptr<ResolverState> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        state->cv.wait(lock, [&state] { return state->stop || state->refresh_requested; });
        if (state->stop) {
            break;
        }

        state->refresh_requested = false;
        state->in_flight = true;
        lock.unlock();

        try {
            run_lookup(*state);
        } catch (const std::exception& e) {
            Logger::error("[PublicIp] lookup raised: ", e.what());
        }

        lock.lock();
        state->in_flight = false;
    }
}

void SystemMonitor::refresh_public_ip() {
    if (!resolver_state_) {
        Logger::debug("Public IP lookup disabled");
        return;
    }
    run_lookup(*resolver_state_);
}

void SystemMonitor::request_public_ip_refresh() {
    if (!resolver_state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(resolver_state_->mutex);
        resolver_state_->refresh_requested = true;
    }
    resolver_state_->cv.notify_all();
}

} // namespace hostpulse
