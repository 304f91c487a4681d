#include "hostpulse/metrics_collector.hpp"

namespace hostpulse {

const char* reader_error_name(ReaderError error) {
    switch (error) {
        case ReaderError::None:                return "ok";
        case ReaderError::Unavailable:         return "unavailable";
        case ReaderError::PermissionDenied:    return "permission denied";
        case ReaderError::PlatformUnsupported: return "platform unsupported";
    }
    return "unavailable";
}

// Platform-specific implementations are in platform/ subdirectory

#ifdef __linux__
    std::unique_ptr<MetricsCollector> create_metrics_collector() {
        extern std::unique_ptr<MetricsCollector> create_linux_metrics_collector();
        return create_linux_metrics_collector();
    }
#else
    std::unique_ptr<MetricsCollector> create_metrics_collector() {
        extern std::unique_ptr<MetricsCollector> create_unsupported_metrics_collector();
        return create_unsupported_metrics_collector();
    }
#endif

} // namespace hostpulse
