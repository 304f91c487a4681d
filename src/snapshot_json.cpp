#include "hostpulse/snapshot_json.hpp"

namespace hostpulse {

namespace {

template<typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

const char* public_ip_status_name(PublicIpStatus status) {
    switch (status) {
        case PublicIpStatus::NotAttempted: return "not_attempted";
        case PublicIpStatus::Available:    return "available";
        case PublicIpStatus::Unavailable:  return "unavailable";
    }
    return "unavailable";
}

} // namespace

void to_json(nlohmann::json& j, const SystemOverview& overview) {
    j = {
        {"os_name", overview.os_name},
        {"host_name", overview.host_name},
        {"uptime_seconds", overview.uptime_seconds}
    };
}

void to_json(nlohmann::json& j, const CpuInfo& cpu) {
    j = {
        {"name", cpu.name},
        {"usage_percent", cpu.usage_percent},
        {"core_count", cpu.core_count},
        {"per_core_usage", cpu.per_core_usage}
    };
}

void to_json(nlohmann::json& j, const MemoryInfo& memory) {
    j = {
        {"total_gb", memory.total_gb},
        {"used_gb", memory.used_gb},
        {"usage_percent", memory.usage_percent}
    };
}

void to_json(nlohmann::json& j, const DiskInfo& disk) {
    j = {
        {"name", disk.name},
        {"mount_point", disk.mount_point},
        {"total_gb", disk.total_gb},
        {"used_gb", disk.used_gb},
        {"available_gb", disk.available_gb},
        {"usage_percent", disk.usage_percent},
        {"fs_type", disk.fs_type}
    };
}

void to_json(nlohmann::json& j, const NetworkInterfaceInfo& net) {
    j = {
        {"name", net.name},
        {"mac_address", net.mac_address},
        {"ip_addresses", net.ip_addresses},
        {"received_bytes_cumulative", net.received_bytes_cumulative},
        {"transmitted_bytes_cumulative", net.transmitted_bytes_cumulative}
    };
}

void to_json(nlohmann::json& j, const TemperatureInfo& temperature) {
    j = {
        {"label", temperature.label},
        {"celsius", temperature.celsius}
    };
}

void to_json(nlohmann::json& j, const ProcessEntry& process) {
    j = {
        {"name", process.name},
        {"pid", process.pid},
        {"cpu_usage_percent", process.cpu_usage_percent},
        {"memory_mb", process.memory_mb}
    };
}

void to_json(nlohmann::json& j, const BatteryInfo& battery) {
    j = {
        {"percentage", battery.percentage},
        {"is_charging", battery.is_charging},
        {"state", battery.state},
        {"health_percent", battery.health_percent},
        {"cycle_count", optional_value(battery.cycle_count)},
        {"time_to_empty_minutes", optional_value(battery.time_to_empty_minutes)},
        {"time_to_full_minutes", optional_value(battery.time_to_full_minutes)}
    };
}

void to_json(nlohmann::json& j, const Snapshot& snapshot) {
    nlohmann::json unavailable = nlohmann::json::object();
    for (const auto& [family, error] : snapshot.failures) {
        unavailable[metric_family_name(family)] = reader_error_name(error);
    }

    nlohmann::json disabled = nlohmann::json::array();
    for (MetricFamily family : snapshot.disabled) {
        disabled.push_back(metric_family_name(family));
    }

    j = {
        {"overview", snapshot.overview},
        {"cpu", snapshot.cpu},
        {"memory", snapshot.memory},
        {"disks", snapshot.disks},
        {"networks", snapshot.networks},
        {"temperatures", snapshot.temperatures},
        {"top_processes", snapshot.top_processes},
        {"battery", optional_value(snapshot.battery)},
        {"unavailable", unavailable},
        {"disabled", disabled}
    };
}

void to_json(nlohmann::json& j, const NetworkRates& rates) {
    j = {
        {"download_bytes_per_sec", rates.download_bytes_per_sec},
        {"upload_bytes_per_sec", rates.upload_bytes_per_sec}
    };
}

void to_json(nlohmann::json& j, const PublicIpInfo& info) {
    j = {
        {"ip", info.ip},
        {"city", optional_value(info.city)},
        {"region", optional_value(info.region)},
        {"country", optional_value(info.country)},
        {"org", optional_value(info.org)}
    };
}

nlohmann::json build_report(const ReadModel& model) {
    nlohmann::json report;

    auto snapshot = model.get_system_snapshot();
    report["snapshot"] = snapshot ? nlohmann::json(*snapshot) : nlohmann::json(nullptr);
    report["network_rates"] = model.get_network_rates();
    report["history"] = {
        {series_name(SeriesId::CpuUsage), model.get_history(SeriesId::CpuUsage)},
        {series_name(SeriesId::MemoryUsage), model.get_history(SeriesId::MemoryUsage)}
    };
    report["public_ip"] = optional_value(model.get_public_ip());
    report["public_ip_status"] = public_ip_status_name(model.public_ip_status());
    report["battery"] = optional_value(model.get_battery_info());
    return report;
}

std::string dump_json(const nlohmann::json& document, int indent) {
    return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace hostpulse
