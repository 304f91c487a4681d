#pragma once

#include "hostpulse/read_model.hpp"
#include "hostpulse/snapshot.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hostpulse {

// nlohmann::json serializers (found by ADL). Field names follow the snapshot data model.
void to_json(nlohmann::json& j, const SystemOverview& overview);
void to_json(nlohmann::json& j, const CpuInfo& cpu);
void to_json(nlohmann::json& j, const MemoryInfo& memory);
void to_json(nlohmann::json& j, const DiskInfo& disk);
void to_json(nlohmann::json& j, const NetworkInterfaceInfo& net);
void to_json(nlohmann::json& j, const TemperatureInfo& temperature);
void to_json(nlohmann::json& j, const ProcessEntry& process);
void to_json(nlohmann::json& j, const BatteryInfo& battery);
void to_json(nlohmann::json& j, const Snapshot& snapshot);
void to_json(nlohmann::json& j, const NetworkRates& rates);
void to_json(nlohmann::json& j, const PublicIpInfo& info);

// Everything the read model currently exposes, as one document
nlohmann::json build_report(const ReadModel& model);

// Serialize for output. Process names and mount points are arbitrary bytes,
// so invalid UTF-8 is replaced with U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& document, int indent = 2);

} // namespace hostpulse
