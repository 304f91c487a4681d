#include <catch2/catch_test_macros.hpp>
#include "hostpulse/snapshot_json.hpp"
#include <memory>
#include <string>

TEST_CASE("Snapshot serializes with snake_case fields", "[json]") {
    hostpulse::Snapshot snapshot;
    snapshot.overview.host_name = "testhost";
    snapshot.cpu.name = "Test CPU";
    snapshot.cpu.per_core_usage = {10.0, 20.0};
    snapshot.cpu.core_count = 2;
    snapshot.top_processes.push_back({"init", 1, 0.5, 12.0});
    snapshot.failures[hostpulse::MetricFamily::Disk] = hostpulse::ReaderError::PermissionDenied;

    nlohmann::json j = snapshot;

    REQUIRE(j["overview"]["host_name"] == "testhost");
    REQUIRE(j["cpu"]["core_count"] == 2);
    REQUIRE(j["cpu"]["per_core_usage"].size() == 2);
    REQUIRE(j["top_processes"][0]["pid"] == 1);
    REQUIRE(j["battery"].is_null());
    REQUIRE(j["unavailable"]["disk"] == "permission denied");
    REQUIRE(j["disks"].is_array());
    REQUIRE(j["disabled"].empty());
}

TEST_CASE("Disabled families are listed in the snapshot document", "[json]") {
    hostpulse::Snapshot snapshot;
    snapshot.disabled.insert(hostpulse::MetricFamily::Temperature);
    snapshot.disabled.insert(hostpulse::MetricFamily::Battery);

    nlohmann::json j = snapshot;
    REQUIRE(j["disabled"].size() == 2);
    REQUIRE(j["disabled"][0] == "temperature");
    REQUIRE(j["disabled"][1] == "battery");
    REQUIRE(j["unavailable"].empty());
}

TEST_CASE("Battery optionals serialize as null", "[json]") {
    hostpulse::BatteryInfo battery;
    battery.percentage = 64.0;
    battery.state = "Discharging";
    battery.health_percent = 100.0;
    battery.time_to_empty_minutes = 95.0;

    nlohmann::json j = battery;
    REQUIRE(j["cycle_count"].is_null());
    REQUIRE(j["time_to_full_minutes"].is_null());
    REQUIRE(j["time_to_empty_minutes"] == 95.0);
}

TEST_CASE("build_report reflects the read model", "[json]") {
    hostpulse::ReadModel model;

    SECTION("Before the first tick") {
        auto report = hostpulse::build_report(model);
        REQUIRE(report["snapshot"].is_null());
        REQUIRE(report["public_ip"].is_null());
        REQUIRE(report["public_ip_status"] == "not_attempted");
        REQUIRE(report["history"]["cpu_usage"].empty());
    }

    SECTION("After a tick and a lookup") {
        hostpulse::HistoryBuffers history(60);
        history.append(hostpulse::SeriesId::CpuUsage, 33.0);
        model.publish_tick(std::make_shared<hostpulse::Snapshot>(), {100.0, 50.0}, history);

        hostpulse::PublicIpInfo info;
        info.ip = "203.0.113.7";
        info.country = "PT";
        model.publish_public_ip(info, hostpulse::PublicIpStatus::Available);

        auto report = hostpulse::build_report(model);
        REQUIRE(report["snapshot"].is_object());
        REQUIRE(report["network_rates"]["download_bytes_per_sec"] == 100.0);
        REQUIRE(report["history"]["cpu_usage"][0] == 33.0);
        REQUIRE(report["public_ip"]["ip"] == "203.0.113.7");
        REQUIRE(report["public_ip"]["city"].is_null());
        REQUIRE(report["public_ip_status"] == "available");
    }
}

TEST_CASE("dump_json tolerates invalid UTF-8 in process names and mounts", "[json]") {
    auto snapshot = std::make_shared<hostpulse::Snapshot>();
    snapshot->top_processes.push_back({"bad\xff\xfe", 31337, 1.0, 2.0});
    hostpulse::DiskInfo disk;
    disk.mount_point = "/media/\xc3";
    snapshot->disks.push_back(disk);

    hostpulse::ReadModel model;
    hostpulse::HistoryBuffers history(60);
    model.publish_tick(snapshot, {}, history);

    std::string text;
    REQUIRE_NOTHROW(text = hostpulse::dump_json(hostpulse::build_report(model)));
    REQUIRE(text.find("bad\xef\xbf\xbd") != std::string::npos);
    REQUIRE(text.find("31337") != std::string::npos);

    auto reparsed = nlohmann::json::parse(text);
    REQUIRE(reparsed["snapshot"]["top_processes"][0]["pid"] == 31337);
}
