#include <catch2/catch_test_macros.hpp>
#include "hostpulse/config_manager.hpp"
#include <cstdio>
#include <fstream>

TEST_CASE("ConfigManager loads valid YAML", "[config]") {
    // Create a temporary test config
    const char* test_config = R"(
version: "1.0"
update_interval_ms: 2000
history_size: 30

cpu:
  enabled: true

network:
  enabled: false

process:
  enabled: true
  top_count: 5  # short list

public_ip:
  enabled: false
  url: "https://example.net/json"
  timeout_ms: 2500

display:
  color_scheme: "mono"
  refresh_interval_ms: 1000
  show_graphs: false
  show_per_core: true

logging:
  debug: true
  log_to_file: true
  log_path: "./test.log"
)";

    std::ofstream out("test_config.yaml");
    out << test_config;
    out.close();

    hostpulse::ConfigManager manager("test_config.yaml");
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.update_interval_ms == 2000);
    REQUIRE(config.history_size == 30);
    REQUIRE(config.cpu.enabled == true);
    REQUIRE(config.network.enabled == false);
    REQUIRE(config.disk.enabled == true);
    REQUIRE(config.process.top_count == 5);
    REQUIRE(config.public_ip.enabled == false);
    REQUIRE(config.public_ip.url == "https://example.net/json");
    REQUIRE(config.public_ip.timeout_ms == 2500);
    REQUIRE(config.display.color_scheme == "mono");
    REQUIRE(config.display.show_graphs == false);
    REQUIRE(config.logging.debug == true);
    REQUIRE(config.logging.log_path == "./test.log");

    std::string error;
    REQUIRE(manager.validate_config(error));

    std::remove("test_config.yaml");
}

TEST_CASE("ConfigManager falls back to defaults without a file", "[config]") {
    hostpulse::ConfigManager manager("does_not_exist.yaml");
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.update_interval_ms == 1500);
    REQUIRE(config.history_size == 60);
    REQUIRE(config.process.top_count == 10);
    REQUIRE(config.public_ip.url == "https://ipinfo.io/json");
}

TEST_CASE("ConfigManager validates intervals", "[config]") {
    // Create invalid config
    const char* invalid_config = R"(
update_interval_ms: 0
history_size: 30
)";

    std::ofstream out("invalid_config.yaml");
    out << invalid_config;
    out.close();

    hostpulse::ConfigManager manager("invalid_config.yaml");
    manager.load();

    std::string error;
    REQUIRE_FALSE(manager.validate_config(error));
    REQUIRE(error == "update_interval_ms must be positive");

    std::remove("invalid_config.yaml");
}

TEST_CASE("ConfigManager ignores non-numeric values", "[config]") {
    const char* config_text = R"(
history_size: lots
process:
  top_count: 7
)";

    std::ofstream out("lenient_config.yaml");
    out << config_text;
    out.close();

    hostpulse::ConfigManager manager("lenient_config.yaml");
    REQUIRE(manager.load());
    REQUIRE(manager.get_config().history_size == 60);
    REQUIRE(manager.get_config().process.top_count == 7);

    std::remove("lenient_config.yaml");
}

TEST_CASE("HostPulseConfig validates correctly", "[config]") {
    hostpulse::HostPulseConfig valid;
    REQUIRE(valid.validate());

    hostpulse::HostPulseConfig no_history;
    no_history.history_size = 0;
    REQUIRE_FALSE(no_history.validate());

    hostpulse::HostPulseConfig bad_timeout;
    bad_timeout.public_ip.timeout_ms = -1;
    REQUIRE_FALSE(bad_timeout.validate());
}
