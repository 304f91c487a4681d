#include "hostpulse/public_ip_resolver.hpp"
#include "hostpulse/logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace hostpulse {

namespace {
constexpr auto kMaxConnectTimeout = std::chrono::milliseconds(3000);

bool is_success_status(long status_code) {
    return status_code >= 200 && status_code < 300;
}

std::optional<std::string> optional_string(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string()) {
        return std::nullopt;
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}
} // namespace

HttpIpLookupClient::HttpIpLookupClient(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)),
      timeout_(timeout) {}

IpLookupResponse HttpIpLookupClient::fetch() {
    cpr::Response response = cpr::Get(
        cpr::Url{url_},
        cpr::Header{{"Accept", "application/json"}},
        cpr::ConnectTimeout{std::min(timeout_, kMaxConnectTimeout)},
        cpr::Timeout{timeout_});

    IpLookupResponse result;
    result.transport_ok = response.error.code == cpr::ErrorCode::OK;
    result.status_code = response.status_code;
    result.body = std::move(response.text);
    result.error_message = response.error.message;
    return result;
}

std::optional<PublicIpInfo> parse_public_ip_response(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    auto ip = optional_string(json, "ip");
    if (!ip) {
        return std::nullopt;
    }

    PublicIpInfo info;
    info.ip = std::move(*ip);
    info.city = optional_string(json, "city");
    info.region = optional_string(json, "region");
    info.country = optional_string(json, "country");
    info.org = optional_string(json, "org");
    return info;
}

PublicIpResolver::PublicIpResolver(std::unique_ptr<IpLookupClient> client)
    : client_(std::move(client)) {}

bool PublicIpResolver::refresh() {
    IpLookupResponse response = client_->fetch();

    if (!response.transport_ok) {
        Logger::warning("[PublicIp] lookup failed: ", response.error_message);
        last_attempt_failed_ = true;
        return false;
    }

    if (!is_success_status(response.status_code)) {
        Logger::warning("[PublicIp] lookup failed with HTTP ", response.status_code);
        last_attempt_failed_ = true;
        return false;
    }

    auto info = parse_public_ip_response(response.body);
    if (!info) {
        Logger::warning("[PublicIp] response missing or malformed \"ip\" field");
        last_attempt_failed_ = true;
        return false;
    }

    Logger::debug("[PublicIp] resolved ", info->ip);
    current_ = std::move(info);
    last_attempt_failed_ = false;
    return true;
}

} // namespace hostpulse
