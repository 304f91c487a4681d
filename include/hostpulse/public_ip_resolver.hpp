#pragma once

#include "hostpulse/snapshot.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace hostpulse {

struct IpLookupResponse {
    bool transport_ok = false;               // False on DNS failure, timeout, refused connection...
    long status_code = 0;
    std::string body;
    std::string error_message;
};

// One outbound request to an IP/geolocation service
class IpLookupClient {
public:
    virtual ~IpLookupClient() = default;
    virtual IpLookupResponse fetch() = 0;
};

// cpr-backed client for ipinfo.io style JSON endpoints
class HttpIpLookupClient : public IpLookupClient {
public:
    HttpIpLookupClient(std::string url, std::chrono::milliseconds timeout);

    IpLookupResponse fetch() override;

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
};

// Parse an ipinfo.io style body; empty when not JSON or when "ip" is missing
std::optional<PublicIpInfo> parse_public_ip_response(const std::string& body);

class PublicIpResolver {
public:
    explicit PublicIpResolver(std::unique_ptr<IpLookupClient> client);

    // Perform one lookup. On failure the last good result is kept.
    bool refresh();

    // Last successful result, possibly stale
    const std::optional<PublicIpInfo>& current() const { return current_; }

    bool last_attempt_failed() const { return last_attempt_failed_; }

private:
    std::unique_ptr<IpLookupClient> client_;
    std::optional<PublicIpInfo> current_;
    bool last_attempt_failed_ = false;
};

} // namespace hostpulse
