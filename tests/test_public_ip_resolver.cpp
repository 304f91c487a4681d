#include <catch2/catch_test_macros.hpp>
#include "hostpulse/public_ip_resolver.hpp"
#include <deque>
#include <memory>

namespace {

// Replays canned responses in order
class ScriptedLookupClient : public hostpulse::IpLookupClient {
public:
    explicit ScriptedLookupClient(std::deque<hostpulse::IpLookupResponse>* responses)
        : responses_(responses) {}

    hostpulse::IpLookupResponse fetch() override {
        hostpulse::IpLookupResponse response = responses_->front();
        responses_->pop_front();
        return response;
    }

private:
    std::deque<hostpulse::IpLookupResponse>* responses_;
};

hostpulse::IpLookupResponse ok_response(const std::string& body) {
    hostpulse::IpLookupResponse response;
    response.transport_ok = true;
    response.status_code = 200;
    response.body = body;
    return response;
}

hostpulse::IpLookupResponse timeout_response() {
    hostpulse::IpLookupResponse response;
    response.transport_ok = false;
    response.error_message = "Operation timed out";
    return response;
}

const char* kIpinfoBody = R"({
  "ip": "203.0.113.7",
  "city": "Lisbon",
  "region": "Lisbon",
  "country": "PT",
  "org": "AS64500 Example Net"
})";

} // namespace

TEST_CASE("parse_public_ip_response reads ipinfo fields", "[public_ip]") {
    auto info = hostpulse::parse_public_ip_response(kIpinfoBody);
    REQUIRE(info.has_value());
    REQUIRE(info->ip == "203.0.113.7");
    REQUIRE(info->city == "Lisbon");
    REQUIRE(info->country == "PT");
    REQUIRE(info->org == "AS64500 Example Net");
}

TEST_CASE("parse_public_ip_response handles partial and bad bodies", "[public_ip]") {
    SECTION("Only ip present") {
        auto info = hostpulse::parse_public_ip_response(R"({"ip": "198.51.100.1", "city": ""})");
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->city.has_value());
        REQUIRE_FALSE(info->org.has_value());
    }

    SECTION("Missing ip") {
        REQUIRE_FALSE(hostpulse::parse_public_ip_response(R"({"city": "Lisbon"})").has_value());
    }

    SECTION("Not JSON") {
        REQUIRE_FALSE(hostpulse::parse_public_ip_response("<html>rate limited</html>").has_value());
    }

    SECTION("Wrong type for ip") {
        REQUIRE_FALSE(hostpulse::parse_public_ip_response(R"({"ip": 12345})").has_value());
    }
}

TEST_CASE("PublicIpResolver starts empty and stays empty on failure", "[public_ip]") {
    std::deque<hostpulse::IpLookupResponse> responses = {timeout_response()};
    hostpulse::PublicIpResolver resolver(std::make_unique<ScriptedLookupClient>(&responses));

    REQUIRE_FALSE(resolver.current().has_value());
    REQUIRE_FALSE(resolver.refresh());
    REQUIRE_FALSE(resolver.current().has_value());
    REQUIRE(resolver.last_attempt_failed());
}

TEST_CASE("PublicIpResolver keeps the last good result after a failure", "[public_ip]") {
    hostpulse::IpLookupResponse server_error = ok_response("{}");
    server_error.status_code = 503;

    std::deque<hostpulse::IpLookupResponse> responses = {
        ok_response(kIpinfoBody),
        timeout_response(),
        server_error,
        ok_response("not json"),
        ok_response(R"({"ip": "203.0.113.99"})")
    };
    hostpulse::PublicIpResolver resolver(std::make_unique<ScriptedLookupClient>(&responses));

    REQUIRE(resolver.refresh());
    REQUIRE(resolver.current()->ip == "203.0.113.7");

    REQUIRE_FALSE(resolver.refresh());
    REQUIRE(resolver.current()->ip == "203.0.113.7");

    REQUIRE_FALSE(resolver.refresh());
    REQUIRE(resolver.current()->city == "Lisbon");

    REQUIRE_FALSE(resolver.refresh());
    REQUIRE(resolver.last_attempt_failed());
    REQUIRE(resolver.current()->ip == "203.0.113.7");

    REQUIRE(resolver.refresh());
    REQUIRE_FALSE(resolver.last_attempt_failed());
    REQUIRE(resolver.current()->ip == "203.0.113.99");
    REQUIRE_FALSE(resolver.current()->city.has_value());
}
