// Tests for request/response envelopes.

#include "protocol/envelope.hpp"

#include <iostream>
#include <string>

namespace test_envelope {

using json = nlohmann::json;

static bool report(bool success, const std::string &description, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << (detail.empty() ? "" : " (" + detail + ")") << std::endl;
    }
    return success;
}

static bool test_request_fields() {
    json request = envelope::build_request("list tabs", "/home/user");
    envelope::Request parsed;
    std::string error_detail;
    bool success = envelope::parse_request(request, parsed, error_detail) && parsed.text == "list tabs" &&
                   parsed.cwd == "/home/user";

    json without_cwd = envelope::build_request("list tabs", "");
    success = success && !without_cwd.contains("cwd");
    return report(success, "request carries text and optional cwd", error_detail);
}

static bool test_request_without_text() {
    envelope::Request parsed;
    std::string error_detail;
    bool all_passed = report(!envelope::parse_request(json{{"cwd", "/tmp"}}, parsed, error_detail) &&
                                 !error_detail.empty(),
                             "request without text is rejected");
    all_passed &= report(!envelope::parse_request(json::array(), parsed, error_detail),
                         "request that is not an object is rejected");
    all_passed &= report(!envelope::parse_request(json{{"text", 5}}, parsed, error_detail),
                         "non-string text is rejected");
    return all_passed;
}

static bool test_error_response_shape() {
    json response = envelope::build_error_response(nlbd::ErrorKind::Registry, "no active tab");
    bool success = response["status"] == "error" && response["message"] == "no active tab" &&
                   response["error_kind"] == "registry" && response.contains("data");

    envelope::Response parsed;
    std::string error_detail;
    success = success && envelope::parse_response(response, parsed, error_detail) && !parsed.ok &&
              parsed.error_kind == nlbd::ErrorKind::Registry && parsed.message == "no active tab";
    return report(success, "error response carries the error kind", response.dump());
}

static bool test_ok_response_shape() {
    json response = envelope::build_ok_response("Page title: Example", json{{"title", "Example"}});
    envelope::Response parsed;
    std::string error_detail;
    bool success = response["status"] == "ok" && !response.contains("error_kind") &&
                   envelope::parse_response(response, parsed, error_detail) && parsed.ok &&
                   parsed.data["title"] == "Example" && parsed.error_kind == nlbd::ErrorKind::None;
    return report(success, "ok response has no error kind", response.dump());
}

static bool test_parse_response_rejects_unknown_status() {
    envelope::Response parsed;
    std::string error_detail;
    bool success = !envelope::parse_response(json{{"status", "maybe"}}, parsed, error_detail) &&
                   !envelope::parse_response(json{{"message", "x"}}, parsed, error_detail);
    return report(success, "response without a known status is rejected");
}

static bool test_error_kind_names_round_trip() {
    bool success = true;
    const nlbd::ErrorKind kinds[] = {nlbd::ErrorKind::Transport, nlbd::ErrorKind::Parse, nlbd::ErrorKind::Registry,
                                     nlbd::ErrorKind::Driver, nlbd::ErrorKind::Timeout, nlbd::ErrorKind::Lifecycle};
    for (nlbd::ErrorKind kind : kinds) {
        success = success && envelope::error_kind_from_name(nlbd::error_kind_name(kind)) == kind;
    }
    success = success && envelope::error_kind_from_name("mystery") == nlbd::ErrorKind::Driver;
    return report(success, "error kind names map back to the same kind");
}

static bool test_serialize_replaces_invalid_utf8() {
    json response = envelope::build_ok_response(std::string("bad \xff byte"));
    std::string serialized = envelope::serialize(response);
    bool success = serialized.find("\xff") == std::string::npos && serialized.find("bad ") != std::string::npos;
    return report(success, "invalid UTF-8 in a message does not throw", serialized);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_request_fields();
    all_passed &= test_request_without_text();
    all_passed &= test_error_response_shape();
    all_passed &= test_ok_response_shape();
    all_passed &= test_parse_response_rejects_unknown_status();
    all_passed &= test_error_kind_names_round_trip();
    all_passed &= test_serialize_replaces_invalid_utf8();
    return all_passed;
}

} // namespace test_envelope
