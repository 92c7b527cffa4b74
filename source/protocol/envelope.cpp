#include "protocol/envelope.hpp"

namespace envelope {

json build_request(const std::string &text, const std::string &cwd) {
    json request;
    request["text"] = text;
    if (!cwd.empty()) {
        request["cwd"] = cwd;
    }
    return request;
}

bool parse_request(const json &message, Request &out_request, std::string &error_detail) {
    if (!message.is_object()) {
        error_detail = "Request must be a JSON object.";
        return false;
    }
    if (!message.contains("text") || !message["text"].is_string()) {
        error_detail = "Missing or invalid 'text' in request.";
        return false;
    }
    out_request.text = message["text"].get<std::string>();
    out_request.cwd.clear();
    if (message.contains("cwd") && message["cwd"].is_string()) {
        out_request.cwd = message["cwd"].get<std::string>();
    }
    return true;
}

json build_ok_response(const std::string &message, const json &data) {
    json response;
    response["status"] = "ok";
    response["message"] = message;
    response["data"] = data;
    return response;
}

json build_error_response(nlbd::ErrorKind kind, const std::string &message, const json &data) {
    json response;
    response["status"] = "error";
    response["message"] = message;
    response["data"] = data;
    response["error_kind"] = nlbd::error_kind_name(kind);
    return response;
}

json build_response(const Response &response) {
    if (response.ok) {
        return build_ok_response(response.message, response.data);
    }
    return build_error_response(response.error_kind, response.message, response.data);
}

nlbd::ErrorKind error_kind_from_name(const std::string &name) {
    if (name == "transport") return nlbd::ErrorKind::Transport;
    if (name == "parse") return nlbd::ErrorKind::Parse;
    if (name == "registry") return nlbd::ErrorKind::Registry;
    if (name == "driver") return nlbd::ErrorKind::Driver;
    if (name == "timeout") return nlbd::ErrorKind::Timeout;
    if (name == "lifecycle") return nlbd::ErrorKind::Lifecycle;
    return nlbd::ErrorKind::Driver;
}

bool parse_response(const json &message, Response &out_response, std::string &error_detail) {
    if (!message.is_object() || !message.contains("status") || !message["status"].is_string()) {
        error_detail = "Response is missing 'status'.";
        return false;
    }
    std::string status = message["status"].get<std::string>();
    if (status != "ok" && status != "error") {
        error_detail = "Unknown response status: " + status;
        return false;
    }
    out_response.ok = (status == "ok");
    out_response.message.clear();
    if (message.contains("message") && message["message"].is_string()) {
        out_response.message = message["message"].get<std::string>();
    }
    out_response.data = message.contains("data") ? message["data"] : json(nullptr);
    out_response.error_kind = nlbd::ErrorKind::None;
    if (!out_response.ok) {
        out_response.error_kind = nlbd::ErrorKind::Driver;
        if (message.contains("error_kind") && message["error_kind"].is_string()) {
            out_response.error_kind = error_kind_from_name(message["error_kind"].get<std::string>());
        }
    }
    return true;
}

std::string serialize(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace envelope
