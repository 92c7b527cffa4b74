#ifndef NLBD_ENVELOPE_HPP
#define NLBD_ENVELOPE_HPP

// Request/response envelopes exchanged over the command channel.
// Uses nlohmann/json for parsing and serialization.
//
//   request:  {"text": "<instruction>", "cwd": "<client working directory>"}
//   response: {"status": "ok"|"error", "message": "...", "data": ..., "error_kind": "..."}

#include <nlohmann/json.hpp>
#include <string>

#include "protocol/error_kind.hpp"

namespace envelope {

using json = nlohmann::json;

struct Request {
    std::string text;
    std::string cwd; // may be empty
};

struct Response {
    bool ok = false;
    std::string message;
    json data;
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
};

// Build the request object sent by the client.
json build_request(const std::string &text, const std::string &cwd);

// Validate and extract a request. Returns false (with detail) if "text" is missing.
bool parse_request(const json &message, Request &out_request, std::string &error_detail);

// Build a status=ok response.
json build_ok_response(const std::string &message, const json &data = nullptr);

// Build a status=error response tagged with the error kind.
json build_error_response(nlbd::ErrorKind kind, const std::string &message, const json &data = nullptr);

// Build the response object for an already-populated Response.
json build_response(const Response &response);

// Validate and extract a response received by the client.
bool parse_response(const json &message, Response &out_response, std::string &error_detail);

// Map an "error_kind" string back to the enum. Unknown strings map to Driver.
nlbd::ErrorKind error_kind_from_name(const std::string &name);

// Serialize compactly. Invalid UTF-8 (page text, user input) is replaced, never thrown.
std::string serialize(const json &message);

} // namespace envelope

#endif // NLBD_ENVELOPE_HPP
