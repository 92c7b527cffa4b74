#ifndef NLBD_REQUEST_HANDLER_HPP
#define NLBD_REQUEST_HANDLER_HPP

// One request through the whole pipeline:
// frame -> request envelope -> parser -> dispatcher -> response envelope.

#include <nlohmann/json.hpp>
#include <string>

#include "daemon/daemon_context.hpp"
#include "protocol/envelope.hpp"

namespace request_handler {

using json = nlohmann::json;

// Malformed JSON or a request without "text" yields a transport error response.
json handle_request_frame(const std::string &frame, nlbd::DaemonContext &context);

json handle_request(const envelope::Request &request, nlbd::DaemonContext &context);

} // namespace request_handler

#endif // NLBD_REQUEST_HANDLER_HPP
