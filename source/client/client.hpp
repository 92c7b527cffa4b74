#ifndef NLBD_CLIENT_HPP
#define NLBD_CLIENT_HPP

// One-shot client: sends one instruction to the daemon and reports the reply.

#include <string>
#include <vector>

#include "protocol/envelope.hpp"

namespace client {

static constexpr int kDefaultResponseTimeoutMilliseconds = 300000;

// Exit codes of nlb.
static constexpr int kExitOk = 0;
static constexpr int kExitErrorResponse = 1;
static constexpr int kExitTransport = 2;

struct ClientArguments {
    bool success = false;
    bool show_help = false;
    std::string text;
    std::string socket_path;
    int timeout_milliseconds = kDefaultResponseTimeoutMilliseconds;
    std::string error_detail;
};

// Parse argv (without argv[0]). Non-flag arguments are joined with spaces.
// Socket and timeout defaults come from NLBD_SOCKET and NLB_TIMEOUT_MS.
ClientArguments parse_client_arguments(const std::vector<std::string> &arguments);

struct ExchangeResult {
    bool success = false;       // a well-formed Response came back
    bool daemon_absent = false;
    envelope::Response response;
    std::string error_detail;
};

// Connect, send {"text","cwd"}, read one Response.
ExchangeResult send_instruction(const std::string &socket_path, const std::string &text,
                                const std::string &cwd, int timeout_milliseconds);

// Message, followed by data as indented JSON when present.
std::string format_response(const envelope::Response &response);

std::string usage_text();

} // namespace client

#endif // NLBD_CLIENT_HPP
