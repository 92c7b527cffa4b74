#include "daemon/request_handler.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "parser/command_parser.hpp"
#include "utils/debug_log.hpp"

#include <chrono>

namespace request_handler {

json handle_request_frame(const std::string &frame, nlbd::DaemonContext &context) {
    json message;
    try {
        message = json::parse(frame);
    } catch (const json::parse_error &parse_error) {
        debug_log::warn(std::string("malformed request: ") + parse_error.what());
        return envelope::build_error_response(nlbd::ErrorKind::Transport,
                                              "malformed request: invalid JSON");
    }

    envelope::Request request;
    std::string error_detail;
    if (!envelope::parse_request(message, request, error_detail)) {
        return envelope::build_error_response(nlbd::ErrorKind::Transport, "malformed request: " + error_detail);
    }
    return handle_request(request, context);
}

json handle_request(const envelope::Request &request, nlbd::DaemonContext &context) {
    auto started = std::chrono::steady_clock::now();

    if (context.shutdown_requested) {
        return envelope::build_error_response(nlbd::ErrorKind::Lifecycle, "daemon is shutting down");
    }

    parser::ParseResult parse_result = parser::parse(request.text);
    if (!parse_result.success) {
        debug_log::info("request \"" + request.text.substr(0, 120) + "\" -> parse error: " +
                        parse_result.error_detail);
        json data;
        data["parse_error"] = parser::parse_error_kind_name(parse_result.error_kind);
        return envelope::build_error_response(nlbd::ErrorKind::Parse, parse_result.error_detail, data);
    }

    for (const auto &action : parse_result.actions) {
        debug_log::log("action: " + parser::describe_action(action));
    }

    envelope::Response response = action_dispatcher::dispatch(parse_result.actions, context, request.cwd);

    auto elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    debug_log::info("request \"" + request.text.substr(0, 120) + "\" -> " +
                    (response.ok ? std::string("ok") : std::string("error (") +
                                   nlbd::error_kind_name(response.error_kind) + ")") +
                    " in " + std::to_string(elapsed_milliseconds) + " ms");
    return envelope::build_response(response);
}

} // namespace request_handler
