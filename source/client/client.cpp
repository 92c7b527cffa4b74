#include "client/client.hpp"
#include "channel/unix_socket.hpp"

#include <cstdlib>
#include <stdexcept>

namespace client {

static bool parse_timeout(const std::string &text, int &out_milliseconds) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size() || value <= 0 || value > 86400000L) {
            return false;
        }
        out_milliseconds = static_cast<int>(value);
        return true;
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

ClientArguments parse_client_arguments(const std::vector<std::string> &arguments) {
    ClientArguments result;

    const char *socket_environment = std::getenv("NLBD_SOCKET");
    result.socket_path = (socket_environment != nullptr && socket_environment[0] != '\0')
                             ? std::string(socket_environment)
                             : channel::default_socket_path();

    const char *timeout_environment = std::getenv("NLB_TIMEOUT_MS");
    if (timeout_environment != nullptr && timeout_environment[0] != '\0' &&
        !parse_timeout(timeout_environment, result.timeout_milliseconds)) {
        result.error_detail = std::string("invalid NLB_TIMEOUT_MS: ") + timeout_environment;
        return result;
    }

    std::string joined;
    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];
        if (argument == "--help" || argument == "-h") {
            result.show_help = true;
            return result;
        }
        if (argument == "--socket") {
            if (index + 1 >= arguments.size()) {
                result.error_detail = "--socket needs a path";
                return result;
            }
            result.socket_path = arguments[++index];
            continue;
        }
        if (argument == "--") {
            for (++index; index < arguments.size(); ++index) {
                joined += (joined.empty() ? "" : " ") + arguments[index];
            }
            break;
        }
        joined += (joined.empty() ? "" : " ") + argument;
    }

    if (joined.empty()) {
        result.error_detail = "no instruction given";
        return result;
    }
    result.text = joined;
    result.success = true;
    return result;
}

ExchangeResult send_instruction(const std::string &socket_path, const std::string &text,
                                const std::string &cwd, int timeout_milliseconds) {
    ExchangeResult result;

    channel::ConnectResult connect_result = channel::connect_endpoint(socket_path);
    if (!connect_result.success) {
        result.daemon_absent = connect_result.daemon_absent;
        result.error_detail = connect_result.daemon_absent
                                  ? "daemon not started (no daemon at " + socket_path + ")"
                                  : connect_result.error_detail;
        return result;
    }

    std::string write_error;
    if (!channel::write_frame(connect_result.fd, envelope::serialize(envelope::build_request(text, cwd)),
                              write_error)) {
        channel::close_fd(connect_result.fd);
        result.error_detail = "could not send request: " + write_error;
        return result;
    }

    channel::ReadResult read_result = channel::read_frame(connect_result.fd, timeout_milliseconds);
    channel::close_fd(connect_result.fd);
    if (!read_result.success) {
        if (read_result.timed_out) {
            result.error_detail = "timed out waiting for the daemon's response";
        } else if (read_result.peer_closed) {
            result.error_detail = "daemon closed the connection without a response";
        } else {
            result.error_detail = read_result.error_detail;
        }
        return result;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(read_result.frame);
    } catch (const nlohmann::json::parse_error &parse_error) {
        result.error_detail = std::string("malformed response: ") + parse_error.what();
        return result;
    }
    if (!envelope::parse_response(message, result.response, result.error_detail)) {
        result.error_detail = "malformed response: " + result.error_detail;
        return result;
    }
    result.success = true;
    return result;
}

std::string format_response(const envelope::Response &response) {
    std::string output = response.message;
    bool has_data = !response.data.is_null() &&
                    !(response.data.is_object() && response.data.empty());
    if (has_data) {
        output += "\n";
        output += response.data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return output;
}

std::string usage_text() {
    return "usage: nlb [--socket PATH] <instruction...>\n"
           "  e.g. nlb open a new tab and go to example.com\n"
           "environment: NLBD_SOCKET, NLB_TIMEOUT_MS (default 300000)\n";
}

} // namespace client
