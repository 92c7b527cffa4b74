// nlb - one-shot client for nlbd.
// Sends its arguments as one instruction and prints the daemon's reply.

#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <climits>
#include <unistd.h>

#include "client/client.hpp"

static std::string current_directory() {
    char buffer[PATH_MAX];
    if (getcwd(buffer, sizeof(buffer)) == nullptr) {
        return "";
    }
    return buffer;
}

int main(int argc, char **argv) {
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> arguments(argv + 1, argv + argc);
    client::ClientArguments parsed = client::parse_client_arguments(arguments);
    if (parsed.show_help) {
        std::cout << client::usage_text();
        return client::kExitOk;
    }
    if (!parsed.success) {
        std::cerr << "error: " << parsed.error_detail << std::endl;
        std::cerr << client::usage_text();
        return client::kExitTransport;
    }

    client::ExchangeResult exchange =
        client::send_instruction(parsed.socket_path, parsed.text, current_directory(), parsed.timeout_milliseconds);
    if (!exchange.success) {
        std::cerr << "error: " << exchange.error_detail << std::endl;
        return client::kExitTransport;
    }

    if (exchange.response.ok) {
        std::cout << client::format_response(exchange.response) << std::endl;
        return client::kExitOk;
    }

    std::cerr << "error: " << exchange.response.message << std::endl;
    if (!exchange.response.data.is_null()) {
        std::cerr << exchange.response.data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
    }
    return client::kExitErrorResponse;
}
