#include "config/daemon_config.hpp"
#include "channel/unix_socket.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <filesystem>

namespace daemon_config {

static bool parse_positive_milliseconds(const std::string &text, int &out_value) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char character : text) {
        if (character < '0' || character > '9') {
            return false;
        }
    }
    int value = std::stoi(text);
    if (value <= 0) {
        return false;
    }
    out_value = value;
    return true;
}

static void apply_timeout_variable(const char *name, int &target) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }
    if (!parse_positive_milliseconds(value, target)) {
        debug_log::warn(std::string("ignoring ") + name + "=" + value +
                        " (expected a positive number of milliseconds)");
    }
}

DaemonConfig default_config() {
    DaemonConfig config;
    config.socket_path = channel::default_socket_path();
    std::error_code path_error;
    std::filesystem::path working_directory = std::filesystem::current_path(path_error);
    config.screenshot_directory = path_error ? "." : working_directory.string();
    return config;
}

void apply_environment(DaemonConfig &config) {
    const char *socket_path = std::getenv("NLBD_SOCKET");
    if (socket_path != nullptr && socket_path[0] != '\0') {
        config.socket_path = socket_path;
    }
    const char *headless = std::getenv("NLBD_HEADLESS");
    if (headless != nullptr && headless[0] != '\0') {
        config.headless = debug_log::is_truthy(headless);
    }
    const char *chrome_path = std::getenv("NLBD_CHROME");
    if (chrome_path != nullptr && chrome_path[0] != '\0') {
        config.chrome_path = chrome_path;
    }
    const char *screenshot_directory = std::getenv("NLBD_SCREENSHOT_DIR");
    if (screenshot_directory != nullptr && screenshot_directory[0] != '\0') {
        config.screenshot_directory = screenshot_directory;
    }
    apply_timeout_variable("NLBD_WAIT_TIMEOUT_MS", config.wait_timeout_milliseconds);
    apply_timeout_variable("NLBD_NAVIGATION_TIMEOUT_MS", config.navigation_timeout_milliseconds);
}

ConfigResult apply_arguments(DaemonConfig config, const std::vector<std::string> &arguments) {
    ConfigResult result;

    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];
        auto take_value = [&](std::string &target) {
            if (index + 1 >= arguments.size()) {
                result.error_detail = "option " + argument + " requires a value";
                return false;
            }
            target = arguments[++index];
            return true;
        };

        if (argument == "--help" || argument == "-h") {
            result.show_help = true;
        } else if (argument == "--headless") {
            config.headless = true;
        } else if (argument == "--no-initial-tab") {
            config.initial_tab = false;
        } else if (argument == "--socket") {
            if (!take_value(config.socket_path)) {
                return result;
            }
        } else if (argument == "--chrome") {
            if (!take_value(config.chrome_path)) {
                return result;
            }
        } else if (argument == "--screenshot-dir") {
            if (!take_value(config.screenshot_directory)) {
                return result;
            }
        } else {
            result.error_detail = "unknown option: " + argument;
            return result;
        }
    }

    if (config.socket_path.empty()) {
        result.error_detail = "socket path is empty";
        return result;
    }
    if (!channel::socket_path_fits(config.socket_path)) {
        result.error_detail = "socket path too long: " + config.socket_path;
        return result;
    }

    result.success = true;
    result.config = config;
    return result;
}

ConfigResult load_config(int argc, char **argv) {
    DaemonConfig config = default_config();
    apply_environment(config);
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index) {
        arguments.emplace_back(argv[index]);
    }
    return apply_arguments(config, arguments);
}

std::string usage_text() {
    return "usage: nlbd [--socket PATH] [--headless] [--no-initial-tab] [--chrome PATH]\n"
           "            [--screenshot-dir DIR]\n"
           "\n"
           "Environment: NLBD_SOCKET, NLBD_HEADLESS, NLBD_CHROME, NLBD_SCREENSHOT_DIR,\n"
           "             NLBD_WAIT_TIMEOUT_MS, NLBD_NAVIGATION_TIMEOUT_MS, NLBD_DEBUG\n";
}

} // namespace daemon_config
