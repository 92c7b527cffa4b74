#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace cdp_chrome_launch {

// Well-known Chrome executable paths on Linux.
static const std::vector<std::string> LINUX_CHROME_PATHS = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

static bool is_executable_file(const std::string &path) {
    std::error_code status_error;
    return std::filesystem::is_regular_file(path, status_error) && access(path.c_str(), X_OK) == 0;
}

std::string find_chrome_executable(const std::string &preferred_path) {
    if (!preferred_path.empty()) {
        return is_executable_file(preferred_path) ? preferred_path : "";
    }

    for (const auto &candidate : LINUX_CHROME_PATHS) {
        if (candidate.find('/') != std::string::npos) {
            if (is_executable_file(candidate)) {
                return candidate;
            }
            continue;
        }
        // Bare name: search PATH.
        const char *path_environment = std::getenv("PATH");
        if (path_environment == nullptr) {
            continue;
        }
        std::istringstream path_stream(path_environment);
        std::string directory;
        while (std::getline(path_stream, directory, ':')) {
            if (directory.empty()) {
                continue;
            }
            std::string full_path = directory + "/" + candidate;
            if (is_executable_file(full_path)) {
                return full_path;
            }
        }
    }
    return "";
}

ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = find_chrome_executable(options.chrome_path);
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + user_data_directory,
    };
    if (getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
        command_line.arguments.push_back("--window-size=1280,800");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-client-side-phishing-detection",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-hang-monitor",
        "--disable-popup-blocking",
        "--disable-prompt-on-repost",
        "--disable-sync",
        "--metrics-recording-only",
        "--safebrowsing-disable-auto-update",
    };
    if (options.disable_translate) {
        rest.push_back("--disable-translate");
    }
    rest.push_back("about:blank");
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

int parse_devtools_active_port(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return -1;
    }

    std::istringstream line_stream(contents);
    std::string first_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return -1;
    }

    try {
        int port = std::stoi(first_line);
        if (port > 0 && port <= 65535) {
            return port;
        }
    } catch (const std::exception &) {
        return -1;
    }
    return -1;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    // Ensure exactly one leading slash to avoid // in the URL.
    std::string path = browser_path;
    while (!path.empty() && path[0] == '/') {
        path.erase(0, 1);
    }
    path = path.empty() ? "/devtools/browser" : "/" + path;
    return "ws://127.0.0.1:" + std::to_string(port) + path;
}

ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options) {
    ChromeLaunchResult result;

    std::string profile_directory = NLBD_USER_DATA_DIR_PREFIX + std::to_string(getpid());
    std::error_code directory_error;
    std::filesystem::remove_all(profile_directory, directory_error);
    std::filesystem::create_directories(profile_directory, directory_error);
    if (directory_error) {
        result.error_message = "Cannot create Chrome profile directory " + profile_directory + ": " +
                               directory_error.message();
        return result;
    }
    result.user_data_directory = profile_directory;

    ChromeCommandLine command_line = build_chrome_command_line(profile_directory, 0, options);
    if (command_line.executable_path.empty()) {
        result.error_message = options.chrome_path.empty()
            ? "Could not find Chrome executable on this system. "
              "Install google-chrome or chromium, or pass --chrome PATH."
            : "Chrome executable not found or not executable: " + options.chrome_path;
        return result;
    }

    debug_log::log("launch_chrome: " + command_line.executable_path +
                   (options.headless ? " (headless)" : ""));
    platform::SpawnResult spawn_result = platform::spawn_process(
        command_line.executable_path, command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn Chrome: " + spawn_result.error_message;
        return result;
    }
    result.process_id = spawn_result.process_id;

    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    if (!platform::wait_for_file(active_port_file, 15000, result.process_id)) {
        result.error_message = platform::is_process_running(result.process_id)
            ? "Timed out waiting for DevToolsActivePort file at: " + active_port_file
            : "Chrome exited during startup.";
        platform::kill_process(result.process_id, true);
        platform::wait_for_exit(result.process_id, 2000);
        result.process_id = -1;
        return result;
    }

    result.debug_port = parse_devtools_active_port(active_port_file);
    if (result.debug_port <= 0) {
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        platform::kill_process(result.process_id, true);
        platform::wait_for_exit(result.process_id, 2000);
        result.process_id = -1;
        return result;
    }

    // The second line is the browser WebSocket path.
    std::string file_contents;
    std::string second_line;
    if (platform::read_file_contents(active_port_file, file_contents)) {
        std::istringstream line_stream(file_contents);
        std::string first_line;
        std::getline(line_stream, first_line);
        std::getline(line_stream, second_line);
    }
    result.websocket_debugger_url = build_websocket_url(result.debug_port, second_line);
    debug_log::log("WebSocket URL: " + result.websocket_debugger_url);

    result.success = true;
    debug_log::info("Chrome launched (pid=" + std::to_string(result.process_id) +
                    ", port=" + std::to_string(result.debug_port) + ")");
    return result;
}

} // namespace cdp_chrome_launch
