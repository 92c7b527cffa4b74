#ifndef NLBD_DAEMON_CONFIG_HPP
#define NLBD_DAEMON_CONFIG_HPP

// Daemon configuration: defaults, overlaid by NLBD_* environment variables,
// overlaid by command-line flags.

#include <string>
#include <vector>

namespace daemon_config {

struct DaemonConfig {
    std::string socket_path;           // default: channel::default_socket_path()
    bool headless = false;
    bool initial_tab = true;
    std::string chrome_path;           // empty: search well-known locations
    std::string screenshot_directory;  // default: daemon working directory
    int wait_timeout_milliseconds = 30000;
    int navigation_timeout_milliseconds = 30000;
    int command_timeout_milliseconds = 10000;
    int request_read_timeout_milliseconds = 10000;
};

struct ConfigResult {
    bool success = false;
    bool show_help = false;
    DaemonConfig config;
    std::string error_detail;
};

DaemonConfig default_config();

// Overlay NLBD_SOCKET, NLBD_HEADLESS, NLBD_CHROME, NLBD_SCREENSHOT_DIR,
// NLBD_WAIT_TIMEOUT_MS and NLBD_NAVIGATION_TIMEOUT_MS. Invalid numbers keep
// the current value and log a warning.
void apply_environment(DaemonConfig &config);

// Overlay command-line flags (arguments exclude argv[0]).
ConfigResult apply_arguments(DaemonConfig config, const std::vector<std::string> &arguments);

// Defaults + environment + argv.
ConfigResult load_config(int argc, char **argv);

std::string usage_text();

} // namespace daemon_config

#endif // NLBD_DAEMON_CONFIG_HPP
