#ifndef NLBD_CDP_CHROME_LAUNCH_HPP
#define NLBD_CDP_CHROME_LAUNCH_HPP

// Chrome launch and debug port discovery via the DevToolsActivePort file.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_chrome_launch {

// Result of launching Chrome and discovering the debug port.
struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory;
    std::string error_message;
};

// Each daemon gets a throwaway profile so two daemons never share a Chrome.
static const char NLBD_USER_DATA_DIR_PREFIX[] = "/tmp/nlbd_chrome_profile_";

// Launch Chrome with remote debugging on an OS-assigned port.
ChromeLaunchResult launch_chrome(const browser_driver::OpenBrowserOptions &options = {});

struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// Build the command line. Port 0 lets Chrome pick a free port and report it
// through DevToolsActivePort.
ChromeCommandLine build_chrome_command_line(const std::string &user_data_directory, int port,
                                            const browser_driver::OpenBrowserOptions &options = {});

// Find the Chrome executable. A non-empty preferred_path is used as is (empty
// result when it is not executable); otherwise well-known locations and PATH
// are searched.
std::string find_chrome_executable(const std::string &preferred_path = "");

// Parse the DevToolsActivePort file. The first line holds the port, the
// second the browser WebSocket path. Returns -1 on failure.
int parse_devtools_active_port(const std::string &file_path);

// Build the WebSocket debugger URL from the port and browser path.
std::string build_websocket_url(int port, const std::string &browser_path);

} // namespace cdp_chrome_launch

#endif // NLBD_CDP_CHROME_LAUNCH_HPP
