// Tests for daemon configuration: defaults, environment overlay and flags.

#include "config/daemon_config.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace test_daemon_config {

static bool report(bool success, const std::string &description, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << (detail.empty() ? "" : " (" + detail + ")") << std::endl;
    }
    return success;
}

static bool test_defaults() {
    daemon_config::DaemonConfig config = daemon_config::default_config();
    bool success = !config.socket_path.empty() && !config.headless && config.initial_tab &&
                   config.wait_timeout_milliseconds == 30000 && config.navigation_timeout_milliseconds == 30000 &&
                   config.request_read_timeout_milliseconds == 10000 && !config.screenshot_directory.empty();
    return report(success, "defaults: headed, initial tab, 30 s waits");
}

static bool test_flags() {
    std::vector<std::string> arguments = {"--headless", "--no-initial-tab", "--socket", "/tmp/nlbd-flags.sock",
                                          "--chrome", "/opt/chrome/chrome", "--screenshot-dir", "/tmp/shots"};
    daemon_config::ConfigResult result =
        daemon_config::apply_arguments(daemon_config::default_config(), arguments);
    bool success = result.success && result.config.headless && !result.config.initial_tab &&
                   result.config.socket_path == "/tmp/nlbd-flags.sock" &&
                   result.config.chrome_path == "/opt/chrome/chrome" &&
                   result.config.screenshot_directory == "/tmp/shots";
    return report(success, "command-line flags override defaults", result.error_detail);
}

static bool test_flag_errors() {
    bool all_passed = true;
    daemon_config::ConfigResult result =
        daemon_config::apply_arguments(daemon_config::default_config(), {"--socket"});
    all_passed &= report(!result.success && result.error_detail == "option --socket requires a value",
                         "flag without a value is rejected", result.error_detail);

    result = daemon_config::apply_arguments(daemon_config::default_config(), {"--turbo"});
    all_passed &= report(!result.success && result.error_detail == "unknown option: --turbo",
                         "unknown flag is rejected", result.error_detail);

    result = daemon_config::apply_arguments(daemon_config::default_config(),
                                            {"--socket", "/tmp/" + std::string(200, 's')});
    all_passed &= report(!result.success, "socket path longer than sun_path is rejected");

    result = daemon_config::apply_arguments(daemon_config::default_config(), {"--help"});
    all_passed &= report(result.show_help, "--help asks for usage");
    return all_passed;
}

static bool test_environment_overlay() {
    setenv("NLBD_SOCKET", "/tmp/nlbd-env.sock", 1);
    setenv("NLBD_HEADLESS", "yes", 1);
    setenv("NLBD_WAIT_TIMEOUT_MS", "1500", 1);
    setenv("NLBD_NAVIGATION_TIMEOUT_MS", "not-a-number", 1);

    daemon_config::DaemonConfig config = daemon_config::default_config();
    daemon_config::apply_environment(config);

    unsetenv("NLBD_SOCKET");
    unsetenv("NLBD_HEADLESS");
    unsetenv("NLBD_WAIT_TIMEOUT_MS");
    unsetenv("NLBD_NAVIGATION_TIMEOUT_MS");

    bool success = config.socket_path == "/tmp/nlbd-env.sock" && config.headless &&
                   config.wait_timeout_milliseconds == 1500 && config.navigation_timeout_milliseconds == 30000;
    return report(success, "environment overlays defaults; invalid numbers are ignored");
}

static bool test_flags_win_over_environment() {
    setenv("NLBD_SOCKET", "/tmp/nlbd-env.sock", 1);
    char program[] = "nlbd";
    char socket_flag[] = "--socket";
    char socket_value[] = "/tmp/nlbd-argv.sock";
    char *argv[] = {program, socket_flag, socket_value, nullptr};
    daemon_config::ConfigResult result = daemon_config::load_config(3, argv);
    unsetenv("NLBD_SOCKET");

    bool success = result.success && result.config.socket_path == "/tmp/nlbd-argv.sock";
    return report(success, "flags take precedence over the environment", result.error_detail);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_flags();
    all_passed &= test_flag_errors();
    all_passed &= test_environment_overlay();
    all_passed &= test_flags_win_over_environment();
    return all_passed;
}

} // namespace test_daemon_config
