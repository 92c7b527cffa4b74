// nlbd - natural-language browser daemon
// Entry point: loads configuration, starts the daemon and serves the command
// channel until close_browser or a termination signal.
//
// Logs go to stderr.

#include <csignal>
#include <iostream>
#include <memory>
#include <utility>

#include "action_handlers/action_handlers.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "config/daemon_config.hpp"
#include "daemon/daemon.hpp"
#include "utils/debug_log.hpp"

static daemon_lifecycle::Daemon *running_daemon = nullptr;

static void signal_handler(int signal_number) {
    (void)signal_number;
    if (running_daemon != nullptr) {
        running_daemon->request_stop();
    }
}

int main(int argc, char **argv) {
    daemon_config::ConfigResult config_result = daemon_config::load_config(argc, argv);
    if (config_result.show_help) {
        std::cout << daemon_config::usage_text() << "\nActions:\n" << action_handlers::action_summary();
        return 0;
    }
    if (!config_result.success) {
        std::cerr << "nlbd: " << config_result.error_detail << std::endl;
        std::cerr << daemon_config::usage_text();
        return 2;
    }

    debug_log::info("nlbd - natural-language browser daemon, build " + std::string(__DATE__) + " " + __TIME__);

    std::unique_ptr<browser_driver::BrowserDriver> driver = std::make_unique<cdp_driver::CdpDriver>();
    daemon_lifecycle::Daemon daemon(config_result.config, std::move(driver));

    // A client that disconnects early must not kill the daemon on write.
    std::signal(SIGPIPE, SIG_IGN);

    daemon_lifecycle::LifecycleResult start_result = daemon.start();
    if (!start_result.success) {
        std::cerr << "nlbd: " << start_result.error_detail << std::endl;
        return 1;
    }

    running_daemon = &daemon;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    debug_log::info("ready; send instructions with nlb");
    daemon_lifecycle::LifecycleResult run_result = daemon.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    running_daemon = nullptr;

    if (!run_result.success) {
        std::cerr << "nlbd: " << run_result.error_detail << std::endl;
        return 1;
    }
    debug_log::info("nlbd shut down.");
    return 0;
}
