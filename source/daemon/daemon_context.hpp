#ifndef NLBD_DAEMON_CONTEXT_HPP
#define NLBD_DAEMON_CONTEXT_HPP

// State owned by one running daemon and passed explicitly to every request
// handler: the browser driver, the tab registry and the configuration.

#include <atomic>

#include "browser/browser_driver_abi.hpp"
#include "config/daemon_config.hpp"
#include "session/tab_registry.hpp"

namespace nlbd {

struct DaemonContext {
    DaemonContext(browser_driver::BrowserDriver &browser_driver, session::TabRegistry &tab_registry,
                  const daemon_config::DaemonConfig &daemon_configuration)
        : driver(browser_driver), registry(tab_registry), config(daemon_configuration) {}

    browser_driver::BrowserDriver &driver;
    session::TabRegistry &registry;
    const daemon_config::DaemonConfig &config;

    // Set by close_browser; the accept loop stops after the reply is flushed.
    std::atomic<bool> shutdown_requested{false};
};

} // namespace nlbd

#endif // NLBD_DAEMON_CONTEXT_HPP
