#ifndef NLBD_DAEMON_HPP
#define NLBD_DAEMON_HPP

// Daemon lifecycle: STOPPED -> STARTING -> RUNNING -> STOPPING -> STOPPED.
//
// start() binds the endpoint (exactly once per socket path), launches the
// browser, creates the registry and the optional initial tab. run() serves
// one worker thread per connection until close_browser or request_stop().
// stop() waits for in-flight requests, closes every tab, releases the browser
// and unbinds the endpoint.

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "channel/unix_socket.hpp"
#include "config/daemon_config.hpp"
#include "daemon/daemon_context.hpp"
#include "protocol/error_kind.hpp"
#include "session/tab_registry.hpp"

namespace daemon_lifecycle {

enum class DaemonState {
    Stopped,
    Starting,
    Running,
    Stopping
};

const char *daemon_state_name(DaemonState state);

struct LifecycleResult {
    bool success = false;
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
    std::string error_detail;
};

class Daemon {
public:
    Daemon(daemon_config::DaemonConfig config, std::unique_ptr<browser_driver::BrowserDriver> driver);
    ~Daemon();

    Daemon(const Daemon &) = delete;
    Daemon &operator=(const Daemon &) = delete;

    LifecycleResult start();

    // Serve requests until shutdown; calls stop() before returning.
    LifecycleResult run();

    // Ask run() to return. Only stores an atomic flag, so a signal handler may call it.
    void request_stop() { stop_requested_ = true; }

    void stop();

    DaemonState state() const { return state_.load(); }

    // Valid between start() and stop().
    nlbd::DaemonContext *context() { return context_.get(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_connection(int connection_fd);
    void reap_workers(bool wait_for_all);

    daemon_config::DaemonConfig config_;
    std::unique_ptr<browser_driver::BrowserDriver> driver_;
    std::unique_ptr<session::TabRegistry> registry_;
    std::unique_ptr<nlbd::DaemonContext> context_;
    channel::ListenResult endpoint_;

    std::atomic<DaemonState> state_{DaemonState::Stopped};
    std::atomic<bool> stop_requested_{false};
    std::mutex lifecycle_mutex_;
    std::vector<Worker> workers_;
};

} // namespace daemon_lifecycle

#endif // NLBD_DAEMON_HPP
