#include "daemon/daemon.hpp"
#include "action_handlers/action_handlers.hpp"
#include "daemon/request_handler.hpp"
#include "protocol/envelope.hpp"
#include "utils/debug_log.hpp"

#include <system_error>
#include <utility>

namespace daemon_lifecycle {

// Accept waits in short slices so a stop request is noticed promptly.
static constexpr int kAcceptSliceMilliseconds = 200;

const char *daemon_state_name(DaemonState state) {
    switch (state) {
    case DaemonState::Stopped: return "stopped";
    case DaemonState::Starting: return "starting";
    case DaemonState::Running: return "running";
    case DaemonState::Stopping: return "stopping";
    }
    return "stopped";
}

Daemon::Daemon(daemon_config::DaemonConfig config, std::unique_ptr<browser_driver::BrowserDriver> driver)
    : config_(std::move(config)), driver_(std::move(driver)) {}

Daemon::~Daemon() {
    stop();
}

LifecycleResult Daemon::start() {
    LifecycleResult result;
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_ != DaemonState::Stopped) {
        result.error_kind = nlbd::ErrorKind::Lifecycle;
        result.error_detail = std::string("daemon already running (state: ") + daemon_state_name(state_) + ")";
        return result;
    }
    if (!driver_) {
        result.error_kind = nlbd::ErrorKind::Lifecycle;
        result.error_detail = "no browser driver";
        return result;
    }
    state_ = DaemonState::Starting;
    stop_requested_ = false;

    // Bind first: a second daemon on the same path must fail before launching a browser.
    endpoint_ = channel::listen_endpoint(config_.socket_path);
    if (!endpoint_.success) {
        result.error_kind = endpoint_.error_kind == nlbd::ErrorKind::None ? nlbd::ErrorKind::Transport
                                                                          : endpoint_.error_kind;
        result.error_detail = endpoint_.error_detail;
        state_ = DaemonState::Stopped;
        return result;
    }
    debug_log::info("listening on " + config_.socket_path);

    browser_driver::OpenBrowserOptions options;
    options.headless = config_.headless;
    options.chrome_path = config_.chrome_path;
    options.command_timeout_milliseconds = config_.command_timeout_milliseconds;
    browser_driver::DriverResult browser_result = driver_->open_browser(options);
    if (!browser_result.success) {
        result.error_kind = browser_result.timed_out ? nlbd::ErrorKind::Timeout : nlbd::ErrorKind::Driver;
        result.error_detail = "browser launch failed: " + browser_result.error_detail;
        channel::close_endpoint(endpoint_, config_.socket_path);
        state_ = DaemonState::Stopped;
        return result;
    }
    debug_log::info(std::string("browser started (") + (config_.headless ? "headless" : "headed") + ")");

    registry_ = std::make_unique<session::TabRegistry>(*driver_);
    context_ = std::make_unique<nlbd::DaemonContext>(*driver_, *registry_, config_);
    action_handlers::register_all_handlers();

    if (config_.initial_tab) {
        session::RegistryResult tab_result = registry_->open_tab();
        if (!tab_result.success) {
            debug_log::warn("initial tab not opened: " + tab_result.error_detail);
        }
    }

    state_ = DaemonState::Running;
    result.success = true;
    return result;
}

void Daemon::handle_connection(int connection_fd) {
    channel::ReadResult read_result = channel::read_frame(connection_fd, config_.request_read_timeout_milliseconds);

    nlohmann::json response;
    if (read_result.success) {
        response = request_handler::handle_request_frame(read_result.frame, *context_);
    } else if (read_result.peer_closed) {
        debug_log::log("client closed the connection before sending a request");
        channel::close_fd(connection_fd);
        return;
    } else if (read_result.timed_out) {
        response = envelope::build_error_response(nlbd::ErrorKind::Transport,
                                                  "timed out waiting for request");
    } else {
        response = envelope::build_error_response(nlbd::ErrorKind::Transport,
                                                  "malformed request: " + read_result.error_detail);
    }

    std::string write_error;
    if (!channel::write_frame(connection_fd, envelope::serialize(response), write_error)) {
        debug_log::warn("response lost: " + write_error);
    }
    channel::close_fd(connection_fd);
}

void Daemon::reap_workers(bool wait_for_all) {
    for (auto worker = workers_.begin(); worker != workers_.end();) {
        if (wait_for_all || worker->done->load()) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
            worker = workers_.erase(worker);
        } else {
            ++worker;
        }
    }
}

LifecycleResult Daemon::run() {
    LifecycleResult result;
    if (state_ != DaemonState::Running) {
        result.error_kind = nlbd::ErrorKind::Lifecycle;
        result.error_detail = std::string("daemon not running (state: ") + daemon_state_name(state_) + ")";
        return result;
    }

    while (!stop_requested_ && !context_->shutdown_requested) {
        channel::AcceptResult accept_result =
            channel::accept_connection(endpoint_.listen_fd, kAcceptSliceMilliseconds);
        reap_workers(false);

        if (accept_result.timed_out) {
            continue;
        }
        if (!accept_result.success) {
            debug_log::warn("accept failed: " + accept_result.error_detail);
            continue;
        }

        Worker worker;
        worker.done = std::make_shared<std::atomic<bool>>(false);
        std::shared_ptr<std::atomic<bool>> done = worker.done;
        int connection_fd = accept_result.fd;
        try {
            worker.thread = std::thread([this, connection_fd, done]() {
                handle_connection(connection_fd);
                *done = true;
            });
        } catch (const std::system_error &thread_error) {
            debug_log::warn(std::string("could not start request worker: ") + thread_error.what());
            std::string write_error;
            if (!channel::write_frame(connection_fd,
                                      envelope::serialize(envelope::build_error_response(
                                          nlbd::ErrorKind::Transport, "daemon busy")),
                                      write_error)) {
                debug_log::warn("response lost: " + write_error);
            }
            channel::close_fd(connection_fd);
            continue;
        }
        workers_.push_back(std::move(worker));
    }

    if (context_->shutdown_requested) {
        debug_log::info("close_browser received; shutting down");
    } else {
        debug_log::info("stop requested; shutting down");
    }
    stop();
    result.success = true;
    return result;
}

void Daemon::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_ != DaemonState::Running) {
        return;
    }
    state_ = DaemonState::Stopping;

    // New requests are refused while in-flight ones finish.
    context_->shutdown_requested = true;
    reap_workers(true);

    registry_->close_all();
    if (driver_->is_open()) {
        driver_->close_browser();
    }
    channel::close_endpoint(endpoint_, config_.socket_path);

    context_.reset();
    registry_.reset();
    state_ = DaemonState::Stopped;
    debug_log::info("daemon stopped");
}

} // namespace daemon_lifecycle
