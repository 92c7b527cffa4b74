// End-to-end tests of the daemon over a real Unix socket with the fake driver:
// start/run/stop transitions, single binding, request handling and shutdown
// through close_browser.

#include "client/client.hpp"
#include "daemon/daemon.hpp"
#include "daemon/request_handler.hpp"
#include "support/fake_driver.hpp"

#include <unistd.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace test_daemon_lifecycle {

using json = nlohmann::json;

static bool report(bool success, const std::string &description, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << (detail.empty() ? "" : " (" + detail + ")") << std::endl;
    }
    return success;
}

static daemon_config::DaemonConfig test_config(const std::string &name) {
    daemon_config::DaemonConfig config = daemon_config::default_config();
    config.socket_path = "/tmp/nlbd_test_daemon_" + name + "_" + std::to_string(getpid()) + ".sock";
    config.headless = true;
    config.screenshot_directory = "/tmp";
    config.request_read_timeout_milliseconds = 500;
    return config;
}

static std::unique_ptr<browser_driver::BrowserDriver> make_driver(
    const std::shared_ptr<fake_driver::FakeBrowserState> &state) {
    return std::unique_ptr<browser_driver::BrowserDriver>(new fake_driver::FakeDriver(state));
}

static client::ExchangeResult send(const daemon_config::DaemonConfig &config, const std::string &text) {
    return client::send_instruction(config.socket_path, text, "/tmp", 5000);
}

static bool test_start_and_stop_transitions() {
    auto state = std::make_shared<fake_driver::FakeBrowserState>();
    daemon_config::DaemonConfig config = test_config("transitions");
    daemon_lifecycle::Daemon daemon(config, make_driver(state));
    bool all_passed = true;

    daemon_lifecycle::LifecycleResult result = daemon.run();
    all_passed &= report(!result.success && result.error_kind == nlbd::ErrorKind::Lifecycle,
                         "run before start is a lifecycle error", result.error_detail);

    result = daemon.start();
    all_passed &= report(result.success && daemon.state() == daemon_lifecycle::DaemonState::Running &&
                             daemon.context() != nullptr && daemon.context()->registry.size() == 1,
                         "start binds, launches the browser and opens the initial tab", result.error_detail);

    result = daemon.start();
    all_passed &= report(!result.success && result.error_kind == nlbd::ErrorKind::Lifecycle,
                         "second start is rejected", result.error_detail);

    daemon.stop();
    all_passed &= report(daemon.state() == daemon_lifecycle::DaemonState::Stopped &&
                             state->close_browser_count == 1 && access(config.socket_path.c_str(), F_OK) != 0,
                         "stop closes the browser and removes the endpoint");
    return all_passed;
}

static bool test_second_daemon_fails_fast() {
    auto first_state = std::make_shared<fake_driver::FakeBrowserState>();
    auto second_state = std::make_shared<fake_driver::FakeBrowserState>();
    daemon_config::DaemonConfig config = test_config("single");

    daemon_lifecycle::Daemon first(config, make_driver(first_state));
    daemon_lifecycle::Daemon second(config, make_driver(second_state));
    daemon_lifecycle::LifecycleResult first_result = first.start();
    daemon_lifecycle::LifecycleResult second_result = second.start();

    bool success = first_result.success && !second_result.success &&
                   second_result.error_kind == nlbd::ErrorKind::Lifecycle &&
                   second_state->open_browser_count == 0 && access(config.socket_path.c_str(), F_OK) == 0;
    first.stop();
    return report(success, "second daemon on the same endpoint fails before launching a browser",
                  second_result.error_detail);
}

static bool test_browser_launch_failure() {
    auto state = std::make_shared<fake_driver::FakeBrowserState>();
    state->fail_open_browser = true;
    daemon_config::DaemonConfig config = test_config("launch");
    daemon_lifecycle::Daemon daemon(config, make_driver(state));

    daemon_lifecycle::LifecycleResult result = daemon.start();
    bool success = !result.success && result.error_kind == nlbd::ErrorKind::Driver &&
                   daemon.state() == daemon_lifecycle::DaemonState::Stopped &&
                   access(config.socket_path.c_str(), F_OK) != 0;
    return report(success, "browser launch failure releases the endpoint", result.error_detail);
}

static bool test_requests_until_close_browser() {
    auto state = std::make_shared<fake_driver::FakeBrowserState>();
    daemon_config::DaemonConfig config = test_config("serve");
    config.initial_tab = false;
    daemon_lifecycle::Daemon daemon(config, make_driver(state));
    if (!daemon.start().success) {
        return report(false, "start daemon for request test");
    }

    daemon_lifecycle::LifecycleResult run_result;
    std::thread runner([&]() { run_result = daemon.run(); });
    bool all_passed = true;

    client::ExchangeResult exchange = send(config, "click #nothing");
    all_passed &= report(exchange.success && !exchange.response.ok &&
                             exchange.response.error_kind == nlbd::ErrorKind::Registry,
                         "page action with no tabs reports a registry error", exchange.response.message);

    exchange = send(config, "open a new tab and go to example.com");
    all_passed &= report(exchange.success && exchange.response.ok &&
                             exchange.response.data["steps"].size() == 2,
                         "compound instruction over the socket", exchange.response.message);

    exchange = send(config, "make me a sandwich");
    all_passed &= report(exchange.success && !exchange.response.ok &&
                             exchange.response.error_kind == nlbd::ErrorKind::Parse &&
                             exchange.response.data["parse_error"] == "no_match",
                         "unparseable instruction reports a parse error", exchange.response.message);

    exchange = send(config, "list tabs");
    all_passed &= report(exchange.success && exchange.response.ok && exchange.response.data["tabs"].size() == 1 &&
                             exchange.response.data["tabs"][0]["url"] == "https://example.com",
                         "daemon keeps tab state between requests", exchange.response.message);

    exchange = send(config, "close the browser");
    all_passed &= report(exchange.success && exchange.response.ok, "close_browser is acknowledged",
                         exchange.response.message);

    runner.join();
    all_passed &= report(run_result.success && daemon.state() == daemon_lifecycle::DaemonState::Stopped &&
                             state->close_browser_count == 1 && state->count_calls("close") == 1,
                         "run returns after close_browser and releases every resource");

    exchange = send(config, "list tabs");
    all_passed &= report(!exchange.success && exchange.daemon_absent,
                         "client sees the daemon as not started afterwards", exchange.error_detail);
    return all_passed;
}

static bool test_parallel_clients() {
    auto state = std::make_shared<fake_driver::FakeBrowserState>();
    state->operation_delay_milliseconds = 20;
    daemon_config::DaemonConfig config = test_config("parallel");
    daemon_lifecycle::Daemon daemon(config, make_driver(state));
    if (!daemon.start().success) {
        return report(false, "start daemon for parallel test");
    }
    std::thread runner([&]() { daemon.run(); });

    std::vector<std::thread> clients;
    std::vector<int> outcomes(6, 0);
    for (size_t index = 0; index < outcomes.size(); ++index) {
        clients.emplace_back([&, index]() {
            client::ExchangeResult exchange = send(config, "click #item-" + std::to_string(index));
            outcomes[index] = exchange.success && exchange.response.ok ? 1 : 0;
        });
    }
    for (auto &client_thread : clients) {
        client_thread.join();
    }
    daemon.request_stop();
    runner.join();

    bool success = state->count_calls("click") == outcomes.size() && state->max_page_overlap.load() == 1;
    for (int outcome : outcomes) {
        success = success && outcome == 1;
    }
    return report(success, "concurrent clients on one tab are served one at a time",
                  "max overlap " + std::to_string(state->max_page_overlap.load()));
}

static bool test_request_handler_edges() {
    auto state = std::make_shared<fake_driver::FakeBrowserState>();
    fake_driver::FakeDriver driver(state);
    session::TabRegistry registry(driver);
    daemon_config::DaemonConfig config = test_config("handler");
    nlbd::DaemonContext context(driver, registry, config);
    bool all_passed = true;

    json response = request_handler::handle_request_frame("{\"text\": 12", context);
    all_passed &= report(response["status"] == "error" && response["error_kind"] == "transport",
                         "invalid JSON is a transport error", response.dump());

    response = request_handler::handle_request_frame("{\"cwd\": \"/tmp\"}", context);
    all_passed &= report(response["status"] == "error" && response["error_kind"] == "transport",
                         "request without text is a transport error", response.dump());

    response = request_handler::handle_request_frame("{\"text\": \"   \"}", context);
    all_passed &= report(response["error_kind"] == "parse" && response["data"]["parse_error"] == "empty",
                         "blank instruction is a parse error", response.dump());

    context.shutdown_requested = true;
    response = request_handler::handle_request_frame("{\"text\": \"list tabs\"}", context);
    all_passed &= report(response["error_kind"] == "lifecycle" && response["message"] == "daemon is shutting down",
                         "requests after shutdown are refused", response.dump());
    return all_passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_start_and_stop_transitions();
    all_passed &= test_second_daemon_fails_fast();
    all_passed &= test_browser_launch_failure();
    all_passed &= test_requests_until_close_browser();
    all_passed &= test_parallel_clients();
    all_passed &= test_request_handler_edges();
    return all_passed;
}

} // namespace test_daemon_lifecycle
