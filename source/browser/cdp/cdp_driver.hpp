#ifndef NLBD_CDP_DRIVER_HPP
#define NLBD_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// Manages the WebSocket connection to Chrome, Target/session routing,
// and implements the browser_driver interfaces on top of it.
//
// Threading: one service thread runs the libwebsockets event loop. Any thread
// may call CdpConnection::send_command(); the command is queued, written from
// the service thread, and the caller blocks until the matching response (by
// message id) arrives or the timeout expires. Pages therefore make progress
// independently of each other.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "browser/browser_driver_abi.hpp"

struct lws_context;
struct lws;

namespace cdp_driver {

using json = nlohmann::json;

class CdpConnection {
public:
    CdpConnection() = default;
    ~CdpConnection();

    CdpConnection(const CdpConnection &) = delete;
    CdpConnection &operator=(const CdpConnection &) = delete;

    // Connect to Chrome via WebSocket at the given URL and start the service thread.
    bool connect(const std::string &websocket_url, std::string &error_detail);

    // Stop the service thread and destroy the WebSocket context.
    void disconnect();

    bool connected() const { return connected_; }

    // Send a CDP command and wait for the response (blocking, with timeout).
    // If session_id is non-empty, the command is routed to that session.
    // Returns the response JSON. Local failures come back as {"error": "<text>"},
    // with "timed_out": true added when the wait expired.
    json send_command(const std::string &method, const json &params,
                      const std::string &session_id = "", int timeout_milliseconds = 10000);

    // libwebsockets callback trampoline target.
    int handle_callback(struct lws *websocket_instance, int reason,
                        void *incoming_data, size_t incoming_length);

private:
    void service_loop();
    void fail_all_pending(const std::string &reason);

    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;
    std::thread service_thread_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> connection_failed_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<int> next_message_id_{1};

    // Serialized commands waiting to be written from the service thread.
    std::deque<std::string> outbound_messages_;
    std::mutex outbound_mutex_;

    // Pending request map: message id -> response JSON (filled when response arrives).
    std::map<int, json> pending_responses_;
    // Ids whose callers are still waiting; late responses for others are dropped.
    std::set<int> waiting_message_ids_;
    std::mutex pending_mutex_;
    std::condition_variable pending_condition_;

    // Buffer for incoming WebSocket fragments (service thread only).
    std::string receive_buffer_;
};

// True if a send_command response signals failure. Fills error_detail and
// timed_out. Handles both local errors ({"error": "text"}) and CDP protocol
// errors ({"error": {"code": ..., "message": ...}}).
bool response_failed(const json &response, std::string &error_detail, bool &timed_out);

// One attached page target.
class CdpPage : public browser_driver::PageHandle {
public:
    CdpPage(CdpConnection &connection, std::string target_id, std::string session_id,
            int command_timeout_milliseconds);

    std::string page_id() const override { return target_id_; }

    browser_driver::NavigateResult navigate(const std::string &url, int timeout_milliseconds) override;
    browser_driver::DriverResult click(const std::string &selector) override;
    browser_driver::DriverResult fill(const std::string &selector, const std::string &text) override;
    browser_driver::TextResult get_text(const std::string &selector) override;
    browser_driver::DriverResult wait_for(const std::string &selector, int timeout_milliseconds) override;
    browser_driver::CaptureScreenshotResult screenshot(const std::string &path, bool full_page) override;
    browser_driver::EvaluateJavaScriptResult execute_script(const std::string &code) override;
    browser_driver::PageContentResult get_content() override;
    browser_driver::DriverResult scroll(const browser_driver::ScrollScope &scroll_scope) override;
    browser_driver::PageLocation get_location() override;
    browser_driver::DriverResult bring_to_front() override;
    browser_driver::DriverResult close() override;

    // Issue Page.navigate without waiting for the load to finish.
    // loader_started is set when a new document is being loaded.
    browser_driver::NavigateResult begin_navigation(const std::string &url,
                                                    bool *loader_started = nullptr);

private:
    // Runtime.evaluate with returnByValue/awaitPromise on this page's session.
    browser_driver::EvaluateJavaScriptResult evaluate(const std::string &expression,
                                                      int timeout_milliseconds);
    json page_command(const std::string &method, const json &params);

    CdpConnection &connection_;
    std::string target_id_;
    std::string session_id_;
    int command_timeout_milliseconds_;
    int navigation_counter_ = 0;
    bool closed_ = false;
};

class CdpDriver : public browser_driver::BrowserDriver {
public:
    CdpDriver() = default;
    ~CdpDriver() override;

    // Launch Chrome, connect via CDP and discover the initial page targets.
    browser_driver::DriverResult open_browser(const browser_driver::OpenBrowserOptions &options) override;

    // Adopt one of Chrome's initial pages if any is unclaimed, else create a target.
    browser_driver::OpenPageResult open_page(const std::string &url) override;

    void close_browser() override;

    bool is_open() const override { return connection_.connected(); }

    // For introspection / testing.
    CdpConnection &connection() { return connection_; }

private:
    browser_driver::OpenPageResult attach_page(const std::string &target_id);

    CdpConnection connection_;
    std::mutex driver_mutex_;
    std::vector<std::string> unclaimed_target_ids_;
    int chrome_process_id_ = -1;
    std::string user_data_directory_;
    int command_timeout_milliseconds_ = 10000;
};

} // namespace cdp_driver

#endif // NLBD_CDP_DRIVER_HPP
