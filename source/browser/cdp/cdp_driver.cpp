#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>

namespace cdp_driver {

// Forward declaration of the WebSocket callback.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    struct lws_context *context = lws_get_context(websocket_instance);
    if (context == nullptr) {
        return 0;
    }
    auto *connection = static_cast<CdpConnection *>(lws_context_user(context));
    if (connection == nullptr) {
        return 0;
    }
    return connection->handle_callback(websocket_instance, static_cast<int>(reason),
                                       incoming_data, incoming_length);
}

// --- CdpConnection ---

CdpConnection::~CdpConnection() {
    disconnect();
}

int CdpConnection::handle_callback(struct lws *websocket_instance, int reason_value,
                                   void *incoming_data, size_t incoming_length) {
    auto reason = static_cast<enum lws_callback_reasons>(reason_value);

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        connected_ = true;
        pending_condition_.notify_all();
        debug_log::log("CDP WebSocket connected.");
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        receive_buffer_.append(static_cast<const char *>(incoming_data), incoming_length);
        if (!lws_is_final_fragment(websocket_instance) ||
            lws_remaining_packet_payload(websocket_instance) != 0) {
            break;
        }

        json message;
        try {
            message = json::parse(receive_buffer_);
        } catch (const json::parse_error &parse_error) {
            debug_log::warn(std::string("Failed to parse CDP message: ") + parse_error.what() +
                            ", buffer content: " + receive_buffer_.substr(0, 200));
            receive_buffer_.clear();
            break;
        }
        receive_buffer_.clear();

        if (message.contains("id") && message["id"].is_number_integer()) {
            int message_id = message["id"].get<int>();
            std::lock_guard<std::mutex> lock(pending_mutex_);
            if (waiting_message_ids_.count(message_id) > 0) {
                pending_responses_[message_id] = std::move(message);
                pending_condition_.notify_all();
            }
        } else if (message.contains("method") && message["method"].is_string()) {
            // Events are not consumed; page state is polled instead.
            std::string method = message["method"].get<std::string>();
            if (method == "Target.targetDestroyed" || method == "Target.detachedFromTarget" ||
                method == "Inspector.detached") {
                debug_log::log("CDP event: " + method);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        debug_log::warn(std::string("CDP WebSocket connection error: ") + error_message);
        std::lock_guard<std::mutex> lock(pending_mutex_);
        connected_ = false;
        connection_failed_ = true;
        websocket_connection_ = nullptr;
        pending_condition_.notify_all();
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED: {
        if (!stopping_) {
            debug_log::warn("CDP WebSocket closed.");
        }
        std::lock_guard<std::mutex> lock(pending_mutex_);
        connected_ = false;
        websocket_connection_ = nullptr;
        pending_condition_.notify_all();
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // send_command() queued something and woke the loop.
        bool has_outbound = false;
        {
            std::lock_guard<std::mutex> lock(outbound_mutex_);
            has_outbound = !outbound_messages_.empty();
        }
        if (has_outbound && websocket_connection_ != nullptr) {
            lws_callback_on_writable(websocket_connection_);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        std::string serialized_command;
        bool more_pending = false;
        {
            std::lock_guard<std::mutex> lock(outbound_mutex_);
            if (outbound_messages_.empty()) {
                break;
            }
            serialized_command = std::move(outbound_messages_.front());
            outbound_messages_.pop_front();
            more_pending = !outbound_messages_.empty();
        }

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
        std::memcpy(send_buffer.data() + LWS_PRE, serialized_command.data(), serialized_command.size());
        int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE,
                                      serialized_command.size(), LWS_WRITE_TEXT);
        if (bytes_written < 0) {
            debug_log::warn("Failed to write CDP command to WebSocket; closing connection.");
            return -1;
        }
        if (more_pending) {
            lws_callback_on_writable(websocket_instance);
        }
        break;
    }

    default:
        break;
    }

    return 0;
}

bool CdpConnection::connect(const std::string &websocket_url, std::string &error_detail) {
    debug_log::log("connect() URL=" + websocket_url);

    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.compare(0, 5, "ws://") == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port;
    std::string path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    // Split host from port.
    std::string host = "127.0.0.1";
    int port = 9222;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        host = host_and_port.substr(0, colon_position);
        try {
            port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            error_detail = "Failed to parse port from WebSocket URL: " + websocket_url;
            return false;
        }
    }

    struct lws_context_creation_info context_info;
    std::memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        error_detail = "Failed to create libwebsockets context.";
        return false;
    }

    struct lws_client_connect_info connect_info;
    std::memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    connected_ = false;
    connection_failed_ = false;
    stopping_ = false;
    websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (websocket_connection_ == nullptr) {
        error_detail = "lws_client_connect_via_info returned null for " + websocket_url;
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
        return false;
    }

    service_thread_ = std::thread(&CdpConnection::service_loop, this);

    const int connection_timeout_milliseconds = 20000;
    {
        std::unique_lock<std::mutex> lock(pending_mutex_);
        pending_condition_.wait_for(lock, std::chrono::milliseconds(connection_timeout_milliseconds),
                                    [this] { return connected_.load() || connection_failed_.load(); });
    }

    if (!connected_) {
        error_detail = connection_failed_
            ? "CDP WebSocket connection failed: " + websocket_url
            : "Timed out connecting to CDP WebSocket (after " +
                  std::to_string(connection_timeout_milliseconds / 1000) + " s).";
        disconnect();
        return false;
    }
    return true;
}

void CdpConnection::service_loop() {
    while (!stopping_) {
        lws_service(websocket_context_, 50);
    }
}

void CdpConnection::disconnect() {
    if (websocket_context_ == nullptr) {
        return;
    }
    debug_log::log("disconnect(): stopping CDP service thread.");
    stopping_ = true;
    lws_cancel_service(websocket_context_);
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    lws_context_destroy(websocket_context_);
    websocket_context_ = nullptr;
    websocket_connection_ = nullptr;
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(outbound_mutex_);
        outbound_messages_.clear();
    }
    fail_all_pending("CDP connection closed.");
    debug_log::log("disconnect() finished.");
}

void CdpConnection::fail_all_pending(const std::string &reason) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    debug_log::log("Releasing CDP waiters: " + reason);
    pending_responses_.clear();
    pending_condition_.notify_all();
}

json CdpConnection::send_command(const std::string &method, const json &params,
                                 const std::string &session_id, int timeout_milliseconds) {
    if (!connected_ || websocket_context_ == nullptr) {
        json error_response;
        error_response["error"] = "Not connected to CDP";
        return error_response;
    }

    // Build the CDP command message.
    int message_id = next_message_id_++;
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    // Session routing: if session_id is set, include it in the message.
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        waiting_message_ids_.insert(message_id);
    }
    {
        std::lock_guard<std::mutex> lock(outbound_mutex_);
        outbound_messages_.push_back(command.dump(-1, ' ', false, json::error_handler_t::replace));
    }
    lws_cancel_service(websocket_context_);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    std::unique_lock<std::mutex> lock(pending_mutex_);
    pending_condition_.wait_until(lock, deadline, [this, message_id] {
        return pending_responses_.count(message_id) > 0 || !connected_.load();
    });
    waiting_message_ids_.erase(message_id);

    auto response_iterator = pending_responses_.find(message_id);
    if (response_iterator != pending_responses_.end()) {
        json response = std::move(response_iterator->second);
        pending_responses_.erase(response_iterator);
        return response;
    }

    json error_response;
    if (!connected_) {
        error_response["error"] = "CDP connection closed while waiting for " + method;
    } else {
        error_response["error"] = "Timed out waiting for CDP response to method: " + method;
        error_response["timed_out"] = true;
        error_response["message_id"] = message_id;
    }
    return error_response;
}

bool response_failed(const json &response, std::string &error_detail, bool &timed_out) {
    timed_out = false;
    if (!response.contains("error")) {
        return false;
    }
    const json &error = response["error"];
    if (error.is_string()) {
        error_detail = error.get<std::string>();
    } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        error_detail = error["message"].get<std::string>();
    } else {
        error_detail = error.dump();
    }
    timed_out = response.value("timed_out", false);
    return true;
}

// --- CdpDriver ---

CdpDriver::~CdpDriver() {
    close_browser();
}

browser_driver::DriverResult CdpDriver::open_browser(const browser_driver::OpenBrowserOptions &options) {
    browser_driver::DriverResult result;

    if (connection_.connected()) {
        result.success = true;
        result.message = "Browser already open.";
        return result;
    }
    command_timeout_milliseconds_ = options.command_timeout_milliseconds;

    cdp_chrome_launch::ChromeLaunchResult launch_result = cdp_chrome_launch::launch_chrome(options);
    if (!launch_result.success) {
        result.error_detail = launch_result.error_message;
        result.message = "Failed to launch Chrome.";
        return result;
    }
    chrome_process_id_ = launch_result.process_id;
    user_data_directory_ = launch_result.user_data_directory;

    debug_log::log("Connecting to CDP WebSocket...");
    std::string connect_error;
    if (!connection_.connect(launch_result.websocket_debugger_url, connect_error)) {
        result.error_detail = connect_error;
        result.message = "Failed to connect to Chrome CDP.";
        close_browser();
        return result;
    }

    json discover_params;
    discover_params["discover"] = true;
    json discover_response = connection_.send_command("Target.setDiscoverTargets", discover_params);
    std::string error_detail;
    bool timed_out = false;
    if (response_failed(discover_response, error_detail, timed_out)) {
        debug_log::warn("Target.setDiscoverTargets returned: " + error_detail);
    }

    // Chrome starts with one page already open; remember it so the first
    // open_page() adopts it instead of leaving an orphan window.
    json get_targets_response = connection_.send_command("Target.getTargets", json::object());
    std::lock_guard<std::mutex> lock(driver_mutex_);
    unclaimed_target_ids_.clear();
    if (get_targets_response.contains("result") &&
        get_targets_response["result"].contains("targetInfos")) {
        for (const auto &target_info : get_targets_response["result"]["targetInfos"]) {
            if (target_info.value("type", "") == "page" && target_info.contains("targetId")) {
                unclaimed_target_ids_.push_back(target_info["targetId"].get<std::string>());
            }
        }
    }
    debug_log::log("open_browser: " + std::to_string(unclaimed_target_ids_.size()) +
                   " initial page target(s).");

    result.success = true;
    result.message = "Browser opened.";
    return result;
}

browser_driver::OpenPageResult CdpDriver::attach_page(const std::string &target_id) {
    browser_driver::OpenPageResult result;

    json attach_params;
    attach_params["targetId"] = target_id;
    attach_params["flatten"] = true;
    json attach_response = connection_.send_command("Target.attachToTarget", attach_params, "",
                                                    command_timeout_milliseconds_);
    if (!attach_response.contains("result") || !attach_response["result"].contains("sessionId")) {
        std::string error_detail;
        bool timed_out = false;
        response_failed(attach_response, error_detail, timed_out);
        result.timed_out = timed_out;
        result.error_detail = "Target.attachToTarget failed: " +
                              (error_detail.empty() ? attach_response.dump() : error_detail);
        return result;
    }

    std::string session_id = attach_response["result"]["sessionId"].get<std::string>();
    debug_log::log("attach_page: targetId=" + target_id + " sessionId=" + session_id);
    result.page = std::make_unique<CdpPage>(connection_, target_id, session_id, command_timeout_milliseconds_);
    result.success = true;
    return result;
}

browser_driver::OpenPageResult CdpDriver::open_page(const std::string &url) {
    browser_driver::OpenPageResult result;

    if (!connection_.connected()) {
        result.error_detail = "Not connected to a browser.";
        return result;
    }

    std::string adopted_target_id;
    {
        std::lock_guard<std::mutex> lock(driver_mutex_);
        if (!unclaimed_target_ids_.empty()) {
            adopted_target_id = unclaimed_target_ids_.front();
            unclaimed_target_ids_.erase(unclaimed_target_ids_.begin());
        }
    }

    if (!adopted_target_id.empty()) {
        result = attach_page(adopted_target_id);
        if (result.success && !url.empty() && url != "about:blank") {
            auto *page = static_cast<CdpPage *>(result.page.get());
            browser_driver::NavigateResult navigate_result = page->begin_navigation(url);
            if (!navigate_result.success) {
                debug_log::warn("open_page: initial navigation to " + url + " failed: " +
                                navigate_result.error_text);
            }
        }
        return result;
    }

    json create_params;
    create_params["url"] = url.empty() ? "about:blank" : url;
    json create_response = connection_.send_command("Target.createTarget", create_params, "",
                                                    command_timeout_milliseconds_);
    if (!create_response.contains("result") || !create_response["result"].contains("targetId")) {
        std::string error_detail;
        bool timed_out = false;
        response_failed(create_response, error_detail, timed_out);
        result.timed_out = timed_out;
        result.error_detail = "Target.createTarget failed: " +
                              (error_detail.empty() ? create_response.dump() : error_detail);
        return result;
    }

    std::string target_id = create_response["result"]["targetId"].get<std::string>();
    debug_log::log("open_page: created targetId=" + target_id);
    return attach_page(target_id);
}

void CdpDriver::close_browser() {
    connection_.disconnect();

    if (chrome_process_id_ > 0) {
        debug_log::log("close_browser: terminating Chrome pid=" + std::to_string(chrome_process_id_));
        platform::kill_process(chrome_process_id_);
        if (!platform::wait_for_exit(chrome_process_id_, 5000)) {
            debug_log::warn("Chrome did not exit in time; sending SIGKILL.");
            platform::kill_process(chrome_process_id_, true);
            platform::wait_for_exit(chrome_process_id_, 2000);
        }
        chrome_process_id_ = -1;
    }

    if (!user_data_directory_.empty()) {
        std::error_code remove_error;
        std::filesystem::remove_all(user_data_directory_, remove_error);
        if (remove_error) {
            debug_log::log("close_browser: could not remove profile " + user_data_directory_ +
                           ": " + remove_error.message());
        }
        user_data_directory_.clear();
    }

    std::lock_guard<std::mutex> lock(driver_mutex_);
    unclaimed_target_ids_.clear();
}

} // namespace cdp_driver
