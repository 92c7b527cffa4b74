#include "browser/cdp/cdp_driver.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace cdp_driver {

static const int kPollIntervalMilliseconds = 100;

// Script used by get_content(). Returns a JSON string so the whole object
// comes back in a single returnByValue round trip.
static std::string build_content_script() {
    return "JSON.stringify({"
           "title: document.title || '',"
           "url: location.href,"
           "text: (document.body ? document.body.innerText : '').slice(0, " +
           std::to_string(browser_driver::kContentTextMax) + "),"
           "links: Array.from(document.querySelectorAll('a[href]')).slice(0, " +
           std::to_string(browser_driver::kContentLinksMax) + ")"
           ".map(function(a){ return {text: (a.innerText || '').trim(), href: a.href}; }),"
           "images: Array.from(document.querySelectorAll('img[src]')).slice(0, " +
           std::to_string(browser_driver::kContentImagesMax) + ")"
           ".map(function(i){ return {src: i.src, alt: i.alt || ''}; })"
           "})";
}

static bool starts_with_return(const std::string &code) {
    size_t first = code.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }
    if (code.compare(first, 6, "return") != 0) {
        return false;
    }
    size_t after = first + 6;
    return after == code.size() || code[after] == ' ' || code[after] == ';' ||
           code[after] == '(' || code[after] == '\n' || code[after] == '\t';
}

CdpPage::CdpPage(CdpConnection &connection, std::string target_id, std::string session_id,
                 int command_timeout_milliseconds)
    : connection_(connection),
      target_id_(std::move(target_id)),
      session_id_(std::move(session_id)),
      command_timeout_milliseconds_(command_timeout_milliseconds) {}

json CdpPage::page_command(const std::string &method, const json &params) {
    return connection_.send_command(method, params, session_id_, command_timeout_milliseconds_);
}

browser_driver::EvaluateJavaScriptResult CdpPage::evaluate(const std::string &expression,
                                                           int timeout_milliseconds) {
    browser_driver::EvaluateJavaScriptResult result;

    json eval_params;
    eval_params["expression"] = expression;
    eval_params["returnByValue"] = true;
    eval_params["awaitPromise"] = true;
    json eval_response = connection_.send_command("Runtime.evaluate", eval_params, session_id_,
                                                  timeout_milliseconds);

    bool timed_out = false;
    if (response_failed(eval_response, result.error_detail, timed_out)) {
        result.timed_out = timed_out;
        return result;
    }
    if (!eval_response.contains("result")) {
        result.error_detail = "Runtime.evaluate did not return a result.";
        return result;
    }

    const json &eval_result = eval_response["result"];
    if (eval_result.contains("exceptionDetails")) {
        const json &details = eval_result["exceptionDetails"];
        if (details.contains("exception") && details["exception"].contains("description") &&
            details["exception"]["description"].is_string()) {
            result.error_detail = details["exception"]["description"].get<std::string>();
        } else {
            result.error_detail = details.value("text", "JavaScript exception");
        }
        return result;
    }

    if (eval_result.contains("result") && eval_result["result"].contains("value")) {
        result.value = eval_result["result"]["value"];
    }
    result.success = true;
    return result;
}

browser_driver::NavigateResult CdpPage::begin_navigation(const std::string &url, bool *loader_started) {
    browser_driver::NavigateResult result;
    if (loader_started != nullptr) {
        *loader_started = false;
    }

    json navigate_params;
    navigate_params["url"] = url;
    json navigate_response = page_command("Page.navigate", navigate_params);

    std::string error_detail;
    bool timed_out = false;
    if (response_failed(navigate_response, error_detail, timed_out)) {
        result.timed_out = timed_out;
        result.error_text = error_detail;
        return result;
    }

    if (navigate_response.contains("result")) {
        const auto &nav_result = navigate_response["result"];
        if (nav_result.contains("frameId") && nav_result["frameId"].is_string()) {
            result.frame_id = nav_result["frameId"].get<std::string>();
        }
        if (nav_result.contains("errorText") && nav_result["errorText"].is_string()) {
            result.error_text = nav_result["errorText"].get<std::string>();
            return result;
        }
        if (loader_started != nullptr && nav_result.contains("loaderId")) {
            *loader_started = true;
        }
    }

    result.success = true;
    return result;
}

browser_driver::NavigateResult CdpPage::navigate(const std::string &url, int timeout_milliseconds) {
    browser_driver::NavigateResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    // A marker on the old window tells us when the new document has replaced it.
    std::string marker = "nlbd_nav_" + std::to_string(++navigation_counter_);
    browser_driver::EvaluateJavaScriptResult mark_result =
        evaluate("window.__nlbd_nav_marker = " + json(marker).dump() + "; true", command_timeout_milliseconds_);
    if (!mark_result.success) {
        debug_log::log("navigate: could not set marker: " + mark_result.error_detail);
    }

    bool loader_started = false;
    result = begin_navigation(url, &loader_started);
    if (!result.success) {
        return result;
    }

    // Same-document navigations (fragments) have no loader; the old window stays.
    std::string ready_script = loader_started
        ? "window.__nlbd_nav_marker !== " + json(marker).dump() + " && document.readyState === 'complete'"
        : "document.readyState === 'complete'";

    while (std::chrono::steady_clock::now() < deadline) {
        browser_driver::EvaluateJavaScriptResult ready_result =
            evaluate(ready_script, command_timeout_milliseconds_);
        if (ready_result.success && ready_result.value.is_boolean() && ready_result.value.get<bool>()) {
            debug_log::log("navigate: " + url + " loaded.");
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMilliseconds));
    }

    result.success = false;
    result.timed_out = true;
    result.error_text = "Timed out after " + std::to_string(timeout_milliseconds) +
                        " ms waiting for " + url + " to load.";
    return result;
}

browser_driver::DriverResult CdpPage::click(const std::string &selector) {
    browser_driver::DriverResult result;
    bool timed_out = false;

    json dom_enable_response = page_command("DOM.enable", json::object());
    if (response_failed(dom_enable_response, result.error_detail, timed_out)) {
        debug_log::log("click: DOM.enable returned: " + result.error_detail);
        result.error_detail.clear();
    }

    json get_doc_response = page_command("DOM.getDocument", json::object());
    if (!get_doc_response.contains("result") || !get_doc_response["result"].contains("root")) {
        response_failed(get_doc_response, result.error_detail, timed_out);
        result.timed_out = timed_out;
        result.error_detail = "DOM.getDocument failed: " + result.error_detail;
        return result;
    }
    int root_node_id = get_doc_response["result"]["root"]["nodeId"].get<int>();

    json query_params;
    query_params["nodeId"] = root_node_id;
    query_params["selector"] = selector;
    json query_response = page_command("DOM.querySelector", query_params);

    int node_id = 0;
    if (query_response.contains("result") && query_response["result"].contains("nodeId")) {
        node_id = query_response["result"]["nodeId"].get<int>();
    }

    json box_response;
    if (node_id != 0) {
        json box_params;
        box_params["nodeId"] = node_id;
        box_response = page_command("DOM.getBoxModel", box_params);
    }

    if (node_id == 0 || !box_response.contains("result") || !box_response["result"].contains("model") ||
        !box_response["result"]["model"].contains("content")) {
        // No layout box (hidden, or querySelector failed over CDP): click from script.
        std::string click_script = "(function(){ var el=document.querySelector(" + json(selector).dump() + ");"
            "if(!el) throw new Error('Element not found: ' + " + json(selector).dump() + ");"
            "el.click(); return true; })()";
        browser_driver::EvaluateJavaScriptResult eval_result = evaluate(click_script, command_timeout_milliseconds_);
        if (!eval_result.success) {
            result.timed_out = eval_result.timed_out;
            result.error_detail = "Element not found: " + selector;
            return result;
        }
        result.success = true;
        result.message = "Clicked " + selector + ".";
        return result;
    }

    const auto &content = box_response["result"]["model"]["content"];
    double left = content[0].get<double>();
    double top = content[1].get<double>();
    double right = content[4].get<double>();
    double bottom = content[5].get<double>();
    int x = static_cast<int>((left + right) / 2);
    int y = static_cast<int>((top + bottom) / 2);

    for (const char *event_type : {"mousePressed", "mouseReleased"}) {
        json mouse_event;
        mouse_event["type"] = event_type;
        mouse_event["x"] = x;
        mouse_event["y"] = y;
        mouse_event["button"] = "left";
        mouse_event["clickCount"] = 1;
        json mouse_response = page_command("Input.dispatchMouseEvent", mouse_event);
        if (response_failed(mouse_response, result.error_detail, timed_out)) {
            result.timed_out = timed_out;
            result.error_detail = "Input.dispatchMouseEvent failed: " + result.error_detail;
            return result;
        }
    }

    result.success = true;
    result.message = "Clicked " + selector + ".";
    return result;
}

browser_driver::DriverResult CdpPage::fill(const std::string &selector, const std::string &text) {
    browser_driver::DriverResult result;

    std::string escaped_selector = json(selector).dump();
    std::string focus_script = "(function(){ var el=document.querySelector(" + escaped_selector + ");"
        "if(!el){ throw new Error('Element not found: ' + " + escaped_selector + "); }"
        "el.focus();"
        "if('value' in el){ el.value=''; }"
        "el.dispatchEvent(new Event('input',{bubbles:true}));"
        "return true; })()";

    browser_driver::EvaluateJavaScriptResult focus_result = evaluate(focus_script, command_timeout_milliseconds_);
    if (!focus_result.success) {
        result.timed_out = focus_result.timed_out;
        result.error_detail = "Element not found or focus failed: " + selector;
        return result;
    }

    json insert_params;
    insert_params["text"] = text;
    json insert_response = page_command("Input.insertText", insert_params);
    bool timed_out = false;
    if (response_failed(insert_response, result.error_detail, timed_out)) {
        result.timed_out = timed_out;
        return result;
    }

    // insertText fires input events; frameworks listening for change need one more.
    evaluate("(function(){ var el=document.querySelector(" + escaped_selector + ");"
             "if(el){ el.dispatchEvent(new Event('change',{bubbles:true})); } return true; })()",
             command_timeout_milliseconds_);

    result.success = true;
    result.message = "Filled " + selector + ".";
    return result;
}

browser_driver::TextResult CdpPage::get_text(const std::string &selector) {
    browser_driver::TextResult result;

    std::string script = "(function(){ var el=document.querySelector(" + json(selector).dump() + ");"
        "if(!el){ throw new Error('Element not found: ' + " + json(selector).dump() + "); }"
        "return (el.innerText !== undefined ? el.innerText : el.textContent) || ''; })()";
    browser_driver::EvaluateJavaScriptResult eval_result = evaluate(script, command_timeout_milliseconds_);
    if (!eval_result.success) {
        result.timed_out = eval_result.timed_out;
        result.error_detail = eval_result.error_detail;
        return result;
    }
    if (eval_result.value.is_string()) {
        result.text = eval_result.value.get<std::string>();
    }
    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::wait_for(const std::string &selector, int timeout_milliseconds) {
    browser_driver::DriverResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    std::string script = "document.querySelector(" + json(selector).dump() + ") !== null";

    while (true) {
        browser_driver::EvaluateJavaScriptResult eval_result = evaluate(script, command_timeout_milliseconds_);
        if (eval_result.success && eval_result.value.is_boolean() && eval_result.value.get<bool>()) {
            result.success = true;
            result.message = "Found " + selector + ".";
            return result;
        }
        if (!eval_result.success && !eval_result.timed_out &&
            eval_result.error_detail.find("SyntaxError") != std::string::npos) {
            result.error_detail = "Invalid selector: " + selector;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMilliseconds));
    }

    result.timed_out = true;
    result.error_detail = "Timed out after " + std::to_string(timeout_milliseconds) +
                          " ms waiting for " + selector + ".";
    return result;
}

browser_driver::CaptureScreenshotResult CdpPage::screenshot(const std::string &path, bool full_page) {
    browser_driver::CaptureScreenshotResult result;
    bool timed_out = false;

    json capture_params;
    capture_params["format"] = "png";
    if (full_page) {
        json metrics_response = page_command("Page.getLayoutMetrics", json::object());
        if (metrics_response.contains("result")) {
            const json &metrics = metrics_response["result"];
            const char *size_key = metrics.contains("cssContentSize") ? "cssContentSize" : "contentSize";
            if (metrics.contains(size_key)) {
                json clip;
                clip["x"] = 0;
                clip["y"] = 0;
                clip["width"] = metrics[size_key].value("width", 0.0);
                clip["height"] = metrics[size_key].value("height", 0.0);
                clip["scale"] = 1;
                capture_params["clip"] = clip;
                capture_params["captureBeyondViewport"] = true;
            }
        } else {
            debug_log::log("screenshot: Page.getLayoutMetrics failed; capturing viewport.");
        }
    }

    json capture_response = page_command("Page.captureScreenshot", capture_params);
    if (response_failed(capture_response, result.error_detail, timed_out)) {
        result.timed_out = timed_out;
        return result;
    }
    if (!capture_response.contains("result") || !capture_response["result"].contains("data") ||
        !capture_response["result"]["data"].is_string()) {
        result.error_detail = "Page.captureScreenshot did not return image data.";
        return result;
    }

    const std::string image_base64 = capture_response["result"]["data"].get<std::string>();
    std::vector<char> image_bytes(image_base64.size() * 3 / 4 + 4);
    int decoded_length = lws_b64_decode_string(image_base64.c_str(), image_bytes.data(),
                                               static_cast<int>(image_bytes.size()));
    if (decoded_length < 0) {
        result.error_detail = "Failed to decode screenshot data.";
        return result;
    }

    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::error_code create_error;
        std::filesystem::create_directories(file_path.parent_path(), create_error);
        if (create_error) {
            result.error_detail = "Cannot create directory " + file_path.parent_path().string() +
                                  ": " + create_error.message();
            return result;
        }
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        result.error_detail = "Cannot open " + path + " for writing.";
        return result;
    }
    output.write(image_bytes.data(), decoded_length);
    output.close();
    if (!output) {
        result.error_detail = "Failed to write " + path + ".";
        return result;
    }

    debug_log::log("screenshot: wrote " + std::to_string(decoded_length) + " bytes to " + path);
    result.success = true;
    result.file_path = path;
    result.byte_count = static_cast<size_t>(decoded_length);
    return result;
}

browser_driver::EvaluateJavaScriptResult CdpPage::execute_script(const std::string &code) {
    // A bare "return x" is only legal inside a function body.
    std::string expression = starts_with_return(code) ? "(function(){ " + code + "\n})()" : code;
    return evaluate(expression, command_timeout_milliseconds_);
}

browser_driver::PageContentResult CdpPage::get_content() {
    browser_driver::PageContentResult result;

    browser_driver::EvaluateJavaScriptResult eval_result = evaluate(build_content_script(),
                                                                    command_timeout_milliseconds_);
    if (!eval_result.success) {
        result.timed_out = eval_result.timed_out;
        result.error_detail = eval_result.error_detail;
        return result;
    }
    if (!eval_result.value.is_string()) {
        result.error_detail = "Content script did not return a JSON string.";
        return result;
    }

    try {
        json content = json::parse(eval_result.value.get<std::string>());
        result.title = content.value("title", "");
        result.url = content.value("url", "");
        result.text = content.value("text", "");
        if (content.contains("links") && content["links"].is_array()) {
            for (const auto &item : content["links"]) {
                browser_driver::PageLink link;
                link.text = item.value("text", "");
                link.href = item.value("href", "");
                result.links.push_back(link);
            }
        }
        if (content.contains("images") && content["images"].is_array()) {
            for (const auto &item : content["images"]) {
                browser_driver::PageImage image;
                image.src = item.value("src", "");
                image.alt = item.value("alt", "");
                result.images.push_back(image);
            }
        }
    } catch (const json::exception &parse_error) {
        result.error_detail = std::string("Failed to parse page content: ") + parse_error.what();
        return result;
    }

    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::scroll(const browser_driver::ScrollScope &scroll_scope) {
    browser_driver::DriverResult result;

    std::string script;
    switch (scroll_scope.type) {
    case browser_driver::ScrollScopeType::Top:
        script = "window.scrollTo(0, 0); true";
        break;
    case browser_driver::ScrollScopeType::Bottom:
        script = "window.scrollTo(0, document.documentElement.scrollHeight); true";
        break;
    case browser_driver::ScrollScopeType::By:
        script = "window.scrollBy(" + std::to_string(scroll_scope.delta_x) + "," +
                 std::to_string(scroll_scope.delta_y) + "); true";
        break;
    }

    browser_driver::EvaluateJavaScriptResult eval_result = evaluate(script, command_timeout_milliseconds_);
    if (!eval_result.success) {
        result.timed_out = eval_result.timed_out;
        result.error_detail = "scroll failed: " + eval_result.error_detail;
        return result;
    }

    result.success = true;
    result.message = "Scrolled.";
    return result;
}

browser_driver::PageLocation CdpPage::get_location() {
    browser_driver::PageLocation location;

    json info_params;
    info_params["targetId"] = target_id_;
    json info_response = connection_.send_command("Target.getTargetInfo", info_params, "",
                                                  command_timeout_milliseconds_);
    bool timed_out = false;
    if (response_failed(info_response, location.error_detail, timed_out)) {
        return location;
    }
    if (!info_response.contains("result") || !info_response["result"].contains("targetInfo")) {
        location.error_detail = "Target.getTargetInfo returned no targetInfo.";
        return location;
    }

    const json &target_info = info_response["result"]["targetInfo"];
    location.title = target_info.value("title", "");
    location.url = target_info.value("url", "");
    location.success = true;
    return location;
}

browser_driver::DriverResult CdpPage::bring_to_front() {
    browser_driver::DriverResult result;

    json activate_params;
    activate_params["targetId"] = target_id_;
    json activate_response = connection_.send_command("Target.activateTarget", activate_params, "",
                                                      command_timeout_milliseconds_);
    bool timed_out = false;
    if (response_failed(activate_response, result.error_detail, timed_out)) {
        result.timed_out = timed_out;
        return result;
    }
    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::close() {
    browser_driver::DriverResult result;
    if (closed_) {
        result.success = true;
        return result;
    }

    json close_params;
    close_params["targetId"] = target_id_;
    json close_response = connection_.send_command("Target.closeTarget", close_params, "",
                                                   command_timeout_milliseconds_);
    bool timed_out = false;
    if (response_failed(close_response, result.error_detail, timed_out)) {
        result.timed_out = timed_out;
        return result;
    }

    closed_ = true;
    debug_log::log("close: targetId=" + target_id_);
    result.success = true;
    result.message = "Tab closed.";
    return result;
}

} // namespace cdp_driver
