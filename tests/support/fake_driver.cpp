#include "support/fake_driver.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace fake_driver {

void FakeBrowserState::record(const std::string &call) {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back(call);
}

std::vector<std::string> FakeBrowserState::recorded_calls() {
    std::lock_guard<std::mutex> lock(mutex);
    return calls;
}

size_t FakeBrowserState::count_calls(const std::string &operation) {
    std::lock_guard<std::mutex> lock(mutex);
    size_t count = 0;
    for (const auto &call : calls) {
        size_t first_space = call.find(' ');
        if (first_space == std::string::npos) {
            continue;
        }
        size_t second_space = call.find(' ', first_space + 1);
        if (call.compare(first_space + 1, second_space - first_space - 1, operation) == 0) {
            ++count;
        }
    }
    return count;
}

// --- FakePage ---

FakePage::FakePage(std::shared_ptr<FakeBrowserState> state, std::string page_id, std::string url)
    : state_(std::move(state)), page_id_(std::move(page_id)), url_(std::move(url)) {}

std::string FakePage::begin_call(const std::string &operation, const std::string &argument, bool &timed_out) {
    int running = ++in_flight_;
    int seen = state_->max_page_overlap.load();
    while (running > seen && !state_->max_page_overlap.compare_exchange_weak(seen, running)) {
    }

    state_->record(page_id_ + " " + operation + " " + argument);

    int delay = 0;
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        delay = state_->operation_delay_milliseconds;
        timed_out = state_->timeouts.count(operation) != 0;
        auto found = state_->failures.find(operation);
        if (found != state_->failures.end()) {
            failure = found->second;
        } else if (timed_out) {
            failure = "timed out after " + std::to_string(delay) + " ms";
        }
    }
    if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    return failure;
}

void FakePage::end_call() {
    --in_flight_;
}

browser_driver::NavigateResult FakePage::navigate(const std::string &url, int timeout_milliseconds) {
    (void)timeout_milliseconds;
    browser_driver::NavigateResult result;
    std::string failure = begin_call("navigate", url, result.timed_out);
    if (failure.empty()) {
        std::lock_guard<std::mutex> lock(page_mutex_);
        url_ = url;
        title_ = "Title of " + url;
        result.success = true;
        result.frame_id = page_id_;
    } else {
        result.error_text = failure;
    }
    end_call();
    return result;
}

browser_driver::DriverResult FakePage::click(const std::string &selector) {
    browser_driver::DriverResult result;
    std::string failure = begin_call("click", selector, result.timed_out);
    result.success = failure.empty();
    result.error_detail = failure;
    end_call();
    return result;
}

browser_driver::DriverResult FakePage::fill(const std::string &selector, const std::string &text) {
    browser_driver::DriverResult result;
    std::string failure = begin_call("fill", selector + "=" + text, result.timed_out);
    if (failure.empty()) {
        std::lock_guard<std::mutex> lock(page_mutex_);
        field_values_[selector] = text;
        result.success = true;
    } else {
        result.error_detail = failure;
    }
    end_call();
    return result;
}

browser_driver::TextResult FakePage::get_text(const std::string &selector) {
    browser_driver::TextResult result;
    std::string failure = begin_call("get_text", selector, result.timed_out);
    if (failure.empty()) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto found = state_->element_text.find(selector);
        if (found == state_->element_text.end()) {
            result.error_detail = "no element matches selector " + selector;
        } else {
            result.success = true;
            result.text = found->second;
        }
    } else {
        result.error_detail = failure;
    }
    end_call();
    return result;
}

browser_driver::DriverResult FakePage::wait_for(const std::string &selector, int timeout_milliseconds) {
    browser_driver::DriverResult result;
    std::string failure = begin_call("wait_for", selector + " " + std::to_string(timeout_milliseconds),
                                     result.timed_out);
    result.success = failure.empty();
    result.error_detail = failure;
    end_call();
    return result;
}

browser_driver::CaptureScreenshotResult FakePage::screenshot(const std::string &path, bool full_page) {
    browser_driver::CaptureScreenshotResult result;
    std::string failure = begin_call("screenshot", path + (full_page ? " full" : ""), result.timed_out);
    if (failure.empty()) {
        result.success = true;
        result.file_path = path;
        result.byte_count = 68;
    } else {
        result.error_detail = failure;
    }
    end_call();
    return result;
}

browser_driver::EvaluateJavaScriptResult FakePage::execute_script(const std::string &code) {
    browser_driver::EvaluateJavaScriptResult result;
    std::string failure = begin_call("execute_script", code, result.timed_out);
    if (failure.empty()) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        result.success = true;
        result.value = state_->script_value;
    } else {
        result.error_detail = failure;
    }
    end_call();
    return result;
}

browser_driver::PageContentResult FakePage::get_content() {
    browser_driver::PageContentResult result;
    std::string failure = begin_call("get_content", "", result.timed_out);
    if (failure.empty()) {
        std::lock_guard<std::mutex> lock(page_mutex_);
        result.success = true;
        result.title = title_;
        result.url = url_;
        result.text = "Example body text";
        result.links.push_back({"More information", "https://www.iana.org/domains/example"});
    } else {
        result.error_detail = failure;
    }
    end_call();
    return result;
}

browser_driver::DriverResult FakePage::scroll(const browser_driver::ScrollScope &scroll_scope) {
    browser_driver::DriverResult result;
    std::string argument;
    switch (scroll_scope.type) {
    case browser_driver::ScrollScopeType::Top: argument = "top"; break;
    case browser_driver::ScrollScopeType::Bottom: argument = "bottom"; break;
    case browser_driver::ScrollScopeType::By:
        argument = std::to_string(scroll_scope.delta_x) + "," + std::to_string(scroll_scope.delta_y);
        break;
    }
    std::string failure = begin_call("scroll", argument, result.timed_out);
    result.success = failure.empty();
    result.error_detail = failure;
    end_call();
    return result;
}

// Not recorded: the dispatcher calls it after every page step.
browser_driver::PageLocation FakePage::get_location() {
    browser_driver::PageLocation location;
    std::lock_guard<std::mutex> lock(page_mutex_);
    location.success = true;
    location.title = title_;
    location.url = url_;
    return location;
}

browser_driver::DriverResult FakePage::bring_to_front() {
    browser_driver::DriverResult result;
    std::string failure = begin_call("bring_to_front", "", result.timed_out);
    result.success = failure.empty();
    result.error_detail = failure;
    end_call();
    return result;
}

browser_driver::DriverResult FakePage::close() {
    browser_driver::DriverResult result;
    state_->record(page_id_ + " close ");
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->fail_page_close) {
        result.error_detail = "target already gone";
        return result;
    }
    result.success = true;
    return result;
}

// --- FakeDriver ---

FakeDriver::FakeDriver(std::shared_ptr<FakeBrowserState> state) : state_(std::move(state)) {}

browser_driver::DriverResult FakeDriver::open_browser(const browser_driver::OpenBrowserOptions &options) {
    (void)options;
    browser_driver::DriverResult result;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->open_browser_count;
    if (state_->fail_open_browser) {
        result.error_detail = "no Chrome executable";
        return result;
    }
    state_->browser_open = true;
    result.success = true;
    return result;
}

browser_driver::OpenPageResult FakeDriver::open_page(const std::string &url) {
    browser_driver::OpenPageResult result;
    std::string page_id;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->fail_open_page || !state_->browser_open) {
            result.error_detail = state_->browser_open ? "Target.createTarget failed" : "browser not open";
            return result;
        }
        page_id = "page-" + std::to_string(state_->next_page_number++);
    }
    state_->record(page_id + " open " + url);
    result.page.reset(new FakePage(state_, page_id, url.empty() ? "about:blank" : url));
    result.success = true;
    return result;
}

void FakeDriver::close_browser() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->close_browser_count;
    state_->browser_open = false;
}

bool FakeDriver::is_open() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->browser_open;
}

} // namespace fake_driver
