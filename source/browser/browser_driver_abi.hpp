#ifndef NLBD_BROWSER_DRIVER_ABI_HPP
#define NLBD_BROWSER_DRIVER_ABI_HPP

// Browser driver abstraction interface.
// The CDP driver (Chrome) implements these classes; tests substitute a fake.
// This keeps the dispatcher and the tab registry decoupled from any
// particular browser protocol.
//
// A PageHandle is one page (tab) inside the browser. Handles are not assumed
// reentrant: callers serialize all calls on the same handle.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace browser_driver {

// Settings used when launching the browser.
struct OpenBrowserOptions {
    bool headless = false;
    bool disable_translate = true;
    std::string chrome_path;          // empty: search well-known locations
    int command_timeout_milliseconds = 10000;
};

// Result of a browser driver operation.
// timed_out distinguishes an expired bounded wait from an outright failure.
struct DriverResult {
    bool success = false;
    bool timed_out = false;
    std::string message;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    bool timed_out = false;
    std::string frame_id;
    std::string error_text; // CDP errorText if navigation failed
};

// Result of capturing a screenshot to a file.
struct CaptureScreenshotResult {
    bool success = false;
    bool timed_out = false;
    std::string file_path;
    size_t byte_count = 0;
    std::string error_detail;
};

// Result of evaluating JavaScript in the page. value is the returned value.
struct EvaluateJavaScriptResult {
    bool success = false;
    bool timed_out = false;
    nlohmann::json value;
    std::string error_detail;
};

// Result of reading an element's text.
struct TextResult {
    bool success = false;
    bool timed_out = false;
    std::string text;
    std::string error_detail;
};

struct PageLink {
    std::string text;
    std::string href;
};

struct PageImage {
    std::string src;
    std::string alt;
};

// Readable content of the current page (text capped, first links and images).
struct PageContentResult {
    bool success = false;
    bool timed_out = false;
    std::string title;
    std::string url;
    std::string text;
    std::vector<PageLink> links;
    std::vector<PageImage> images;
    std::string error_detail;
};

static constexpr size_t kContentTextMax = 5000;
static constexpr size_t kContentLinksMax = 20;
static constexpr size_t kContentImagesMax = 10;

// Title and URL of the page as the browser currently reports them.
struct PageLocation {
    bool success = false;
    std::string title;
    std::string url;
    std::string error_detail;
};

enum class ScrollScopeType {
    By,      // relative, delta_x / delta_y in pixels
    Top,
    Bottom
};

struct ScrollScope {
    ScrollScopeType type = ScrollScopeType::By;
    int delta_x = 0;
    int delta_y = 0;
};

class PageHandle {
public:
    virtual ~PageHandle() = default;

    // Driver-specific identifier (CDP target id).
    virtual std::string page_id() const = 0;

    // Navigate and wait (bounded) for the document to finish loading.
    virtual NavigateResult navigate(const std::string &url, int timeout_milliseconds) = 0;

    virtual DriverResult click(const std::string &selector) = 0;

    // Replace the field's value with text.
    virtual DriverResult fill(const std::string &selector, const std::string &text) = 0;

    virtual TextResult get_text(const std::string &selector) = 0;

    // Poll until the selector matches an element or the timeout expires.
    virtual DriverResult wait_for(const std::string &selector, int timeout_milliseconds) = 0;

    // Capture the page as PNG and write it to path.
    virtual CaptureScreenshotResult screenshot(const std::string &path, bool full_page) = 0;

    virtual EvaluateJavaScriptResult execute_script(const std::string &code) = 0;

    virtual PageContentResult get_content() = 0;

    virtual DriverResult scroll(const ScrollScope &scroll_scope) = 0;

    virtual PageLocation get_location() = 0;

    // Make this page the visible one in the browser window.
    virtual DriverResult bring_to_front() = 0;

    // Close the page. The handle must not be used afterwards.
    virtual DriverResult close() = 0;
};

// Result of creating a page.
struct OpenPageResult {
    bool success = false;
    bool timed_out = false;
    std::unique_ptr<PageHandle> page;
    std::string error_detail;
};

class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    // Launch (or attach to) the browser.
    virtual DriverResult open_browser(const OpenBrowserOptions &options) = 0;

    // Create a new page showing url (about:blank when empty).
    virtual OpenPageResult open_page(const std::string &url) = 0;

    // Disconnect and terminate the browser if we launched it.
    virtual void close_browser() = 0;

    virtual bool is_open() const = 0;
};

} // namespace browser_driver

#endif // NLBD_BROWSER_DRIVER_ABI_HPP
