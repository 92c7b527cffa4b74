// Tests for the action dispatcher and handlers, run against the fake driver:
// single actions, compound instructions with partial failure, tab targeting
// and error-kind mapping.

#include "action_handlers/action_handlers.hpp"
#include "config/daemon_config.hpp"
#include "daemon/daemon_context.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "parser/command_parser.hpp"
#include "support/fake_driver.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace test_action_dispatcher {

using json = nlohmann::json;

static bool report(bool success, const std::string &description, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << (detail.empty() ? "" : " (" + detail + ")") << std::endl;
    }
    return success;
}

struct DispatchFixture {
    std::shared_ptr<fake_driver::FakeBrowserState> state = std::make_shared<fake_driver::FakeBrowserState>();
    fake_driver::FakeDriver driver{state};
    session::TabRegistry registry{driver};
    daemon_config::DaemonConfig config = daemon_config::default_config();
    nlbd::DaemonContext context{driver, registry, config};

    DispatchFixture() {
        action_handlers::register_all_handlers();
        config.screenshot_directory = "/tmp/nlbd-shots";
        browser_driver::DriverResult open_result = driver.open_browser({});
        (void)open_result;
    }

    // Parse and dispatch like the request handler does.
    envelope::Response run(const std::string &text, const std::string &cwd = "") {
        parser::ParseResult parse_result = parser::parse(text);
        if (!parse_result.success) {
            envelope::Response response;
            response.message = "parse failed: " + parse_result.error_detail;
            response.error_kind = nlbd::ErrorKind::Parse;
            return response;
        }
        return action_dispatcher::dispatch(parse_result.actions, context, cwd);
    }
};

static std::string describe(const envelope::Response &response) {
    return std::string(response.ok ? "ok" : "error") + " [" + nlbd::error_kind_name(response.error_kind) +
           "] " + response.message;
}

static bool test_page_action_without_tabs() {
    DispatchFixture fixture;
    envelope::Response response = fixture.run("go to example.com");
    bool success = !response.ok && response.error_kind == nlbd::ErrorKind::Registry &&
                   response.message == "no active tab" && fixture.state->count_calls("navigate") == 0;
    return report(success, "page action with no open tab is a registry error", describe(response));
}

static bool test_navigate_updates_registry() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("go to example.com");

    std::optional<session::TabSnapshot> active = fixture.registry.active_tab();
    bool success = response.ok && response.message == "Navigated to https://example.com" &&
                   active && active->url == "https://example.com" &&
                   active->title == "Title of https://example.com" &&
                   response.data["title"] == "Title of https://example.com";
    return report(success, "navigate adds a scheme and refreshes the tab's title and url", describe(response));
}

static bool test_open_tab_message() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("open a new tab with example.org");
    bool success = response.ok && response.message == "New tab opened (Tab 2)" &&
                   response.data["url"] == "https://example.org" && fixture.registry.size() == 2;
    return report(success, "open_tab reports the new tab's position", describe(response));
}

static bool test_compound_success() {
    DispatchFixture fixture;
    envelope::Response response = fixture.run("open a new tab and go to example.com then get the title");
    bool success = response.ok && response.data.contains("steps") && response.data["steps"].size() == 3;
    if (success) {
        for (const auto &step : response.data["steps"]) {
            success = success && step["status"] == "ok";
        }
        success = success && response.data["steps"][1]["verb"] == "navigate" &&
                  response.data["steps"][2]["data"]["title"] == "Title of https://example.com";
    }
    return report(success, "compound instruction reports every step", describe(response));
}

static bool test_compound_stops_at_first_failure() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.state->failures["click"] = "no element matches selector #missing";

    envelope::Response response = fixture.run("go to example.com and click #missing and take a screenshot");
    bool success = !response.ok && response.error_kind == nlbd::ErrorKind::Driver &&
                   response.message == "step 2 of 3 (click) failed: click #missing failed: "
                                       "no element matches selector #missing; 1 succeeded, 1 skipped";
    const json &steps = response.data["steps"];
    success = success && steps.size() == 3 && steps[0]["status"] == "ok" && steps[1]["status"] == "error" &&
              steps[1]["error_kind"] == "driver" && steps[2]["status"] == "skipped";
    // The navigation before the failure is kept; nothing runs after it.
    success = success && fixture.state->count_calls("navigate") == 1 &&
              fixture.state->count_calls("screenshot") == 0;
    return report(success, "compound stops at the failing step and skips the rest", describe(response));
}

static bool test_open_then_failed_navigation_keeps_tab() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.state->failures["navigate"] = "net::ERR_NAME_NOT_RESOLVED";

    envelope::Response response = fixture.run("open a new tab and go to example.invalid");
    std::optional<session::TabSnapshot> active = fixture.registry.active_tab();
    bool success = !response.ok && response.error_kind == nlbd::ErrorKind::Driver &&
                   response.data["steps"][0]["status"] == "ok" && response.data["steps"][1]["status"] == "error" &&
                   fixture.registry.size() == 2 && active && active->index == 2 &&
                   response.message.find("0 skipped") != std::string::npos;
    return report(success, "failed navigation after open_tab keeps the new tab active", describe(response));
}

static bool test_timeout_error_kind() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.state->timeouts.insert("wait_for");
    envelope::Response response = fixture.run("wait for #never for 50 ms");
    bool success = !response.ok && response.error_kind == nlbd::ErrorKind::Timeout &&
                   fixture.state->count_calls("wait_for") == 1;
    std::vector<std::string> calls = fixture.state->recorded_calls();
    success = success && !calls.empty() && calls.back() == "page-1 wait_for #never 50";
    return report(success, "expired wait maps to a timeout error with the requested bound", describe(response));
}

static bool test_close_browser_stops_compound() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("close the browser and go to example.com");
    const json &steps = response.data["steps"];
    bool success = response.ok && fixture.context.shutdown_requested.load() && steps.size() == 2 &&
                   steps[1]["status"] == "skipped" && fixture.state->count_calls("navigate") == 0;
    return report(success, "nothing runs after close_browser", describe(response));
}

static bool test_explicit_tab_position() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("click #buy in tab 1");
    std::vector<std::string> calls = fixture.state->recorded_calls();
    bool success = response.ok && !calls.empty() && calls.back() == "page-1 click #buy" &&
                   fixture.registry.active_tab()->index == 2;
    return report(success, "\"in tab N\" targets that tab without switching", describe(response));
}

static bool test_switch_tab_brings_page_to_front() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("switch to tab 1");
    bool success = response.ok && response.message == "Switched to Tab 1" &&
                   fixture.registry.active_tab()->index == 1 && fixture.state->count_calls("bring_to_front") == 1;
    bool all_passed = report(success, "switch_tab activates and raises the tab", describe(response));

    response = fixture.run("switch to tab 9");
    all_passed &= report(!response.ok && response.error_kind == nlbd::ErrorKind::Registry &&
                             response.message == "tab not found: 9 (2 tabs open)",
                         "switch to a missing tab", describe(response));
    return all_passed;
}

// Another client keeps switching back to tab 1 while "open a new tab and go
// to X" runs; the navigation must still land on the tab the first step opened.
static bool test_compound_stays_on_opened_tab() {
    DispatchFixture fixture;
    fixture.run("open a new tab");

    std::atomic<bool> stop{false};
    std::thread switcher([&fixture, &stop] {
        while (!stop.load()) {
            fixture.run("switch to tab 1");
        }
    });

    int misdirected = 0;
    const int rounds = 100;
    for (int round = 0; round < rounds; ++round) {
        std::string site = "site" + std::to_string(round) + ".com";
        envelope::Response response = fixture.run("open a new tab and go to " + site);
        if (!response.ok) {
            ++misdirected;
            continue;
        }
        int opened_id = response.data["steps"][0]["data"]["id"].get<int>();
        bool landed = false;
        for (const session::TabSnapshot &snapshot : fixture.registry.list_tabs()) {
            if (snapshot.id == opened_id) {
                landed = snapshot.url == "https://" + site;
            }
        }
        if (!landed) {
            ++misdirected;
        }
    }
    stop = true;
    switcher.join();

    std::vector<session::TabSnapshot> tabs = fixture.registry.list_tabs();
    bool success = misdirected == 0 && tabs.size() == static_cast<size_t>(rounds) + 1 &&
                   tabs.front().url == "about:blank";
    return report(success, "compound page step follows the tab opened earlier in it",
                  std::to_string(misdirected) + " of " + std::to_string(rounds) + " misdirected");
}

static bool test_switch_then_action_in_compound() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("switch to tab 1 and click #go");
    std::vector<std::string> calls = fixture.state->recorded_calls();
    bool success = response.ok && response.data["steps"][0]["data"]["id"] == 1 &&
                   response.data["steps"][0]["data"]["active"] == true && calls.size() >= 2 &&
                   calls[calls.size() - 2] == "page-1 bring_to_front " && calls.back() == "page-1 click #go";
    return report(success, "switch_tab raises the switched tab and later steps run on it", describe(response));
}

// A held turn on one tab must not hold up work on another.
static bool test_distinct_tabs_do_not_block() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.run("open a new tab");

    session::AcquireResult held = fixture.registry.acquire(1);
    bool all_passed = report(held.success && held.lease.wait_turn(), "lease on tab 1 is held");

    envelope::Response response = fixture.run("click #other in tab 2");
    std::vector<std::string> calls = fixture.state->recorded_calls();
    all_passed &= report(response.ok && calls.back() == "page-2 click #other",
                         "tab 2 action completes while tab 1 is leased", describe(response));

    std::atomic<bool> finished{false};
    std::thread blocked([&fixture, &finished] {
        fixture.run("click #first in tab 1");
        finished = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    all_passed &= report(!finished.load(), "tab 1 action waits for the held lease");
    held.lease.release();
    blocked.join();
    all_passed &= report(finished.load() && fixture.state->recorded_calls().back() == "page-1 click #first",
                         "tab 1 action runs once the lease is released");
    return all_passed;
}

static bool test_list_and_close_tabs() {
    DispatchFixture fixture;
    fixture.run("open a new tab with example.com");
    fixture.run("open a new tab");
    envelope::Response response = fixture.run("list tabs");
    bool all_passed = report(response.ok && response.data["tabs"].size() == 2 && response.data["current_tab"] == 2 &&
                                 response.message.find("Found 2 tab(s)") == 0,
                             "list_tabs returns every tab and the active index", describe(response));

    response = fixture.run("close tab 2");
    all_passed &= report(response.ok && response.data["remaining"] == 1 && response.data["active"]["index"] == 1,
                         "closing the active last tab activates the preceding one", describe(response));
    return all_passed;
}

static bool test_read_actions() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    fixture.state->element_text["h1"] = "Example Domain";
    fixture.state->script_value = 42;
    bool all_passed = true;

    envelope::Response response = fixture.run("get text of h1");
    all_passed &= report(response.ok && response.message == "Example Domain" && response.data["text"] == "Example Domain",
                         "get_text returns the element text", describe(response));

    response = fixture.run("run js return 6 * 7");
    all_passed &= report(response.ok && response.message == "JavaScript executed: 42" && response.data["result"] == 42,
                         "execute_script returns the script value", describe(response));

    response = fixture.run("get the page content");
    all_passed &= report(response.ok && response.data["links"].size() == 1 &&
                             response.data["text"] == "Example body text",
                         "get_content returns text and links", describe(response));

    response = fixture.run("scroll down");
    std::vector<std::string> calls = fixture.state->recorded_calls();
    all_passed &= report(response.ok && calls.back() == "page-1 scroll 0,500", "scroll defaults to 500px down",
                         describe(response));
    return all_passed;
}

static bool test_screenshot_paths() {
    DispatchFixture fixture;
    fixture.run("open a new tab");
    bool all_passed = true;

    envelope::Response response = fixture.run("take a screenshot as shot.png", "/home/user/work");
    all_passed &= report(response.ok && response.data["path"] == "/home/user/work/shot.png",
                         "relative screenshot name resolves against the client cwd", describe(response));

    response = fixture.run("screenshot");
    all_passed &= report(response.ok && response.data["path"] == "/tmp/nlbd-shots/screenshot.png",
                         "default screenshot lands in the screenshot directory", describe(response));

    all_passed &= report(action_dispatcher::resolve_screenshot_path("/var/tmp/a.png", "/home", "/tmp") ==
                             "/var/tmp/a.png",
                         "absolute screenshot path is kept");
    return all_passed;
}

static bool test_normalize_url() {
    bool all_passed = true;
    all_passed &= report(action_dispatcher::normalize_url("example.com") == "https://example.com",
                         "scheme-less url gets https://");
    all_passed &= report(action_dispatcher::normalize_url("http://localhost:8080") == "http://localhost:8080",
                         "url with a scheme is kept");
    all_passed &= report(action_dispatcher::normalize_url("about:blank") == "about:blank", "about: url is kept");
    all_passed &= report(action_dispatcher::normalize_url("data:text/html,<p>x</p>") == "data:text/html,<p>x</p>",
                         "data: url is kept");
    return all_passed;
}

static bool test_action_summary_lists_every_verb() {
    std::string summary = action_handlers::action_summary();
    const char *verbs[] = {"navigate", "click", "fill", "get_text", "wait_for", "screenshot",
                           "execute_script", "get_content", "get_title", "scroll", "open_tab",
                           "switch_tab", "close_tab", "list_tabs", "current_tab", "close_browser"};
    std::string missing;
    for (const char *verb : verbs) {
        if (summary.find(std::string("  ") + verb + " ") == std::string::npos) {
            missing += std::string(missing.empty() ? "" : ", ") + verb;
        }
    }
    bool success = missing.empty() &&
                   summary.find("Make the tab at a 1-based position the active tab.") != std::string::npos;
    return report(success, "action summary lists every verb with its description", missing);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_page_action_without_tabs();
    all_passed &= test_navigate_updates_registry();
    all_passed &= test_open_tab_message();
    all_passed &= test_compound_success();
    all_passed &= test_compound_stops_at_first_failure();
    all_passed &= test_open_then_failed_navigation_keeps_tab();
    all_passed &= test_timeout_error_kind();
    all_passed &= test_close_browser_stops_compound();
    all_passed &= test_explicit_tab_position();
    all_passed &= test_switch_tab_brings_page_to_front();
    all_passed &= test_compound_stays_on_opened_tab();
    all_passed &= test_switch_then_action_in_compound();
    all_passed &= test_distinct_tabs_do_not_block();
    all_passed &= test_list_and_close_tabs();
    all_passed &= test_read_actions();
    all_passed &= test_screenshot_paths();
    all_passed &= test_normalize_url();
    all_passed &= test_action_summary_lists_every_verb();
    return all_passed;
}

} // namespace test_action_dispatcher
