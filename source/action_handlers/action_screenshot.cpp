#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "screenshot". Writes a PNG; relative names resolve against the
// client's working directory.

static StepResult handle_screenshot(const parser::Action &action, StepContext &context) {
    std::string path = action_dispatcher::resolve_screenshot_path(
        action.target.value_or(""), context.cwd, context.daemon.config.screenshot_directory);
    debug_log::log("screenshot invoked path=" + path + (action.full_page ? " (full page)" : ""));

    browser_driver::CaptureScreenshotResult capture_result =
        context.lease->page().screenshot(path, action.full_page);
    if (!capture_result.success) {
        return action_registry::driver_failure(capture_result.timed_out, "screenshot",
                                               capture_result.error_detail);
    }

    json data;
    data["path"] = capture_result.file_path;
    data["bytes"] = capture_result.byte_count;
    data["full_page"] = action.full_page;
    return action_registry::ok_step("Screenshot saved as " + capture_result.file_path, data);
}

namespace action_screenshot {

void register_action() {
    action_registry::register_action({
        parser::Verb::Screenshot,
        "Capture the tab (optionally the full page) as a PNG file.",
        handle_screenshot
    });
}

} // namespace action_screenshot
