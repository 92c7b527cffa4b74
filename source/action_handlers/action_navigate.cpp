#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "navigate".
// Loads the URL in the target tab and waits (bounded) for the document to finish loading.

static StepResult handle_navigate(const parser::Action &action, StepContext &context) {
    std::string url = action_dispatcher::normalize_url(action.target.value_or(""));
    if (url.empty()) {
        return action_registry::failed_step(nlbd::ErrorKind::Parse, "missing url for navigate");
    }

    debug_log::log("navigate invoked url=" + url);
    browser_driver::NavigateResult navigate_result =
        context.lease->page().navigate(url, context.daemon.config.navigation_timeout_milliseconds);
    if (!navigate_result.success) {
        return action_registry::driver_failure(navigate_result.timed_out, "navigate to " + url,
                                               navigate_result.error_text);
    }

    json data;
    data["url"] = url;
    browser_driver::PageLocation location = context.lease->page().get_location();
    if (location.success) {
        data["url"] = location.url;
        data["title"] = location.title;
    }
    return action_registry::ok_step("Navigated to " + url, data);
}

namespace action_navigate {

void register_action() {
    action_registry::register_action({
        parser::Verb::Navigate,
        "Load a URL in the target tab (https:// is added when no scheme is given).",
        handle_navigate
    });
}

} // namespace action_navigate
