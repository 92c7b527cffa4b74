#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "get_title".

static StepResult handle_get_title(const parser::Action &action, StepContext &context) {
    (void)action;

    browser_driver::PageLocation location = context.lease->page().get_location();
    if (!location.success) {
        return action_registry::driver_failure(false, "get title", location.error_detail);
    }

    json data;
    data["title"] = location.title;
    data["url"] = location.url;
    return action_registry::ok_step("Page title: " + location.title, data);
}

namespace action_get_title {

void register_action() {
    action_registry::register_action({
        parser::Verb::GetTitle,
        "Return the title of the page in the tab.",
        handle_get_title
    });
}

} // namespace action_get_title
