#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "click".

static StepResult handle_click(const parser::Action &action, StepContext &context) {
    const std::string selector = action.target.value_or("");
    debug_log::log("click invoked selector=" + selector);

    browser_driver::DriverResult click_result = context.lease->page().click(selector);
    if (!click_result.success) {
        return action_registry::driver_failure(click_result.timed_out, "click " + selector,
                                               click_result.error_detail);
    }
    return action_registry::ok_step("Clicked " + selector);
}

namespace action_click {

void register_action() {
    action_registry::register_action({
        parser::Verb::Click,
        "Click the first element matching a CSS selector.",
        handle_click
    });
}

} // namespace action_click
