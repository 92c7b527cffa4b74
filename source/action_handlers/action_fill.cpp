#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "fill". Replaces the field's value with the given text.

static StepResult handle_fill(const parser::Action &action, StepContext &context) {
    const std::string selector = action.target.value_or("");
    const std::string text = action.payload.value_or("");
    debug_log::log("fill invoked selector=" + selector);

    browser_driver::DriverResult fill_result = context.lease->page().fill(selector, text);
    if (!fill_result.success) {
        return action_registry::driver_failure(fill_result.timed_out, "fill " + selector,
                                               fill_result.error_detail);
    }
    return action_registry::ok_step("Filled " + selector + " with '" + text + "'");
}

namespace action_fill {

void register_action() {
    action_registry::register_action({
        parser::Verb::Fill,
        "Type text into a form field, replacing its current value.",
        handle_fill
    });
}

} // namespace action_fill
