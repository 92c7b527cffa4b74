#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "wait_for". Polls until the selector matches or the bound expires.

static StepResult handle_wait_for(const parser::Action &action, StepContext &context) {
    const std::string selector = action.target.value_or("");
    int timeout_milliseconds = action.timeout_ms.value_or(context.daemon.config.wait_timeout_milliseconds);
    debug_log::log("wait_for invoked selector=" + selector + " timeout_ms=" +
                   std::to_string(timeout_milliseconds));

    browser_driver::DriverResult wait_result = context.lease->page().wait_for(selector, timeout_milliseconds);
    if (!wait_result.success) {
        return action_registry::driver_failure(wait_result.timed_out, "wait for " + selector,
                                               wait_result.error_detail);
    }
    return action_registry::ok_step("Waited for " + selector);
}

namespace action_wait_for {

void register_action() {
    action_registry::register_action({
        parser::Verb::WaitFor,
        "Wait until an element matching a CSS selector exists.",
        handle_wait_for
    });
}

} // namespace action_wait_for
