#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "close_browser". Only flags the shutdown; the daemon closes tabs
// and the browser after this response has been written.

static StepResult handle_close_browser(const parser::Action &action, StepContext &context) {
    (void)action;
    debug_log::info("close_browser requested; shutting down after this reply.");
    context.daemon.shutdown_requested = true;
    return action_registry::ok_step("Browser closing; daemon stopping");
}

namespace action_close_browser {

void register_action() {
    action_registry::register_action({
        parser::Verb::CloseBrowser,
        "Close the browser and stop the daemon.",
        handle_close_browser
    });
}

} // namespace action_close_browser
