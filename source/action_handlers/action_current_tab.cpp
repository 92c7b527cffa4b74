#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "current_tab".

static StepResult handle_current_tab(const parser::Action &action, StepContext &context) {
    (void)action;

    std::optional<session::TabSnapshot> active = context.daemon.registry.active_tab();
    if (!active) {
        return action_registry::failed_step(nlbd::ErrorKind::Registry, "no active tab");
    }
    return action_registry::ok_step(
        "Current tab: [" + std::to_string(active->index) + "] " +
            (active->title.empty() ? active->url : active->title + " (" + active->url + ")"),
        action_handlers::tab_snapshot_json(*active));
}

namespace action_current_tab {

void register_action() {
    action_registry::register_action({
        parser::Verb::CurrentTab,
        "Describe the active tab.",
        handle_current_tab
    });
}

} // namespace action_current_tab
