#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "switch_tab". Makes the tab at a 1-based position active and
// brings its page to the front.

static StepResult handle_switch_tab(const parser::Action &action, StepContext &context) {
    if (!action.tab_position) {
        return action_registry::failed_step(nlbd::ErrorKind::Parse, "missing tab number for switch_tab");
    }
    const int position = *action.tab_position;

    session::RegistryResult switch_result = context.daemon.registry.switch_tab(position);
    if (!switch_result.success) {
        return action_registry::failed_step(switch_result.error_kind, switch_result.error_detail);
    }

    // Raising the page goes through the tab's lane like any other page call.
    session::AcquireResult acquire_result = context.daemon.registry.acquire_id(switch_result.tab_id);
    if (acquire_result.success && acquire_result.lease.wait_turn()) {
        browser_driver::DriverResult front_result = acquire_result.lease.page().bring_to_front();
        if (!front_result.success) {
            debug_log::warn("switch_tab: bring_to_front failed: " + front_result.error_detail);
        }
    }

    nlohmann::json data;
    data["id"] = switch_result.tab_id;
    for (const session::TabSnapshot &snapshot : context.daemon.registry.list_tabs()) {
        if (snapshot.id == switch_result.tab_id) {
            data = action_handlers::tab_snapshot_json(snapshot);
            break;
        }
    }
    return action_registry::ok_step("Switched to Tab " + std::to_string(position), data);
}

namespace action_switch_tab {

void register_action() {
    action_registry::register_action({
        parser::Verb::SwitchTab,
        "Make the tab at a 1-based position the active tab.",
        handle_switch_tab
    });
}

} // namespace action_switch_tab
