#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "close_tab". Closes the tab at a 1-based position, or the active tab.

static StepResult handle_close_tab(const parser::Action &action, StepContext &context) {
    session::RegistryResult close_result = action.tab_position
        ? context.daemon.registry.close_tab_at(*action.tab_position)
        : context.daemon.registry.close_tab();
    if (!close_result.success) {
        return action_registry::failed_step(close_result.error_kind, close_result.error_detail);
    }

    json data;
    data["closed_id"] = close_result.tab_id;
    data["remaining"] = context.daemon.registry.size();
    std::optional<session::TabSnapshot> active = context.daemon.registry.active_tab();
    data["active"] = active ? action_handlers::tab_snapshot_json(*active) : json(nullptr);

    std::string message = "Closed tab " + std::to_string(close_result.tab_id);
    if (!close_result.warning.empty()) {
        message += " (" + close_result.warning + ")";
        data["warning"] = close_result.warning;
    }
    return action_registry::ok_step(message, data);
}

namespace action_close_tab {

void register_action() {
    action_registry::register_action({
        parser::Verb::CloseTab,
        "Close a tab; the preceding tab becomes active if the active one was closed.",
        handle_close_tab
    });
}

} // namespace action_close_tab
