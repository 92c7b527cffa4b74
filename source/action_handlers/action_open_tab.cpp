#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_dispatcher.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "open_tab". The new tab becomes the active one.

static StepResult handle_open_tab(const parser::Action &action, StepContext &context) {
    std::string url = action.target ? action_dispatcher::normalize_url(*action.target) : "";
    debug_log::log("open_tab invoked url=" + (url.empty() ? std::string("about:blank") : url));

    session::RegistryResult open_result = context.daemon.registry.open_tab(url);
    if (!open_result.success) {
        return action_registry::failed_step(open_result.error_kind, open_result.error_detail);
    }

    json data;
    data["id"] = open_result.tab_id;
    data["url"] = url.empty() ? "about:blank" : url;
    std::string message = "New tab opened";
    std::optional<session::TabSnapshot> active = context.daemon.registry.active_tab();
    if (active && active->id == open_result.tab_id) {
        data["index"] = active->index;
        message += " (Tab " + std::to_string(active->index) + ")";
    }
    return action_registry::ok_step(message, data);
}

namespace action_open_tab {

void register_action() {
    action_registry::register_action({
        parser::Verb::OpenTab,
        "Open a new tab, optionally at a URL, and make it active.",
        handle_open_tab
    });
}

} // namespace action_open_tab
