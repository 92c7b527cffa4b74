#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

#include <sstream>

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "list_tabs". Returns a snapshot of the registry in tab order.

static StepResult handle_list_tabs(const parser::Action &action, StepContext &context) {
    (void)action;

    std::vector<session::TabSnapshot> snapshots = context.daemon.registry.list_tabs();

    json tabs_array = json::array();
    json active_index = nullptr;
    std::ostringstream summary_stream;
    summary_stream << "Found " << snapshots.size() << " tab(s)";
    for (const auto &snapshot : snapshots) {
        tabs_array.push_back(action_handlers::tab_snapshot_json(snapshot));
        if (snapshot.is_active) {
            active_index = snapshot.index;
        }
        summary_stream << "\n  " << (snapshot.is_active ? "*" : " ") << " [" << snapshot.index << "] "
                       << (snapshot.title.empty() ? "(untitled)" : snapshot.title) << " (" << snapshot.url << ")";
    }

    json data;
    data["tabs"] = tabs_array;
    data["current_tab"] = active_index;
    return action_registry::ok_step(summary_stream.str(), data);
}

namespace action_list_tabs {

void register_action() {
    action_registry::register_action({
        parser::Verb::ListTabs,
        "List open tabs with their position, title, URL and which one is active.",
        handle_list_tabs
    });
}

} // namespace action_list_tabs
