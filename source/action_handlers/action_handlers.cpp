#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

#include <mutex>

// Forward declarations of individual registration functions.
// Each action_*.cpp defines its own namespace with a register_action() function.

namespace action_navigate { void register_action(); }
namespace action_click { void register_action(); }
namespace action_fill { void register_action(); }
namespace action_get_text { void register_action(); }
namespace action_wait_for { void register_action(); }
namespace action_screenshot { void register_action(); }
namespace action_execute_script { void register_action(); }
namespace action_get_content { void register_action(); }
namespace action_get_title { void register_action(); }
namespace action_scroll { void register_action(); }
namespace action_open_tab { void register_action(); }
namespace action_switch_tab { void register_action(); }
namespace action_close_tab { void register_action(); }
namespace action_list_tabs { void register_action(); }
namespace action_current_tab { void register_action(); }
namespace action_close_browser { void register_action(); }

namespace action_handlers {

void register_all_handlers() {
    static std::once_flag registered;
    std::call_once(registered, [] {
        action_navigate::register_action();
        action_click::register_action();
        action_fill::register_action();
        action_get_text::register_action();
        action_wait_for::register_action();
        action_screenshot::register_action();
        action_execute_script::register_action();
        action_get_content::register_action();
        action_get_title::register_action();
        action_scroll::register_action();
        action_open_tab::register_action();
        action_switch_tab::register_action();
        action_close_tab::register_action();
        action_list_tabs::register_action();
        action_current_tab::register_action();
        action_close_browser::register_action();
    });
}

std::string action_summary() {
    register_all_handlers();
    std::string summary;
    for (const auto &definition : action_registry::get_registered_actions()) {
        std::string name = parser::verb_name(definition.verb);
        summary += "  " + name + std::string(name.size() < 16 ? 16 - name.size() : 1, ' ') +
                   definition.description + "\n";
    }
    return summary;
}

nlohmann::json tab_snapshot_json(const session::TabSnapshot &snapshot) {
    nlohmann::json entry;
    entry["index"] = snapshot.index;
    entry["id"] = snapshot.id;
    entry["title"] = snapshot.title;
    entry["url"] = snapshot.url;
    entry["active"] = snapshot.is_active;
    return entry;
}

} // namespace action_handlers
