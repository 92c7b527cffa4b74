#include "parser/action.hpp"

namespace parser {

const char *verb_name(Verb verb) {
    switch (verb) {
    case Verb::Navigate: return "navigate";
    case Verb::Click: return "click";
    case Verb::Fill: return "fill";
    case Verb::GetText: return "get_text";
    case Verb::WaitFor: return "wait_for";
    case Verb::Screenshot: return "screenshot";
    case Verb::ExecuteScript: return "execute_script";
    case Verb::GetContent: return "get_content";
    case Verb::GetTitle: return "get_title";
    case Verb::Scroll: return "scroll";
    case Verb::OpenTab: return "open_tab";
    case Verb::SwitchTab: return "switch_tab";
    case Verb::CloseTab: return "close_tab";
    case Verb::ListTabs: return "list_tabs";
    case Verb::CurrentTab: return "current_tab";
    case Verb::CloseBrowser: return "close_browser";
    }
    return "unknown";
}

bool verb_requires_tab(Verb verb) {
    switch (verb) {
    case Verb::Navigate:
    case Verb::Click:
    case Verb::Fill:
    case Verb::GetText:
    case Verb::WaitFor:
    case Verb::Screenshot:
    case Verb::ExecuteScript:
    case Verb::GetContent:
    case Verb::GetTitle:
    case Verb::Scroll:
        return true;
    case Verb::OpenTab:
    case Verb::SwitchTab:
    case Verb::CloseTab:
    case Verb::ListTabs:
    case Verb::CurrentTab:
    case Verb::CloseBrowser:
        return false;
    }
    return false;
}

bool Action::operator==(const Action &other) const {
    return verb == other.verb && target == other.target && payload == other.payload &&
           tab_position == other.tab_position && full_page == other.full_page &&
           timeout_ms == other.timeout_ms;
}

std::string describe_action(const Action &action) {
    std::string description = verb_name(action.verb);
    description += "(";
    std::string separator;
    if (action.target) {
        description += "target=\"" + *action.target + "\"";
        separator = ", ";
    }
    if (action.payload) {
        description += separator + "payload=\"" + *action.payload + "\"";
        separator = ", ";
    }
    if (action.tab_position) {
        description += separator + "tab=" + std::to_string(*action.tab_position);
        separator = ", ";
    }
    if (action.full_page) {
        description += separator + "full_page";
        separator = ", ";
    }
    if (action.timeout_ms) {
        description += separator + "timeout_ms=" + std::to_string(*action.timeout_ms);
    }
    description += ")";
    return description;
}

} // namespace parser
