#ifndef NLBD_ACTION_HPP
#define NLBD_ACTION_HPP

// Structured form of one parsed instruction.

#include <optional>
#include <string>

namespace parser {

enum class Verb {
    Navigate,
    Click,
    Fill,
    GetText,
    WaitFor,
    Screenshot,
    ExecuteScript,
    GetContent,
    GetTitle,
    Scroll,
    OpenTab,
    SwitchTab,
    CloseTab,
    ListTabs,
    CurrentTab,
    CloseBrowser
};

// Wire/log name of a verb ("navigate", "switch_tab", ...).
const char *verb_name(Verb verb);

// True for page actions, which run against a tab resolved before any
// driver call.
bool verb_requires_tab(Verb verb);

// Field usage per verb:
//   navigate       target = url
//   click          target = selector
//   fill           target = selector, payload = text
//   get_text       target = selector
//   wait_for       target = selector, timeout_ms = optional bound
//   screenshot     target = optional file name, full_page
//   execute_script payload = code
//   scroll         target = up|down|left|right|top|bottom, payload = optional pixels
//   open_tab       target = optional url
//   switch_tab     tab_position = tab to activate
//   close_tab      tab_position = optional tab to close (active tab otherwise)
// For page actions tab_position selects the tab to run on ("... in tab 2").
struct Action {
    Verb verb = Verb::Navigate;
    std::optional<std::string> target;
    std::optional<std::string> payload;
    std::optional<int> tab_position;
    bool full_page = false;
    std::optional<int> timeout_ms;

    bool operator==(const Action &other) const;
    bool operator!=(const Action &other) const { return !(*this == other); }
};

// One-line rendering for logs and test failure messages.
std::string describe_action(const Action &action);

} // namespace parser

#endif // NLBD_ACTION_HPP
