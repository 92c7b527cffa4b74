#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "get_text": visible text of one element.

static StepResult handle_get_text(const parser::Action &action, StepContext &context) {
    const std::string selector = action.target.value_or("");

    browser_driver::TextResult text_result = context.lease->page().get_text(selector);
    if (!text_result.success) {
        return action_registry::driver_failure(text_result.timed_out, "get text of " + selector,
                                               text_result.error_detail);
    }

    json data;
    data["selector"] = selector;
    data["text"] = text_result.text;
    return action_registry::ok_step(text_result.text, data);
}

namespace action_get_text {

void register_action() {
    action_registry::register_action({
        parser::Verb::GetText,
        "Return the text of the first element matching a CSS selector.",
        handle_get_text
    });
}

} // namespace action_get_text
