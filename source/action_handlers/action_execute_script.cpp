#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using action_registry::StepContext;
using action_registry::StepResult;

// Handler for "execute_script". The script's value is returned as data.result.

static StepResult handle_execute_script(const parser::Action &action, StepContext &context) {
    const std::string code = action.payload.value_or("");
    debug_log::log("execute_script invoked (" + std::to_string(code.size()) + " bytes)");

    browser_driver::EvaluateJavaScriptResult eval_result = context.lease->page().execute_script(code);
    if (!eval_result.success) {
        return action_registry::driver_failure(eval_result.timed_out, "script", eval_result.error_detail);
    }

    json data;
    data["result"] = eval_result.value;
    std::string message = "JavaScript executed";
    if (!eval_result.value.is_null()) {
        message += ": " + (eval_result.value.is_string()
                               ? eval_result.value.get<std::string>()
                               : eval_result.value.dump(-1, ' ', false, json::error_handler_t::replace));
    }
    return action_registry::ok_step(message, data);
}

namespace action_execute_script {

void register_action() {
    action_registry::register_action({
        parser::Verb::ExecuteScript,
        "Run JavaScript in the tab and return its value.",
        handle_execute_script
    });
}

} // namespace action_execute_script
