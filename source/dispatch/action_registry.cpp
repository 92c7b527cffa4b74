#include "dispatch/action_registry.hpp"

namespace action_registry {

// Global handler registry (module-level, not class-based).
static std::vector<ActionDefinition> registered_actions;

void register_action(const ActionDefinition &definition) {
    for (auto &existing : registered_actions) {
        if (existing.verb == definition.verb) {
            existing = definition;
            return;
        }
    }
    registered_actions.push_back(definition);
}

StepResult run_action(const parser::Action &action, StepContext &context) {
    for (const auto &definition : registered_actions) {
        if (definition.verb == action.verb) {
            return definition.handler(action, context);
        }
    }
    return failed_step(nlbd::ErrorKind::Driver,
                       std::string("no handler registered for ") + parser::verb_name(action.verb));
}

const std::vector<ActionDefinition> &get_registered_actions() {
    return registered_actions;
}

StepResult ok_step(const std::string &message, const json &data) {
    StepResult result;
    result.success = true;
    result.message = message;
    result.data = data;
    return result;
}

StepResult failed_step(nlbd::ErrorKind kind, const std::string &message) {
    StepResult result;
    result.error_kind = kind;
    result.message = message;
    return result;
}

StepResult driver_failure(bool timed_out, const std::string &what, const std::string &detail) {
    return failed_step(timed_out ? nlbd::ErrorKind::Timeout : nlbd::ErrorKind::Driver,
                       what + " failed: " + detail);
}

} // namespace action_registry
