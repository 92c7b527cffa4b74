#ifndef NLBD_ACTION_REGISTRY_HPP
#define NLBD_ACTION_REGISTRY_HPP

// Action handler registry: one handler per verb, registered at startup and
// looked up by the dispatcher.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "daemon/daemon_context.hpp"
#include "parser/action.hpp"
#include "protocol/error_kind.hpp"
#include "session/tab_registry.hpp"

namespace action_registry {

using json = nlohmann::json;

// What a handler sees for one step.
struct StepContext {
    nlbd::DaemonContext &daemon;
    const std::string &cwd;               // client working directory, may be empty
    session::TabLease *lease = nullptr;   // held turn on the target tab (page verbs only)
};

// Outcome of one step.
struct StepResult {
    bool success = false;
    std::string message;
    json data; // null when there is nothing to return
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
};

using ActionHandler = std::function<StepResult(const parser::Action &action, StepContext &context)>;

struct ActionDefinition {
    parser::Verb verb;
    std::string description;
    ActionHandler handler;
};

// Register a handler. A second registration for the same verb replaces the first.
void register_action(const ActionDefinition &definition);

// Run the handler for action.verb. A verb with no handler is a driver error.
StepResult run_action(const parser::Action &action, StepContext &context);

const std::vector<ActionDefinition> &get_registered_actions();

// Helpers shared by handlers.
StepResult ok_step(const std::string &message, const json &data = nullptr);
StepResult failed_step(nlbd::ErrorKind kind, const std::string &message);

// Driver failures become Timeout when the bounded wait expired, else Driver.
StepResult driver_failure(bool timed_out, const std::string &what, const std::string &detail);

} // namespace action_registry

#endif // NLBD_ACTION_REGISTRY_HPP
