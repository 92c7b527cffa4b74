#ifndef NLBD_ACTION_HANDLERS_HPP
#define NLBD_ACTION_HANDLERS_HPP

// Action handler registration.
// Each action_*.cpp file provides a register function that is called during startup.

#include <nlohmann/json.hpp>
#include <string>

#include "session/tab_registry.hpp"

namespace action_handlers {

// Register all handlers with the action registry. Safe to call more than once.
void register_all_handlers();

// One line per registered action: its verb and what it does. Registers the
// handlers first.
std::string action_summary();

// {"index", "id", "title", "url", "active"} for responses.
nlohmann::json tab_snapshot_json(const session::TabSnapshot &snapshot);

} // namespace action_handlers

#endif // NLBD_ACTION_HANDLERS_HPP
