#include "action_handlers/action_handlers.hpp"
#include "dispatch/action_registry.hpp"

#include <cstdlib>

using action_registry::StepContext;
using action_registry::StepResult;

static const int kDefaultScrollPixels = 500;

// Handler for "scroll". Direction in target, optional pixel amount in payload.

static StepResult handle_scroll(const parser::Action &action, StepContext &context) {
    const std::string direction = action.target.value_or("down");
    int amount = kDefaultScrollPixels;
    if (action.payload && !action.payload->empty()) {
        amount = std::atoi(action.payload->c_str());
    }

    browser_driver::ScrollScope scroll_scope;
    std::string description;
    if (direction == "top") {
        scroll_scope.type = browser_driver::ScrollScopeType::Top;
        description = "to the top";
    } else if (direction == "bottom") {
        scroll_scope.type = browser_driver::ScrollScopeType::Bottom;
        description = "to the bottom";
    } else if (direction == "up" || direction == "down" || direction == "left" || direction == "right") {
        scroll_scope.type = browser_driver::ScrollScopeType::By;
        if (direction == "up") {
            scroll_scope.delta_y = -amount;
        } else if (direction == "down") {
            scroll_scope.delta_y = amount;
        } else if (direction == "left") {
            scroll_scope.delta_x = -amount;
        } else {
            scroll_scope.delta_x = amount;
        }
        description = direction + " " + std::to_string(amount) + "px";
    } else {
        return action_registry::failed_step(nlbd::ErrorKind::Parse, "unknown scroll direction: " + direction);
    }

    browser_driver::DriverResult scroll_result = context.lease->page().scroll(scroll_scope);
    if (!scroll_result.success) {
        return action_registry::driver_failure(scroll_result.timed_out, "scroll", scroll_result.error_detail);
    }
    return action_registry::ok_step("Scrolled " + description);
}

namespace action_scroll {

void register_action() {
    action_registry::register_action({
        parser::Verb::Scroll,
        "Scroll the page up, down, left, right, or to the top or bottom.",
        handle_scroll
    });
}

} // namespace action_scroll
