#include "dispatch/action_dispatcher.hpp"
#include "dispatch/action_registry.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <filesystem>
#include <optional>

namespace action_dispatcher {

using json = nlohmann::json;

std::string normalize_url(const std::string &url) {
    if (url.empty()) {
        return url;
    }
    static const char *const kept_schemes[] = {"about:", "data:", "file:", "chrome:", "javascript:"};
    std::string lowered;
    for (char character : url) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    }
    for (const char *scheme : kept_schemes) {
        if (lowered.compare(0, std::char_traits<char>::length(scheme), scheme) == 0) {
            return url;
        }
    }
    if (lowered.find("://") != std::string::npos) {
        return url;
    }
    return "https://" + url;
}

std::string resolve_screenshot_path(const std::string &file_name, const std::string &cwd,
                                    const std::string &screenshot_directory) {
    std::filesystem::path path(file_name.empty() ? "screenshot.png" : file_name);
    if (path.is_absolute()) {
        return path.lexically_normal().string();
    }
    std::filesystem::path base = cwd.empty() ? std::filesystem::path(screenshot_directory)
                                             : std::filesystem::path(cwd);
    return (base / path).lexically_normal().string();
}

// Best effort: keep the registry's title/url in step with the page.
static void refresh_location(nlbd::DaemonContext &context, session::TabLease &lease) {
    browser_driver::PageLocation location = lease.page().get_location();
    if (!location.success) {
        debug_log::log("refresh_location: tab " + std::to_string(lease.tab_id()) + ": " +
                       location.error_detail);
        return;
    }
    context.registry.update_location(lease.tab_id(), location.title, location.url);
}

// pinned_tab_id: the tab an earlier step of the same instruction opened or
// switched to. Page steps without an explicit position run there even if
// another request moves the active pointer in between.
static action_registry::StepResult run_step(const parser::Action &action, nlbd::DaemonContext &context,
                                            const std::string &cwd, std::optional<int> pinned_tab_id) {
    action_registry::StepContext step_context{context, cwd, nullptr};

    if (!parser::verb_requires_tab(action.verb)) {
        return action_registry::run_action(action, step_context);
    }

    session::AcquireResult acquire_result = (!action.tab_position && pinned_tab_id)
                                                ? context.registry.acquire_id(*pinned_tab_id)
                                                : context.registry.acquire(action.tab_position);
    if (!acquire_result.success) {
        return action_registry::failed_step(acquire_result.error_kind, acquire_result.error_detail);
    }
    session::TabLease lease = std::move(acquire_result.lease);
    if (!lease.wait_turn()) {
        return action_registry::failed_step(nlbd::ErrorKind::Registry,
                                            "tab not found: id " + std::to_string(lease.tab_id()) +
                                                " was closed");
    }

    step_context.lease = &lease;
    action_registry::StepResult result = action_registry::run_action(action, step_context);
    refresh_location(context, lease);
    return result;
}

envelope::Response dispatch(const std::vector<parser::Action> &actions, nlbd::DaemonContext &context,
                            const std::string &cwd) {
    envelope::Response response;

    if (actions.size() == 1) {
        action_registry::StepResult step = run_step(actions.front(), context, cwd, std::nullopt);
        response.ok = step.success;
        response.message = step.message;
        response.data = step.data;
        response.error_kind = step.success ? nlbd::ErrorKind::None : step.error_kind;
        return response;
    }

    json steps = json::array();
    size_t succeeded = 0;
    size_t failed_index = actions.size();
    action_registry::StepResult failed_step;
    std::string combined_message;
    std::optional<int> pinned_tab_id;

    for (size_t index = 0; index < actions.size(); ++index) {
        const parser::Action &action = actions[index];
        json step_entry;
        step_entry["step"] = index + 1;
        step_entry["verb"] = parser::verb_name(action.verb);

        if (failed_index < actions.size()) {
            step_entry["status"] = "skipped";
            step_entry["message"] = "skipped after step " + std::to_string(failed_index + 1) + " failed";
            step_entry["data"] = nullptr;
            steps.push_back(step_entry);
            continue;
        }

        action_registry::StepResult step = run_step(action, context, cwd, pinned_tab_id);
        step_entry["status"] = step.success ? "ok" : "error";
        step_entry["message"] = step.message;
        step_entry["data"] = step.data;
        if (!step.success) {
            step_entry["error_kind"] = nlbd::error_kind_name(step.error_kind);
            failed_index = index;
            failed_step = step;
        } else {
            ++succeeded;
            combined_message += (combined_message.empty() ? "" : "; ") + step.message;
            if (action.verb == parser::Verb::OpenTab || action.verb == parser::Verb::SwitchTab) {
                if (step.data.is_object() && step.data.contains("id") && step.data["id"].is_number_integer()) {
                    pinned_tab_id = step.data["id"].get<int>();
                }
            } else if (action.verb == parser::Verb::CloseTab) {
                pinned_tab_id.reset();
            }
        }
        steps.push_back(step_entry);

        // Nothing may run after close_browser.
        if (context.shutdown_requested) {
            for (size_t rest = index + 1; rest < actions.size(); ++rest) {
                json skipped_entry;
                skipped_entry["step"] = rest + 1;
                skipped_entry["verb"] = parser::verb_name(actions[rest].verb);
                skipped_entry["status"] = "skipped";
                skipped_entry["message"] = "skipped: daemon is shutting down";
                skipped_entry["data"] = nullptr;
                steps.push_back(skipped_entry);
            }
            break;
        }
    }

    response.data = json::object();
    response.data["steps"] = steps;

    if (failed_index == actions.size()) {
        response.ok = true;
        response.message = combined_message;
        return response;
    }

    size_t skipped = actions.size() - succeeded - 1;
    response.ok = false;
    response.error_kind = failed_step.error_kind;
    response.message = "step " + std::to_string(failed_index + 1) + " of " +
                       std::to_string(actions.size()) + " (" +
                       parser::verb_name(actions[failed_index].verb) + ") failed: " +
                       failed_step.message + "; " + std::to_string(succeeded) + " succeeded, " +
                       std::to_string(skipped) + " skipped";
    return response;
}

} // namespace action_dispatcher
