#ifndef NLBD_ACTION_DISPATCHER_HPP
#define NLBD_ACTION_DISPATCHER_HPP

// Executes parsed actions against the registry and the browser driver.
//
// Page actions resolve their tab (explicit position or the active tab) and
// wait for their turn in that tab's lane before any driver call. A compound
// instruction runs in order and stops at the first failing step; later steps
// are reported as skipped and earlier side effects are kept.

#include <string>
#include <vector>

#include "daemon/daemon_context.hpp"
#include "parser/action.hpp"
#include "protocol/envelope.hpp"

namespace action_dispatcher {

envelope::Response dispatch(const std::vector<parser::Action> &actions, nlbd::DaemonContext &context,
                            const std::string &cwd);

// Prepend https:// to scheme-less URLs ("example.com" -> "https://example.com").
std::string normalize_url(const std::string &url);

// Relative names resolve against cwd when given, else screenshot_directory.
// Empty names default to screenshot.png.
std::string resolve_screenshot_path(const std::string &file_name, const std::string &cwd,
                                    const std::string &screenshot_directory);

} // namespace action_dispatcher

#endif // NLBD_ACTION_DISPATCHER_HPP
