#ifndef NLBD_DEBUG_LOG_HPP
#define NLBD_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if NLBD_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [nlbd] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [nlbd] prefix unconditionally.
// Used for lifecycle events and per-request summaries.
void info(const std::string &message);

// Same as info() but tagged as a warning.
void warn(const std::string &message);

// Helper shared with the config layer: "1", "true", "yes" (any case).
bool is_truthy(const std::string &value);

} // namespace debug_log

#endif // NLBD_DEBUG_LOG_HPP
