#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

// Request workers log concurrently; keep each line whole.
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static void write_line(const std::string &tag, const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[nlbd] " << tag << message << std::endl;
}

bool is_truthy(const std::string &value) {
    std::string normalized = to_lower(value);
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    // Read once; the environment does not change while the daemon runs.
    static const bool enabled = [] {
        const char *value = std::getenv("NLBD_DEBUG");
        if (value == nullptr || value[0] == '\0') {
            return false;
        }
        return is_truthy(std::string(value));
    }();
    return enabled;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line("", message);
}

void info(const std::string &message) {
    write_line("", message);
}

void warn(const std::string &message) {
    write_line("warning: ", message);
}

} // namespace debug_log
