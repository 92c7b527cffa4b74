#ifndef NLBD_PLATFORM_ABI_HPP
#define NLBD_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// stdout/stderr of the child go to /dev/null so browser chatter does not
// mix with daemon output.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Read the entire contents of a text file into a string.
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Poll until a non-empty file exists, up to timeout_milliseconds.
// When watched_process_id > 0, gives up early if that child exits.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds,
                   int watched_process_id = -1);

// True while the child has not exited (reaps it if it has).
bool is_process_running(int process_id);

// Wait for a child to exit, up to timeout_milliseconds. True if it exited.
bool wait_for_exit(int process_id, int timeout_milliseconds);

// SIGTERM, or SIGKILL when force is set.
bool kill_process(int process_id, bool force = false);

} // namespace platform

#endif // NLBD_PLATFORM_ABI_HPP
