#include "platform/platform_abi.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    // argv: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(&argument_string[0]);
    }
    argv_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds, int watched_process_id) {
    const int poll_interval_milliseconds = 100;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        std::error_code exists_error;
        if (std::filesystem::exists(file_path, exists_error)) {
            // Chrome may create the file before writing it.
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }
        if (watched_process_id > 0 && !is_process_running(watched_process_id)) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
}

bool is_process_running(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int status = 0;
    pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (wait_result == 0) {
        return true;
    }
    if (wait_result < 0 && errno != ECHILD) {
        return kill(static_cast<pid_t>(process_id), 0) == 0;
    }
    return false;
}

bool wait_for_exit(int process_id, int timeout_milliseconds) {
    const int poll_interval_milliseconds = 50;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (is_process_running(process_id)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
    return true;
}

bool kill_process(int process_id, bool force) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), force ? SIGKILL : SIGTERM) == 0;
}

} // namespace platform
