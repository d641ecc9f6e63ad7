#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

struct ProcessResult {
    int exit_code = -1;    // WEXITSTATUS, or 128 + signal number
    bool timed_out = false;
    std::string output;    // captured stdout
    std::string errors;    // captured stderr
};

using LineSink = std::function<void(std::string_view line)>;

// Runs `command` through /bin/sh -c with stdin on /dev/null.
// Each complete stdout/stderr line is passed to on_line as it arrives.
// When the timeout expires the whole process group is killed and timed_out is set.
// Throws CommandError(SPAWN_FAILURE) if the shell cannot be started.
ProcessResult run_shell_command(const std::string& command,
                                std::chrono::milliseconds timeout,
                                const LineSink& on_line = {});
