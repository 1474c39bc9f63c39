#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace platform {

enum class Stream { Inherit, Capture, Discard };

struct ProcessOptions {
    std::optional<std::string> stdin_data;
    Stream stdout_mode = Stream::Inherit;
    Stream stderr_mode = Stream::Inherit;
};

struct ProcessResult {
    // Exit status, or 128 + signal number when killed by a signal.
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

// Exit code reported when the program could not be executed.
inline constexpr int exec_failed_code = 127;

// Runs argv[0] (looked up in PATH) and waits for it to exit.
// The error string describes a failure to spawn or wait, not a non-zero exit.
std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const ProcessOptions& options = {});

} // namespace platform
