#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/subprocess.hpp"

#include <format>

std::expected<void, Error> WaylandClipboardOutput::deliver(const std::string& text) {
    // wl-copy forks a server that keeps the selection alive; its stdout and
    // stderr must not be pipes we wait on.
    auto proc = platform::run_process({"wl-copy"}, {
        .stdin_data = text,
        .stdout_mode = platform::Stream::Discard,
        .stderr_mode = platform::Stream::Discard,
    });
    if (!proc) {
        return std::unexpected(Error{ErrorKind::IoError, proc.error()});
    }
    if (proc->exit_code == platform::exec_failed_code) {
        return std::unexpected(Error{ErrorKind::IoError, "wl-copy not found (install wl-clipboard)"});
    }
    if (proc->exit_code != 0) {
        return std::unexpected(Error{ErrorKind::IoError,
                                     std::format("wl-copy exited with code {}", proc->exit_code)});
    }
    return {};
}

std::optional<std::string> WaylandClipboardOutput::current_text() {
    auto proc = platform::run_process({"wl-paste", "--no-newline", "--type", "text/plain"}, {
        .stdout_mode = platform::Stream::Capture,
        .stderr_mode = platform::Stream::Discard,
    });
    if (!proc || proc->exit_code != 0) return std::nullopt;
    return std::move(proc->stdout_text);
}
