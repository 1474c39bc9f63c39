#include "platform/linux/wayland_paste_output.hpp"

#include "platform/subprocess.hpp"

#include <condition_variable>
#include <cstdlib>
#include <format>
#include <mutex>
#include <print>

WaylandPasteOutput::WaylandPasteOutput(std::chrono::milliseconds restore_delay)
    : restore_delay_(restore_delay) {}

WaylandPasteOutput::~WaylandPasteOutput() {
    // jthread requests stop; the pending restore runs immediately.
    if (restore_worker_.joinable()) {
        restore_worker_.request_stop();
        restore_worker_.join();
    }
}

std::expected<void, Error> WaylandPasteOutput::deliver(const std::string& text) {
    const char* display = std::getenv("WAYLAND_DISPLAY");
    if (!display || !*display) {
        return std::unexpected(Error{ErrorKind::AccessibilityDenied, "WAYLAND_DISPLAY is not set"});
    }

    // A restore still pending from the previous paste must not clobber this one.
    if (restore_worker_.joinable()) {
        restore_worker_.join();
    }

    auto previous = clipboard_.current_text();

    auto copied = clipboard_.deliver(text);
    if (!copied) {
        return std::unexpected(Error{ErrorKind::EventCreationFailed, copied.error().message});
    }

    // Give wl-copy time to take ownership of the selection.
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto pasted = send_paste_keystroke();
    if (!pasted) return pasted;

    if (previous) {
        schedule_restore(std::move(*previous));
    }
    return {};
}

std::expected<void, Error> WaylandPasteOutput::send_paste_keystroke() {
    auto proc = platform::run_process({"wtype", "-M", "ctrl", "-k", "v", "-m", "ctrl"}, {
        .stdout_mode = platform::Stream::Discard,
        .stderr_mode = platform::Stream::Capture,
    });
    if (!proc) {
        return std::unexpected(Error{ErrorKind::EventCreationFailed, proc.error()});
    }
    if (proc->exit_code == platform::exec_failed_code) {
        return std::unexpected(Error{ErrorKind::EventCreationFailed, "wtype not found"});
    }
    if (proc->exit_code != 0) {
        // wtype exits non-zero when the compositor lacks the virtual keyboard protocol.
        if (proc->stderr_text.find("virtual keyboard") != std::string::npos) {
            return std::unexpected(Error{ErrorKind::AccessibilityDenied,
                                         "compositor does not allow virtual keyboard input"});
        }
        return std::unexpected(Error{ErrorKind::EventCreationFailed,
                                     std::format("wtype exited with code {}", proc->exit_code)});
    }
    return {};
}

void WaylandPasteOutput::schedule_restore(std::string previous) {
    restore_worker_ = std::jthread([this, previous = std::move(previous)](std::stop_token stop) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lock(m);
        cv.wait_for(lock, stop, restore_delay_, [] { return false; });

        auto restored = clipboard_.deliver(previous);
        if (!restored) {
            std::println(stderr, "output: clipboard restore failed: {}", restored.error().message);
        }
    });
}
