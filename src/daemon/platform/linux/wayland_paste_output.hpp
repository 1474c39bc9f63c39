#pragma once

#include "output/output.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"

#include <chrono>
#include <string>
#include <thread>

// Pastes into the focused window: puts the text on the clipboard, sends
// Ctrl+V through the virtual-keyboard protocol (wtype), then puts the
// previous clipboard text back after `restore_delay`.
class WaylandPasteOutput : public OutputMethod {
public:
    explicit WaylandPasteOutput(std::chrono::milliseconds restore_delay = std::chrono::milliseconds(200));
    ~WaylandPasteOutput() override;

    WaylandPasteOutput(const WaylandPasteOutput&) = delete;
    WaylandPasteOutput& operator=(const WaylandPasteOutput&) = delete;

    std::expected<void, Error> deliver(const std::string& text) override;

private:
    std::expected<void, Error> send_paste_keystroke();
    void schedule_restore(std::string previous);

    WaylandClipboardOutput clipboard_;
    std::chrono::milliseconds restore_delay_;
    std::jthread restore_worker_;
};
