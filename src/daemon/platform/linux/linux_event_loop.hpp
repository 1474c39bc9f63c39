#pragma once

#include "capture_engine.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/pipewire_access.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_paste_output.hpp"
#include "ring_buffer.hpp"
#include "secure_temp.hpp"
#include "whisper/cli_backend.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, std::string config_path, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_signal();
    void log(const std::string& msg);

    std::string config_path_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    PipeWireAccess mic_access_;
    CaptureEngine capture_engine_;
    SecureTempStore temp_store_;
    WhisperCliBackend backend_;
    WaylandClipboardOutput clipboard_output_;
    WaylandPasteOutput paste_output_;
    DesktopNotifier notifier_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
