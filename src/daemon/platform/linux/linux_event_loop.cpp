#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, std::string config_path, bool verbose)
    : config_path_(std::move(config_path)), verbose_(verbose),
      ring_buf_(config.audio.ring_buffer_bytes()),
      audio_capture_(ring_buf_, config.audio.sample_rate),
      capture_engine_(ring_buf_, audio_capture_, mic_access_, config.audio.sample_rate),
      temp_store_(config.storage.temp_root()),
      backend_(temp_store_),
      core_(std::move(config), verbose_, capture_engine_, backend_, temp_store_,
            clipboard_output_, paste_output_, notifier_, ipc_server_,
            // NotifyCallback, runs on the transcription worker
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            },
            // ConfigLoader
            [this]() { return Config::load(config_path_); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);
    log("Scratch files under " + temp_store_.root().string());

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd; SIGHUP reloads the configuration
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN)) return false;
    if (!add_fd(ipc_server_.server_fd(), EPOLLIN)) return false;
    if (!add_fd(worker_event_fd_, EPOLLIN)) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                handle_signal();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_.on_transcription_complete();
                }
                continue;
            }

            // Client fd
            std::vector<nlohmann::json> cmds;
            if (!ipc_server_.read_commands(fd, cmds)) {
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                ipc_server_.close_client(fd);
                core_.remove_waiting_client(fd);
                continue;
            }

            for (const auto& cmd : cmds) {
                if (!cmd.is_object()) {
                    ipc_server_.send_response(fd, {{"status", "error"}, {"message", "expected a JSON object"}});
                    continue;
                }
                std::string cmd_str = cmd.value("cmd", "");
                auto response = core_.handle_command(cmd_str, cmd);

                if (response.value("status", "") == "processing") {
                    // Answered once the transcript has been delivered
                    core_.add_waiting_client(fd);
                } else {
                    ipc_server_.send_response(fd, response);
                }
            }
        }
    }

    core_.shutdown();
}

void LinuxEventLoop::handle_signal() {
    signalfd_siginfo info;
    if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) return;

    if (info.ssi_signo == SIGHUP) {
        log("Received SIGHUP, reloading configuration");
        core_.reload();
        return;
    }

    log("Received signal, shutting down");
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}
