#include "platform/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) return false;
        read_fd = fds[0];
        write_fd = fds[1];
        return true;
    }

    void close_read() {
        if (read_fd >= 0) ::close(read_fd);
        read_fd = -1;
    }

    void close_write() {
        if (write_fd >= 0) ::close(write_fd);
        write_fd = -1;
    }

    ~Pipe() {
        close_read();
        close_write();
    }
};

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Child side: wire one standard stream according to its mode.
void redirect_child(Stream mode, Pipe& pipe, int target_fd, bool child_reads) {
    if (mode == Stream::Capture) {
        ::dup2(child_reads ? pipe.read_fd : pipe.write_fd, target_fd);
    } else if (mode == Stream::Discard) {
        int devnull = ::open("/dev/null", child_reads ? O_RDONLY : O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, target_fd);
            ::close(devnull);
        }
    }
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      const ProcessOptions& options) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    Pipe in_pipe, out_pipe, err_pipe;
    if (options.stdin_data && !in_pipe.open()) return std::unexpected(errno_message("pipe()"));
    if (options.stdout_mode == Stream::Capture && !out_pipe.open()) return std::unexpected(errno_message("pipe()"));
    if (options.stderr_mode == Stream::Capture && !err_pipe.open()) return std::unexpected(errno_message("pipe()"));

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        if (options.stdin_data) {
            ::dup2(in_pipe.read_fd, STDIN_FILENO);
        } else {
            redirect_child(Stream::Discard, in_pipe, STDIN_FILENO, true);
        }
        redirect_child(options.stdout_mode, out_pipe, STDOUT_FILENO, false);
        redirect_child(options.stderr_mode, err_pipe, STDERR_FILENO, false);
        ::execvp(args[0], args.data());
        ::_exit(exec_failed_code);
    }

    in_pipe.close_read();
    out_pipe.close_write();
    err_pipe.close_write();

    ProcessResult result;

    if (options.stdin_data) {
        const auto& data = *options.stdin_data;
        size_t total_written = 0;
        while (total_written < data.size()) {
            ssize_t n = ::write(in_pipe.write_fd, data.data() + total_written, data.size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                break; // child exited early; its status tells the story
            }
            total_written += static_cast<size_t>(n);
        }
        in_pipe.close_write();
    }

    // Drain stdout and stderr together so neither pipe can fill up and stall the child.
    while (out_pipe.read_fd >= 0 || err_pipe.read_fd >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_pipe.read_fd >= 0) fds[count++] = {.fd = out_pipe.read_fd, .events = POLLIN, .revents = 0};
        if (err_pipe.read_fd >= 0) fds[count++] = {.fd = err_pipe.read_fd, .events = POLLIN, .revents = 0};

        int ret = ::poll(fds, count, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool is_out = fds[i].fd == out_pipe.read_fd;
            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                if (is_out) out_pipe.close_read(); else err_pipe.close_read();
                continue;
            }
            (is_out ? result.stdout_text : result.stderr_text).append(buf, static_cast<size_t>(n));
        }
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace platform
