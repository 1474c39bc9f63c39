#include "platform/linux/desktop_notifier.hpp"

#include "platform/subprocess.hpp"

#include <print>

void DesktopNotifier::notify(const std::string& summary, const std::string& body) {
    auto proc = platform::run_process({"notify-send", "--app-name=holdscribe", summary, body}, {
        .stdout_mode = platform::Stream::Discard,
        .stderr_mode = platform::Stream::Discard,
    });
    if (!proc) {
        std::println(stderr, "notify: {}", proc.error());
    } else if (proc->exit_code != 0) {
        std::println(stderr, "notify: notify-send exited with code {}", proc->exit_code);
    }
}
