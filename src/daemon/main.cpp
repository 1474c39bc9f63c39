#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <signal.h>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: holdscribe [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    if (config_path.empty()) {
        config_path = Config::default_path();
    }
    Config config = Config::load(config_path);

    if (!foreground) {
        platform::daemonize();
    }

    // Child processes (wl-copy, whisper-cli) may exit before reading their stdin
    signal(SIGPIPE, SIG_IGN);

    if (verbose && foreground) {
        std::println(stderr, "[holdscribe] Starting (bundle: {}, language: {})",
                     config.engine.bundle_path(), config.engine.language);
    }

    LinuxEventLoop loop(std::move(config), config_path, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
