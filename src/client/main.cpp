#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

// Transcription of a long recording can take minutes on slow machines.
static constexpr int transcription_timeout_ms = 10 * 60 * 1000;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command>", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  press       Start recording (hotkey down)");
    std::println(stderr, "  release     Stop recording, transcribe and deliver (hotkey up)");
    std::println(stderr, "  toggle      Press when idle, release when recording");
    std::println(stderr, "  status      Show daemon state");
    std::println(stderr, "  last        Print the last transcript");
    std::println(stderr, "  copy-last   Copy the last transcript to the clipboard");
    std::println(stderr, "  reload      Re-read the configuration file");
}

static bool is_known_command(const std::string& command) {
    return command == "press" || command == "release" || command == "toggle" ||
           command == "status" || command == "last" || command == "copy-last" ||
           command == "reload";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    }
    if (!is_known_command(command)) {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    json cmd = {{"cmd", command}};

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is holdscribe running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // release (and toggle while recording) answers only after delivery
    int timeout_ms = (command == "release" || command == "toggle")
                         ? transcription_timeout_ms
                         : IpcClient::default_timeout_ms;

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (status == "ignored") {
        std::println("Ignored (state: {})", response.value("state", "unknown"));
        return 0;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("session")) {
            std::println("Session: {}", response["session"].get<uint64_t>());
        }
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("level")) {
            std::println("Input level: {:.2f}", response["level"].get<double>());
        }
        std::println("Auto-paste: {}", response.value("auto_paste", false) ? "on" : "off");
        return 0;
    }

    if (status == "ok") {
        if (response.contains("text")) {
            std::println("{}", response["text"].get<std::string>());
        } else if (response.value("action", "") == "none") {
            std::println("No speech detected");
        } else if (response.contains("message")) {
            std::println("{}", response["message"].get<std::string>());
        } else {
            std::println("OK");
        }
        return 0;
    }

    std::println("{}", response.dump(2));
    return 0;
}
