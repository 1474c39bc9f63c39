#pragma once

#include "capture_engine.hpp"
#include "config.hpp"
#include "delivery.hpp"
#include "error.hpp"
#include "output/output.hpp"
#include "platform/ipc_server.hpp"
#include "platform/notifier.hpp"
#include "secure_temp.hpp"
#include "session.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

// Platform-independent daemon logic: maps IPC commands onto the press-to-talk
// session and runs finished transcripts through the delivery policy.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;
    using ConfigLoader = std::function<Config()>;

    DaemonCore(Config config, bool verbose,
               CaptureEngine& capture, WhisperBackend& backend, const SecureTempStore& temp_store,
               OutputMethod& clipboard, OutputMethod& paste,
               Notifier& notifier, IpcServer& ipc,
               NotifyCallback notify, ConfigLoader reload_config = {});
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Runs on the event loop thread once the worker has signalled completion.
    void on_transcription_complete();

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    SessionState session_state() const { return session_.state(); }
    const TranscriptDelivery& delivery() const { return delivery_; }
    const Config& config() const { return config_; }

    // Re-reads the configuration and forgets the last paste time.
    void reload();

    void shutdown();

private:
    nlohmann::json handle_press(const nlohmann::json& cmd);
    nlohmann::json handle_release(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_last(const nlohmann::json& cmd);
    nlohmann::json handle_copy_last(const nlohmann::json& cmd);
    nlohmann::json handle_reload(const nlohmann::json& cmd);

    std::expected<EngineBinding, Error> resolve_engine() const;
    nlohmann::json deliver(const std::string& text);
    nlohmann::json report_error(std::string_view title, const Error& error);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    CaptureEngine& capture_;
    OutputMethod& clipboard_;
    OutputMethod& paste_;
    Notifier& notifier_;
    IpcServer& ipc_;

    ConfigLoader reload_config_;

    TranscriptDelivery delivery_;
    DeliveryConfig session_delivery_;
    std::atomic<float> level_{0.0f};
    std::vector<int> waiting_clients_;

    // Declared last: its destructor may still finish a transcription.
    Session session_;
};
