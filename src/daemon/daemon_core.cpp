#include "daemon_core.hpp"

#include "whisper/bundle.hpp"

#include <algorithm>
#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       CaptureEngine& capture, WhisperBackend& backend, const SecureTempStore& temp_store,
                       OutputMethod& clipboard, OutputMethod& paste,
                       Notifier& notifier, IpcServer& ipc,
                       NotifyCallback notify, ConfigLoader reload_config)
    : config_(std::move(config)), verbose_(verbose),
      capture_(capture), clipboard_(clipboard), paste_(paste),
      notifier_(notifier), ipc_(ipc),
      reload_config_(std::move(reload_config)),
      delivery_(config_.delivery.break_interval()),
      session_delivery_(config_.delivery.snapshot()),
      session_(capture, backend, temp_store,
               [this] { return resolve_engine(); },
               std::move(notify)) {
    capture_.set_level_handler([this](float level) {
        level_.store(level, std::memory_order_relaxed);
    });
}

DaemonCore::~DaemonCore() {
    capture_.set_level_handler(nullptr);
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "press") return handle_press(cmd);
    if (cmd_str == "release") return handle_release(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "last") return handle_last(cmd);
    if (cmd_str == "copy-last") return handle_copy_last(cmd);
    if (cmd_str == "reload") return handle_reload(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_press(const nlohmann::json& /*cmd*/) {
    auto started = session_.press();
    if (!started) {
        return report_error("Recording Error", started.error());
    }
    if (!*started) {
        return {{"status", "ignored"}, {"state", session_state_name(session_.state())}};
    }

    // Settings may change between sessions, never during one.
    session_delivery_ = config_.delivery.snapshot();
    log(std::format("Recording started (session {})", session_.current()->id));
    return {{"status", "ok"}, {"state", "recording"}, {"session", session_.current()->id}};
}

nlohmann::json DaemonCore::handle_release(const nlohmann::json& /*cmd*/) {
    auto session_id = session_.current() ? session_.current()->id : 0;

    auto released = session_.release();
    if (!released) {
        return report_error("Recording Error", released.error());
    }
    if (!*released) {
        return {{"status", "ignored"}, {"state", session_state_name(session_.state())}};
    }

    log(std::format("Recording stopped (session {}), transcribing...", session_id));
    return {{"status", "processing"}, {"session", session_id}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    if (session_.state() == SessionState::Recording) {
        return handle_release(cmd);
    }
    return handle_press(cmd);
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", session_state_name(session_.state())},
        {"auto_paste", config_.delivery.auto_paste},
        {"has_transcript", delivery_.last_transcript().has_value()},
    };
    if (session_.current()) {
        resp["session"] = session_.current()->id;
    }
    if (session_.state() == SessionState::Recording) {
        resp["duration"] = session_.recording_duration();
        resp["level"] = level_.load(std::memory_order_relaxed);
    }
    return resp;
}

nlohmann::json DaemonCore::handle_last(const nlohmann::json& /*cmd*/) {
    const auto& last = delivery_.last_transcript();
    if (!last) {
        return {{"status", "error"}, {"message", "no transcript yet"}};
    }
    return {{"status", "ok"}, {"text", *last}};
}

nlohmann::json DaemonCore::handle_copy_last(const nlohmann::json& /*cmd*/) {
    const auto& last = delivery_.last_transcript();
    if (!last) {
        return {{"status", "error"}, {"message", "no transcript yet"}};
    }

    auto copied = clipboard_.deliver(*last);
    if (!copied) {
        return report_error("Copy Error", copied.error());
    }
    return {{"status", "ok"}, {"action", "copy"}, {"text", *last}};
}

nlohmann::json DaemonCore::handle_reload(const nlohmann::json& /*cmd*/) {
    reload();
    return {{"status", "ok"}, {"message", "configuration reloaded"}};
}

void DaemonCore::reload() {
    if (reload_config_) {
        config_ = reload_config_();
    }
    delivery_.set_break_interval(config_.delivery.break_interval());
    delivery_.reset_paste_history();
    log("Configuration reloaded");
}

void DaemonCore::on_transcription_complete() {
    auto outcome = session_.complete();
    if (!outcome) return;

    if (outcome->cleanup_error) {
        report_error("Cleanup Error", *outcome->cleanup_error);
    }

    nlohmann::json response;
    if (outcome->result.has_value()) {
        auto& tr = outcome->result.value();
        log(std::format("Transcription complete (session {}): {:.1f}s audio, {:.1f}s processing, {} chars",
                        outcome->session.id, outcome->audio_s, tr.processing_s, tr.text.size()));
        response = deliver(tr.text);
    } else {
        response = report_error("Transcription Error", outcome->result.error());
    }
    response["session"] = outcome->session.id;

    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

nlohmann::json DaemonCore::deliver(const std::string& text) {
    auto result = delivery_.process(text, session_delivery_);
    if (!result) {
        log("No speech detected");
        return {{"status", "ok"}, {"action", "none"}};
    }

    if (result->action == DeliveryAction::Paste) {
        auto pasted = paste_.deliver(result->text);
        if (!pasted) {
            auto resp = report_error("Paste Error", pasted.error());
            resp["text"] = result->normalized_text;
            return resp;
        }
        delivery_.mark_paste_completed();
        return {{"status", "ok"}, {"action", "paste"}, {"text", result->normalized_text}};
    }

    auto copied = clipboard_.deliver(result->text);
    if (!copied) {
        auto resp = report_error("Copy Error", copied.error());
        resp["text"] = result->normalized_text;
        return resp;
    }
    if (config_.notify.enabled) {
        notifier_.notify("Transcription Complete", "Transcript copied to clipboard:\n\n" + result->text);
    }
    return {{"status", "ok"}, {"action", "copy"}, {"text", result->normalized_text}};
}

std::expected<EngineBinding, Error> DaemonCore::resolve_engine() const {
    auto bundle = resolve_bundle(config_.engine.bundle_path());
    if (!bundle) {
        return std::unexpected(bundle.error());
    }

    auto model = resolve_model(*bundle, config_.engine.selected_model, config_.engine.custom_model_path);
    if (!model) {
        return std::unexpected(model.error());
    }

    return EngineBinding{
        .executable = bundle->binary,
        .model = *model,
        .language = config_.engine.language,
        .threads = config_.engine.threads,
    };
}

nlohmann::json DaemonCore::report_error(std::string_view title, const Error& error) {
    auto message = describe(error);
    std::println(stderr, "[holdscribe] {}: {}", title, message);
    if (config_.notify.enabled) {
        notifier_.notify(std::string(title), message);
    }
    return {{"status", "error"}, {"kind", error_kind_name(error.kind)}, {"message", message}};
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

void DaemonCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        log("Discarding active recording");
        session_.cancel();
    }

    if (session_.state() == SessionState::Processing) {
        log("Waiting for pending transcription to complete...");
        on_transcription_complete();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}
