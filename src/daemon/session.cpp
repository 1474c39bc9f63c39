#include "session.hpp"

#include <print>

std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Processing: return "processing";
    }
    return "unknown";
}

Session::Session(CaptureEngine& capture, WhisperBackend& backend, const SecureTempStore& temp_store,
                 EngineResolver resolve_engine, NotifyCallback notify)
    : capture_(capture), backend_(backend), temp_store_(temp_store),
      resolve_engine_(std::move(resolve_engine)), notify_(std::move(notify)) {}

Session::~Session() {
    if (state_ == SessionState::Recording) {
        cancel();
    } else if (state_ == SessionState::Processing) {
        // Wait for the engine so the recording is never deleted under it.
        auto outcome = complete();
        if (outcome && outcome->cleanup_error) {
            std::println(stderr, "session: {}", describe(*outcome->cleanup_error));
        }
    }
}

std::expected<bool, Error> Session::press() {
    if (state_ != SessionState::Idle) {
        return false;
    }

    auto engine = resolve_engine_();
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto audio_file = temp_store_.make_recording();
    if (!audio_file) {
        return std::unexpected(audio_file.error());
    }

    auto started = capture_.begin_recording(*audio_file);
    if (!started) {
        auto cleaned = SecureTempStore::wipe_and_remove(*audio_file);
        if (!cleaned) {
            std::println(stderr, "session: {}", describe(cleaned.error()));
        }
        return std::unexpected(started.error());
    }

    current_ = CaptureSession{
        .id = next_id_++,
        .audio_file = *audio_file,
        .started_at = std::chrono::steady_clock::now(),
    };
    engine_ = std::move(*engine);
    state_ = SessionState::Recording;
    return true;
}

std::expected<bool, Error> Session::release() {
    if (state_ != SessionState::Recording) {
        return false;
    }

    auto stopped = capture_.stop_recording();
    if (!stopped) {
        if (auto err = discard_recording()) {
            std::println(stderr, "session: {}", describe(*err));
        }
        state_ = SessionState::Idle;
        return std::unexpected(stopped.error());
    }
    audio_s_ = *stopped;

    TranscriptionRequest request{
        .audio_file = current_->audio_file,
        .model = engine_.model,
        .executable = engine_.executable,
        .language = engine_.language,
        .threads = engine_.threads,
    };

    state_ = SessionState::Processing;
    worker_result_ = TranscriptResult{};
    worker_ = std::jthread([this, request = std::move(request)] {
        worker_result_ = backend_.transcribe(request);
        notify_();
    });
    return true;
}

std::optional<SessionOutcome> Session::complete() {
    if (state_ != SessionState::Processing) {
        return std::nullopt;
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    SessionOutcome outcome{
        .session = *current_,
        .audio_s = audio_s_,
        .result = std::move(worker_result_),
        .cleanup_error = discard_recording(),
    };
    state_ = SessionState::Idle;
    return outcome;
}

void Session::cancel() {
    if (state_ != SessionState::Recording) return;

    auto stopped = capture_.stop_recording();
    if (!stopped) {
        std::println(stderr, "session: {}", describe(stopped.error()));
    }
    if (auto err = discard_recording()) {
        std::println(stderr, "session: {}", describe(*err));
    }
    state_ = SessionState::Idle;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording || !current_) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - current_->started_at).count();
}

std::optional<Error> Session::discard_recording() {
    if (!current_) return std::nullopt;

    auto cleaned = SecureTempStore::wipe_and_remove(current_->audio_file);
    current_.reset();
    audio_s_ = 0.0;
    if (!cleaned) return cleaned.error();
    return std::nullopt;
}
