#pragma once

#include "capture_engine.hpp"
#include "error.hpp"
#include "secure_temp.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <thread>

enum class SessionState { Idle, Recording, Processing };

std::string_view session_state_name(SessionState state);

struct CaptureSession {
    uint64_t id = 0;
    std::filesystem::path audio_file;
    std::chrono::steady_clock::time_point started_at;
};

struct SessionOutcome {
    CaptureSession session;
    double audio_s = 0.0;
    std::expected<TranscriptResult, Error> result;
    std::optional<Error> cleanup_error;
};

// Press-to-talk controller: Idle -> Recording -> Processing -> Idle.
//
// At most one CaptureSession exists at a time. Presses outside Idle and
// releases outside Recording are ignored. Transcription runs on a worker
// thread; when it finishes the notify callback fires and the owner calls
// complete() from its own thread, which wipes the recording and returns to
// Idle whatever the outcome.
class Session {
public:
    using EngineResolver = std::function<std::expected<EngineBinding, Error>()>;
    using NotifyCallback = std::function<void()>;

    Session(CaptureEngine& capture, WhisperBackend& backend, const SecureTempStore& temp_store,
            EngineResolver resolve_engine, NotifyCallback notify);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // true: recording started. false: ignored, a session is already active.
    std::expected<bool, Error> press();

    // true: transcription started. false: ignored, nothing was recording.
    // On error the recording has been discarded and the state is Idle.
    std::expected<bool, Error> release();

    // Collects a finished transcription. Returns nullopt unless Processing.
    std::optional<SessionOutcome> complete();

    // Stops an active recording without transcribing it.
    void cancel();

    SessionState state() const { return state_; }
    const std::optional<CaptureSession>& current() const { return current_; }
    double recording_duration() const;

private:
    std::optional<Error> discard_recording();

    CaptureEngine& capture_;
    WhisperBackend& backend_;
    const SecureTempStore& temp_store_;
    EngineResolver resolve_engine_;
    NotifyCallback notify_;

    SessionState state_ = SessionState::Idle;
    std::optional<CaptureSession> current_;
    EngineBinding engine_;
    uint64_t next_id_ = 1;
    double audio_s_ = 0.0;

    std::expected<TranscriptResult, Error> worker_result_;
    std::jthread worker_;
};
