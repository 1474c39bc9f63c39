#pragma once

#include "error.hpp"
#include "platform/audio_capture.hpp"
#include "platform/microphone_access.hpp"
#include "ring_buffer.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>

// Owns one microphone recording at a time. Samples accumulate in the ring
// buffer while recording; stop_recording() writes them to the destination
// as mono 16-bit PCM WAV.
class CaptureEngine {
public:
    CaptureEngine(RingBuffer& ring_buf, AudioCapture& capture, MicrophoneAccess& access,
                  uint32_t sample_rate = 16000);

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    // Blocks while microphone authorization is being requested.
    std::expected<void, Error> begin_recording(const std::filesystem::path& destination);

    // Returns the recorded length in seconds; 0 and no-op when idle.
    std::expected<double, Error> stop_recording();

    bool is_recording() const { return recording_; }
    uint32_t sample_rate() const { return sample_rate_; }

    void set_level_handler(AudioCapture::LevelHandler handler);

private:
    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    MicrophoneAccess& access_;
    uint32_t sample_rate_;

    bool recording_ = false;
    std::filesystem::path destination_;
};

// Resolves microphone authorization, requesting it and waiting for the answer
// when it has not been decided yet.
bool await_microphone_authorization(MicrophoneAccess& access);
