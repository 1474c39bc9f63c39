#include "capture_engine.hpp"

#include "wav_encoder.hpp"

#include <future>
#include <memory>
#include <print>

bool await_microphone_authorization(MicrophoneAccess& access) {
    switch (access.status()) {
        case MicAuthorization::Authorized:
            return true;
        case MicAuthorization::Denied:
        case MicAuthorization::Restricted:
            return false;
        case MicAuthorization::NotDetermined:
            break;
    }

    auto decision = std::make_shared<std::promise<bool>>();
    auto answer = decision->get_future();
    access.request([decision](bool granted) { decision->set_value(granted); });
    return answer.get();
}

CaptureEngine::CaptureEngine(RingBuffer& ring_buf, AudioCapture& capture, MicrophoneAccess& access,
                             uint32_t sample_rate)
    : ring_buf_(ring_buf), capture_(capture), access_(access), sample_rate_(sample_rate) {}

void CaptureEngine::set_level_handler(AudioCapture::LevelHandler handler) {
    capture_.set_level_handler(std::move(handler));
}

std::expected<void, Error> CaptureEngine::begin_recording(const std::filesystem::path& destination) {
    if (recording_) {
        return std::unexpected(Error{ErrorKind::AlreadyRecording, "recorder already in use"});
    }

    if (!await_microphone_authorization(access_)) {
        return std::unexpected(Error{ErrorKind::PermissionDenied, "microphone access denied"});
    }

    ring_buf_.reset();
    if (!capture_.start()) {
        return std::unexpected(Error{ErrorKind::RecorderFailed, "unable to start audio capture"});
    }

    destination_ = destination;
    recording_ = true;
    return {};
}

std::expected<double, Error> CaptureEngine::stop_recording() {
    if (!recording_) return 0.0;

    capture_.stop();
    recording_ = false;

    if (ring_buf_.overflowed()) {
        std::println(stderr, "capture: recording truncated at {}s buffer limit",
                     ring_buf_.capacity() / sizeof(int16_t) / sample_rate_);
    }

    auto samples = ring_buf_.drain_all();
    auto written = wav::write_file(destination_, samples, sample_rate_);
    destination_.clear();
    if (!written) {
        return std::unexpected(Error{ErrorKind::RecorderFailed, written.error()});
    }

    return static_cast<double>(samples.size()) / sample_rate_;
}
