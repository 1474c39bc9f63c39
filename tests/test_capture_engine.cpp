#include <catch2/catch_test_macros.hpp>

#include "capture_engine.hpp"
#include "platform/audio_capture.hpp"
#include "platform/microphone_access.hpp"
#include "ring_buffer.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Writes `samples` into the ring buffer as if the capture thread had run.
class MockAudioCapture : public AudioCapture {
public:
    explicit MockAudioCapture(RingBuffer& ring) : ring_(ring) {}

    bool start() override {
        ++starts;
        if (!start_ok) return false;
        ring_.write(samples.data(), samples.size() * sizeof(int16_t));
        capturing_ = true;
        return true;
    }
    void stop() override { capturing_ = false; ++stops; }
    bool is_capturing() const override { return capturing_; }
    void set_level_handler(LevelHandler handler) override { level_handler = std::move(handler); }

    bool start_ok = true;
    int starts = 0;
    int stops = 0;
    std::vector<int16_t> samples;
    LevelHandler level_handler;

private:
    RingBuffer& ring_;
    bool capturing_ = false;
};

// Answers authorization requests from a separate thread after a short delay.
class MockMicrophoneAccess : public MicrophoneAccess {
public:
    MicAuthorization status() const override { return status_; }

    void request(Callback done) override {
        ++requests;
        answer_ = std::jthread([this, done = std::move(done)] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            status_ = grant ? MicAuthorization::Authorized : MicAuthorization::Denied;
            done(grant);
        });
    }

    MicAuthorization status_ = MicAuthorization::Authorized;
    bool grant = true;
    int requests = 0;

private:
    std::jthread answer_;
};

struct TmpDir {
    fs::path path;

    TmpDir() {
        std::string tmpl = (fs::temp_directory_path() / "hs_test_capture_XXXXXX").string();
        path = ::mkdtemp(tmpl.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::vector<uint8_t> slurp(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("CaptureEngine", "[capture]") {
    TmpDir dir;
    RingBuffer ring(16000 * sizeof(int16_t) * 2);
    MockAudioCapture capture(ring);
    MockMicrophoneAccess access;
    CaptureEngine engine(ring, capture, access, 16000);

    auto destination = dir.path / "recording.wav";
    { std::ofstream create(destination); }

    SECTION("RecordsWavFile") {
        capture.samples.assign(8000, 512);

        REQUIRE(engine.begin_recording(destination).has_value());
        REQUIRE(engine.is_recording());

        auto seconds = engine.stop_recording();
        REQUIRE(seconds.has_value());
        REQUIRE(*seconds == 0.5);
        REQUIRE_FALSE(engine.is_recording());
        REQUIRE(capture.stops == 1);
        REQUIRE(slurp(destination) == wav::encode(capture.samples, 16000));
    }

    SECTION("StopWhenIdleIsNoop") {
        auto seconds = engine.stop_recording();
        REQUIRE(seconds.has_value());
        REQUIRE(*seconds == 0.0);
        REQUIRE(capture.stops == 0);
        REQUIRE(fs::file_size(destination) == 0);
    }

    SECTION("SecondBeginIsRejected") {
        REQUIRE(engine.begin_recording(destination).has_value());

        auto again = engine.begin_recording(destination);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().kind == ErrorKind::AlreadyRecording);
        REQUIRE(capture.starts == 1);
        REQUIRE(engine.is_recording());
    }

    SECTION("DeniedAccess") {
        access.status_ = MicAuthorization::Denied;

        auto started = engine.begin_recording(destination);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().kind == ErrorKind::PermissionDenied);
        REQUIRE(capture.starts == 0);
        REQUIRE(access.requests == 0);
    }

    SECTION("RestrictedAccess") {
        access.status_ = MicAuthorization::Restricted;

        auto started = engine.begin_recording(destination);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().kind == ErrorKind::PermissionDenied);
    }

    SECTION("UndeterminedAccessWaitsForAnswer") {
        access.status_ = MicAuthorization::NotDetermined;

        REQUIRE(engine.begin_recording(destination).has_value());
        REQUIRE(access.requests == 1);
        REQUIRE(capture.starts == 1);
        REQUIRE(access.status() == MicAuthorization::Authorized);
    }

    SECTION("UndeterminedAccessRefused") {
        access.status_ = MicAuthorization::NotDetermined;
        access.grant = false;

        auto started = engine.begin_recording(destination);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().kind == ErrorKind::PermissionDenied);
        REQUIRE(capture.starts == 0);
    }

    SECTION("CaptureStartFailure") {
        capture.start_ok = false;

        auto started = engine.begin_recording(destination);
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().kind == ErrorKind::RecorderFailed);
        REQUIRE_FALSE(engine.is_recording());
    }

    SECTION("UnwritableDestination") {
        capture.samples.assign(160, 1);
        REQUIRE(engine.begin_recording(dir.path / "missing" / "rec.wav").has_value());

        auto stopped = engine.stop_recording();
        REQUIRE_FALSE(stopped.has_value());
        REQUIRE(stopped.error().kind == ErrorKind::RecorderFailed);
        REQUIRE_FALSE(engine.is_recording());
    }

    SECTION("PreviousAudioIsNotReused") {
        capture.samples.assign(1600, 3);
        REQUIRE(engine.begin_recording(destination).has_value());
        REQUIRE(engine.stop_recording().has_value());

        capture.samples.assign(320, 9);
        REQUIRE(engine.begin_recording(destination).has_value());
        auto seconds = engine.stop_recording();
        REQUIRE(seconds.has_value());
        REQUIRE(*seconds == 0.02);
        REQUIRE(slurp(destination) == wav::encode(capture.samples, 16000));
    }

    SECTION("LevelHandlerReachesCapture") {
        float seen = -1.0f;
        engine.set_level_handler([&seen](float level) { seen = level; });
        REQUIRE(capture.level_handler);
        capture.level_handler(0.25f);
        REQUIRE(seen == 0.25f);
    }
}
