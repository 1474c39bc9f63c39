#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate = 16000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    void set_level_handler(LevelHandler handler) override;

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);
    static void on_level_timer(void* userdata, uint64_t expirations);

    void teardown();

    RingBuffer& ring_buf_;
    uint32_t sample_rate_;
    std::atomic<bool> capturing_{false};
    std::atomic<float> peak_{0.0f};

    std::mutex level_mutex_;
    LevelHandler level_handler_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;
    spa_source* level_timer_ = nullptr;

    static constexpr uint64_t level_interval_ns = 50'000'000;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
