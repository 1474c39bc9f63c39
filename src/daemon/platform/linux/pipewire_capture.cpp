#include "platform/linux/pipewire_capture.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate)
    : ring_buf_(ring_buf), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

void PipeWireCapture::set_level_handler(LevelHandler handler) {
    std::lock_guard lock(level_mutex_);
    level_handler_ = std::move(handler);
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("holdscribe", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "holdscribe",
        PW_KEY_APP_NAME, "holdscribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "holdscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        teardown();
        return false;
    }

    // S16_LE, mono, 16kHz: the format whisper-cli reads without resampling
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        teardown();
        return false;
    }

    // Level metering runs on the loop thread, away from the RT process callback.
    auto* pw_loop = pw_thread_loop_get_loop(loop_);
    level_timer_ = pw_loop_add_timer(pw_loop, on_level_timer, this);
    if (level_timer_) {
        timespec interval{.tv_sec = 0, .tv_nsec = static_cast<long>(level_interval_ns)};
        pw_loop_update_timer(pw_loop, level_timer_, &interval, &interval, false);
    }

    ring_buf_.reset();
    peak_.store(0.0f, std::memory_order_relaxed);
    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        capturing_.store(false, std::memory_order_release);
        teardown();
        return false;
    }

    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (level_timer_ && loop_) {
        pw_loop_destroy_source(pw_thread_loop_get_loop(loop_), level_timer_);
        level_timer_ = nullptr;
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_buf_.write(data, size);

        auto* samples = reinterpret_cast<const int16_t*>(data);
        int peak = 0;
        for (size_t i = 0; i < size / sizeof(int16_t); ++i) {
            peak = std::max(peak, std::abs(static_cast<int>(samples[i])));
        }
        float level = std::min(1.0f, static_cast<float>(peak) / 32768.0f);
        float prev = self->peak_.load(std::memory_order_relaxed);
        while (level > prev &&
               !self->peak_.compare_exchange_weak(prev, level, std::memory_order_relaxed)) {
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}

void PipeWireCapture::on_level_timer(void* userdata, uint64_t /*expirations*/) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!self->capturing_.load(std::memory_order_relaxed)) return;

    float level = self->peak_.exchange(0.0f, std::memory_order_relaxed);

    std::lock_guard lock(self->level_mutex_);
    if (self->level_handler_) {
        self->level_handler_(level);
    }
}
